//
// Created by moinshaikh on 3/5/26.
//

#ifndef DISTILLRL_STUDENTTEACHER_HPP
#define DISTILLRL_STUDENTTEACHER_HPP

#include<memory>
#include<vector>

#include<torch/torch.h>
#include<torch/nn.h>

#include"GaussianActionHead.hpp"
#include"../Config.hpp"
#include"../ObservationRouter.hpp"
#include"../ObservationNormalizer.hpp"
#include"../Checkpoint/StateDict.hpp"
#include"../Checkpoint/CheckpointReconciler.hpp"

namespace DistillRL
{
    /**
     * @class StudentTeacherImpl
     * @brief Student policy distilled from a frozen teacher policy.
     *
     * The student is a small feed-forward network with a Gaussian action head used for
     * exploration during rollouts. The teacher is a (usually larger) feed-forward network
     * whose deterministic output is the regression target of the distillation loss. Each
     * network reads its own ordered list of observation groups and has its own
     * normalization slot.
     *
     * Only the student ever learns. The teacher network and its normalizer stay in
     * evaluation mode whatever train() is called with, evaluate() runs without gradient
     * tracking, and teacher weights only change through loadStateDict().
     *
     * State dictionary layout:
     * - "student.<i>.weight|bias", "teacher.<i>.weight|bias"
     * - "student_obs_normalizer.*", "teacher_obs_normalizer.*" (running slots only)
     * - "std" (scalar noise) or "log_std" (log noise)
     *
     * The module holds no temporal state; isRecurrent is false and the hidden state
     * methods exist only so recurrent and feed-forward policies share a call surface.
     */
    class StudentTeacherImpl : public torch::nn::Module
    {
    private:
        StudentTeacherConfig config;
        ObservationRouter router;
        NoiseStdType noiseType;

        torch::nn::Sequential student{nullptr};
        ObservationNormalizer studentObsNormalizer{nullptr};
        torch::nn::Sequential teacher{nullptr};
        ObservationNormalizer teacherObsNormalizer{nullptr};
        torch::Tensor noiseParameter;

        std::unique_ptr<GaussianActionHead> actionHead;

        bool teacherLoaded;
        CheckpointState checkpointState;

        void freezeTeacher();
    public:
        static constexpr bool isRecurrent = false;

        /**
         * @brief Builds both networks, both normalization slots and the action noise.
         *
         * @param shapeProbe One (batch, features) tensor per observation group; only the
         *                   feature widths are read.
         * @param groups Ordered groups feeding the student ("policy") and the teacher.
         * @param config Sizes, activation, noise and normalization settings. Entries of
         *               config.extraOptions are reported and ignored.
         *
         * @throws ConfigurationError if a listed group is missing from the probe or is not 2-D,
         *         the noise type is not "scalar"/"log", the activation is unknown, or
         *         numActions is not positive. Nothing is allocated in that case.
         */
        StudentTeacherImpl(const ObservationMap &shapeProbe,
                           const ObservationGroups &groups,
                           const StudentTeacherConfig &config);

        /**
         * @brief Samples one action per row from the student's Gaussian.
         *
         * Refreshes the stored distribution, so actionMean(), actionStd() and entropy()
         * describe this call afterwards.
         */
        torch::Tensor act(const ObservationMap &observations);

        /**
         * @brief Deterministic student output. Does not touch the stored distribution.
         */
        torch::Tensor actInference(const ObservationMap &observations);

        /**
         * @brief Teacher output for the teacher's observation groups, without gradient tracking.
         *
         * This is the regression target of the distillation loss.
         */
        torch::Tensor evaluate(const ObservationMap &observations);

        /**
         * @brief Rebuilds the action distribution from normalized student observations.
         */
        void updateDistribution(const torch::Tensor &studentObservations);

        /**
         * @brief Folds the student observations into the student normalizer.
         *
         * No-op when student normalization is disabled. The teacher normalizer is never
         * updated here. Not called implicitly by act().
         */
        void updateNormalization(const ObservationMap &observations);

        torch::Tensor actionMean() const;
        torch::Tensor actionStd() const;
        torch::Tensor entropy() const;

        /**
         * @brief Log probability of @p actions under the current distribution, summed over
         * action dimensions.
         */
        torch::Tensor getActionsLogProbability(const torch::Tensor &actions) const;

        void reset(const torch::Tensor &dones = {});
        torch::Tensor getHiddenStates() const;
        void detachHiddenStates(const torch::Tensor &dones = {});

        /**
         * @brief Switches the student side; the teacher side is put back into eval mode.
         */
        void train(bool on = true) override;

        /**
         * @brief Snapshot of every parameter and buffer, keyed by module path.
         */
        StateDict stateDict() const;

        /**
         * @brief Restores parameters from an actor-critic or a distillation checkpoint.
         *
         * Keys containing "actor" mark an actor-critic checkpoint: the actor network and its
         * observation normalizer are loaded into the teacher side and the student is left
         * as initialized. Otherwise keys containing "student" mark a distillation checkpoint,
         * which is loaded onto the whole module.
         *
         * @param strict Reject missing or unexpected keys.
         * @return true if training resumes a distillation run, false for a fresh
         *         distillation from an actor-critic teacher.
         * @throws CheckpointFormatError if neither kind of key is present.
         * @throws StateDictError on key or shape mismatch.
         *
         * The module is left unchanged when an exception is thrown.
         */
        bool loadStateDict(const StateDict &stateDict, bool strict = true);

        /**
         * @brief True once a checkpoint load has populated the teacher, by either path.
         */
        inline bool loadedTeacher() const
        {
            return teacherLoaded;
        }

        inline CheckpointState getCheckpointState() const
        {
            return checkpointState;
        }

        inline int64_t numStudentObs() const
        {
            return router.getNumStudentObs();
        }

        inline int64_t numTeacherObs() const
        {
            return router.getNumTeacherObs();
        }

        inline int64_t numActions() const
        {
            return config.numActions;
        }

        inline NoiseStdType noiseStdType() const
        {
            return noiseType;
        }

        inline const ObservationGroups &observationGroups() const
        {
            return router.getGroups();
        }

        inline torch::nn::Sequential getStudent() const
        {
            return student;
        }

        inline torch::nn::Sequential getTeacher() const
        {
            return teacher;
        }

        inline ObservationNormalizer getStudentObsNormalizer() const
        {
            return studentObsNormalizer;
        }

        inline ObservationNormalizer getTeacherObsNormalizer() const
        {
            return teacherObsNormalizer;
        }

        inline torch::Tensor getNoiseParameter() const
        {
            return noiseParameter;
        }
    };
    TORCH_MODULE(StudentTeacher);
}

#endif //DISTILLRL_STUDENTTEACHER_HPP
