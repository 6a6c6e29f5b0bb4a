#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef DISTILLRL_OBSERVATIONNORMALIZER_HPP
#define DISTILLRL_OBSERVATIONNORMALIZER_HPP

#include<torch/torch.h>
#include<torch/nn.h>
#include<vector>

#include"RunningMeanStd.hpp"

namespace DistillRL
{
    /**
     * @brief Behaviour of a normalization slot, fixed at construction.
     */
    enum class NormalizationKind
    {
        Identity, ///< Passes inputs through unchanged, holds no state
        Running   ///< Standardizes inputs with running statistics
    };

    /**
     * @class ObservationNormalizerImpl
     * @brief Per-role observation normalization slot.
     *
     * An Identity slot is an empty module: it contributes no keys to a state dictionary and
     * normalize() returns its input. A Running slot owns a clip buffer and an "rms"
     * RunningMeanStd child, so its keys are "clip", "rms.count", "rms.mean", "rms.variance".
     *
     * normalize() never changes the statistics; only update() does.
     */
    class ObservationNormalizerImpl : public torch::nn::Module
    {
    private:
        NormalizationKind kind;
        torch::Tensor clip;
        RunningMeanStd rms;
    public:
        /**
         * @brief Identity slot.
         */
        ObservationNormalizerImpl();

        /**
         * @brief Running slot over @p size features, zero mean and unit variance.
         *
         * @param clip Normalized values are clipped to [-clip, clip]
         */
        explicit ObservationNormalizerImpl(int64_t size, float clip = 10.0);

        /**
         * @brief Running slot starting from known statistics.
         */
        ObservationNormalizerImpl(const std::vector<float> &means, const std::vector<float> &variances,
                                  float clip = 10.0);

        /**
         * @brief (x - mean) / sqrt(variance + 1e-8), clipped; identity for an Identity slot.
         */
        torch::Tensor normalize(const torch::Tensor &observations) const;

        /**
         * @brief Folds a batch of raw observations into the statistics. No-op for an Identity slot.
         */
        void update(const torch::Tensor &observations);

        /**
         * @brief Current statistics. Reading them from an Identity slot is an error.
         */
        std::vector<float> getMean() const;
        std::vector<float> getVariances() const;

        inline NormalizationKind getKind() const
        {
            return kind;
        }

        inline bool isRunning() const
        {
            return kind == NormalizationKind::Running;
        }

        float getClipValue() const;
        double getStepCount() const;
    };
    TORCH_MODULE(ObservationNormalizer);

    /**
     * @brief Running slot when @p enabled, Identity slot otherwise.
     */
    ObservationNormalizer makeObservationNormalizer(bool enabled, int64_t size, float clip = 10.0);
}

#endif //DISTILLRL_OBSERVATIONNORMALIZER_HPP
