//
// Created by moinshaikh on 3/5/26.
//

#ifndef DISTILLRL_GAUSSIANACTIONHEAD_HPP
#define DISTILLRL_GAUSSIANACTIONHEAD_HPP

#include<memory>
#include<string>

#include<torch/torch.h>

#include"../Distribution/Normal.hpp"

namespace DistillRL
{
    /**
     * @brief How the learnable action noise is stored.
     */
    enum class NoiseStdType
    {
        Scalar, ///< Standard deviations used as-is, no positivity floor
        Log     ///< Log standard deviations, exponentiated on use
    };

    /**
     * @brief Parses "scalar" or "log".
     *
     * @throws ConfigurationError for anything else.
     */
    NoiseStdType parseNoiseStdType(const std::string &name);

    std::string toString(NoiseStdType type);

    /**
     * @class GaussianActionHead
     * @brief Diagonal Gaussian over the student's mean output with state-independent noise.
     *
     * The head does not own the noise parameter; the policy module registers it (as "std" or
     * "log_std") and hands the same tensor over here. The distribution built by update()
     * is kept until the next update() and backs the read accessors.
     */
    class GaussianActionHead
    {
    private:
        NoiseStdType noiseStdType;
        torch::Tensor noiseParameter;
        bool validateArgs;
        std::unique_ptr<Normal> distribution;

        const Normal &current() const;
    public:
        /**
         * @param noiseStdType Interpretation of @p noiseParameter
         * @param noiseParameter Per-action noise vector, shape (numActions)
         * @param validateArgs Forwarded to every Normal this head builds
         */
        GaussianActionHead(NoiseStdType noiseStdType, torch::Tensor noiseParameter, bool validateArgs);

        /**
         * @brief Initial value of the noise parameter for a given standard deviation.
         *
         * Scalar: initStd everywhere. Log: log(initStd) everywhere.
         */
        static torch::Tensor initialNoise(NoiseStdType type, int64_t numActions, float initStd);

        /**
         * @brief Noise parameter as standard deviations, broadcast to the shape of @p mean.
         */
        torch::Tensor standardDeviation(const torch::Tensor &mean) const;

        /**
         * @brief Rebuilds the stored distribution around @p mean.
         *
         * @throws std::invalid_argument if validation is enabled and the scale is not
         *         positive or the mean is not finite.
         */
        void update(const torch::Tensor &mean);

        /**
         * @brief One reparameterized draw per batch row, without gradient tracking.
         */
        torch::Tensor sample() const;

        inline bool hasDistribution() const
        {
            return distribution != nullptr;
        }

        /// @throws std::logic_error before the first update()
        torch::Tensor actionMean() const;

        /// @throws std::logic_error before the first update()
        torch::Tensor actionStd() const;

        /**
         * @brief Entropy of each row's Gaussian, summed over action dimensions.
         *
         * @throws std::logic_error before the first update()
         */
        torch::Tensor entropy() const;

        /**
         * @brief Log probability of @p actions, summed over action dimensions.
         *
         * @throws std::logic_error before the first update()
         */
        torch::Tensor logProbability(const torch::Tensor &actions) const;

        inline NoiseStdType getNoiseStdType() const
        {
            return noiseStdType;
        }
    };
}

#endif //DISTILLRL_GAUSSIANACTIONHEAD_HPP
