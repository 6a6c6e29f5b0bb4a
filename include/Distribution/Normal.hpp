#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef DISTILLRL_NORMAL_HPP
#define DISTILLRL_NORMAL_HPP

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"



namespace DistillRL
{
    /**
     * @class Normal
     * @brief Element-wise independent Gaussians, i.e. a diagonal-covariance normal.
     *
     * Argument validation is a per-instance choice. Without it a non-positive scale or a
     * non-finite mean is accepted and simply yields NaN/inf samples, log probabilities and
     * entropies. The policy hot path leaves it off; tests turn it on.
    */
    class Normal : public Distribution
    {
    private:
        torch::Tensor loc;
        torch::Tensor scale;
    public:
        /**
         * @param loc Mean, broadcast against @p scale.
         * @param scale Standard deviation, must be positive.
         * @param validateArgs Check @p scale > 0 and a finite @p loc.
         *
         * @throws std::invalid_argument on invalid arguments when @p validateArgs is set.
        */
        Normal(const torch::Tensor &loc, const torch::Tensor &scale, bool validateArgs = false);

        /**
         * @brief 0.5 * log(2 * pi * e * scale^2), summed over the last dimension.
         *
         * For a (batch, actions) distribution this is the entropy of each row's
         * diagonal Gaussian, shape (batch).
        */
        torch::Tensor entropy() const override;

        /**
         * @brief Element-wise log density, same shape as the broadcast of @p value and loc.
          */
        torch::Tensor logProbability(const torch::Tensor &value) const override;

        /**
         * @brief rsample() with gradient tracking disabled.
         */
        torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) const override;

        /**
         * @brief Reparameterized sample loc + scale * eps, eps ~ N(0, 1).
         */
        torch::Tensor rsample(c10::ArrayRef<int64_t> sampleShape = {}) const;

        inline torch::Tensor mean() const override
        {
            return loc;
        }

        inline torch::Tensor stddev() const override
        {
            return scale;
        }
    };
}

#endif //DISTILLRL_NORMAL_HPP
