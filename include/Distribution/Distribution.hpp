#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef DISTILLRL_DISTRIBUTION_HPP
#define DISTILLRL_DISTRIBUTION_HPP

#include<vector>
#include<torch/torch.h>

namespace DistillRL
{
    /**
     * @class Distribution
     * @brief Interface of the action distributions built on top of network outputs.
     *
     * Shapes follow the usual batch/event convention: a sample of shape S has shape
     * S + batch_shape + event_shape.
    */
    class Distribution
    {
    protected:
        std::vector<int64_t> batch_shape;
        std::vector<int64_t> event_shape;

        /**
         * @brief sampleShape + batch_shape + event_shape.
        */
        std::vector<int64_t> extendedShape(c10::ArrayRef<int64_t> sampleShape) const;
    public:
        virtual ~Distribution() = default;

        virtual torch::Tensor entropy() const = 0;

        virtual torch::Tensor logProbability(const torch::Tensor &value) const = 0;

        /**
         * @brief Draws samples without tracking gradients.
        */
        virtual torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) const = 0;

        virtual torch::Tensor mean() const = 0;

        virtual torch::Tensor stddev() const = 0;

        inline const std::vector<int64_t> &batchShape() const
        {
            return batch_shape;
        }
    };
}

#endif //DISTILLRL_DISTRIBUTION_HPP
