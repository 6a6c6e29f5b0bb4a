#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef DISTILLRL_RUNNINGMEANSTD_HPP
#define DISTILLRL_RUNNINGMEANSTD_HPP

#include<torch/torch.h>
#include<torch/nn.h>
#include<vector>


namespace DistillRL
{
    /**
     * @brief Running mean and variance of a stream of observation batches.
     *
     * Statistics are kept as buffers ("count", "mean", "variance") so they travel with the
     * module's state dictionary and are restored by a checkpoint load.
    */
    class RunningMeanStdImpl : public torch::nn::Module
    {
    private:
        torch::Tensor count;
        torch::Tensor mean;
        torch::Tensor variance;

        /**
         * @brief Merges the moments of one batch into the running moments.
         *
         * @param batchMean Per-feature mean of the batch
         * @param batchVariance Per-feature population variance of the batch
         * @param batchCount Number of rows in the batch
         */
        void updateFromMoments(const torch::Tensor &batchMean, const torch::Tensor &batchVariance, int64_t batchCount);
    public:
        /**
         * @brief Zero mean, unit variance, near-zero count for @p size features.
         */
        explicit RunningMeanStdImpl(int64_t size);

        /**
         * @brief Starts from known statistics, e.g. inherited from another run.
         */
        RunningMeanStdImpl(const std::vector<float> &means, const std::vector<float> &variances);

        /**
         * @brief Folds a batch into the statistics.
         *
         * @param observations Any tensor whose trailing size is the feature count; it is
         *                     flattened to (rows, features) first.
         */
        void update(torch::Tensor observations);

        inline double getCount() const
        {
            return count.item<double>();
        }

        inline torch::Tensor getMean() const
        {
            return mean.clone();
        }

        inline torch::Tensor getVariance() const
        {
            return variance.clone();
        }

        inline int64_t size() const
        {
            return mean.size(0);
        }
    };
    TORCH_MODULE(RunningMeanStd);
}
#endif //DISTILLRL_RUNNINGMEANSTD_HPP
