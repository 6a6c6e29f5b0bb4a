//
// Created by moinshaikh on 2/4/26.
//

#include<doctest/doctest.h>

#include"../include/RunningMeanStd.hpp"

namespace DistillRL
{
    /**
     * @details The count starts at 1e-4 instead of 0 so the first merge never divides by zero
     * and the initial unit variance is almost entirely replaced by the first batch.
     */
    RunningMeanStdImpl::RunningMeanStdImpl(int64_t size)
    : count(register_buffer("count", torch::full({1}, 1e-4, torch::kFloat))),
      mean(register_buffer("mean", torch::zeros({size}))),
      variance(register_buffer("variance", torch::ones({size}))) {}

    RunningMeanStdImpl::RunningMeanStdImpl(const std::vector<float> &means, const std::vector<float> &variances)
    : count(register_buffer("count", torch::full({1}, 1e-4, torch::kFloat))),
      mean(register_buffer("mean", torch::tensor(means, torch::kFloat))),
      variance(register_buffer("variance", torch::tensor(variances, torch::kFloat)))
    {
        TORCH_CHECK(means.size() == variances.size(),
                    "RunningMeanStd needs as many variances as means, got ", variances.size(), " and ", means.size());
    }

    void RunningMeanStdImpl::update(torch::Tensor observations)
    {
        torch::NoGradGuard noGrad;
        observations = observations.reshape({-1, mean.size(0)}).to(mean.dtype());
        auto batchMean = observations.mean(0);
        auto batchVariance = observations.var(0, false, false);
        updateFromMoments(batchMean, batchVariance, observations.size(0));
    }

    /**
     * @details Chan et al. parallel combination of two sets of moments:
     *
     *   delta    = mean_b - mean_a
     *   n        = n_a + n_b
     *   mean     = mean_a + delta * n_b / n
     *   variance = (var_a * n_a + var_b * n_b + delta^2 * n_a * n_b / n) / n
     */
    void RunningMeanStdImpl::updateFromMoments(const torch::Tensor &batchMean,
                                               const torch::Tensor &batchVariance,
                                               int64_t batchCount)
    {
        auto delta = batchMean - mean;
        auto totalCount = count + static_cast<double>(batchCount);

        auto newMean = mean + delta * static_cast<double>(batchCount) / totalCount;
        auto m2 = variance * count + batchVariance * static_cast<double>(batchCount) +
                  delta.pow(2) * count * static_cast<double>(batchCount) / totalCount;

        mean.copy_(newMean);
        variance.copy_(m2 / totalCount);
        count.copy_(totalCount);
    }

    TEST_CASE("RunningMeanStd")
    {
        SUBCASE("Tracks the mean and variance of single rows")
        {
            RunningMeanStd rms(4);
            auto observations = torch::rand({3, 4});
            for (int64_t row = 0; row < 3; ++row)
            {
                rms->update(observations[row]);
            }

            auto expectedMean = observations.mean(0);
            auto expectedVariance = observations.var(0, false, false);
            auto mean = rms->getMean();
            auto variance = rms->getVariance();
            for (int64_t i = 0; i < 4; ++i)
            {
                CHECK(mean[i].item<float>() == doctest::Approx(expectedMean[i].item<float>()).epsilon(0.001));
                CHECK(variance[i].item<float>() == doctest::Approx(expectedVariance[i].item<float>()).epsilon(0.001));
            }
            CHECK(rms->getCount() == doctest::Approx(3.0).epsilon(0.001));
        }

        SUBCASE("A batch update equals the row-by-row updates")
        {
            RunningMeanStd batched(3);
            RunningMeanStd rowwise(3);
            auto observations = torch::randn({8, 3});
            batched->update(observations);
            for (int64_t row = 0; row < 8; ++row)
            {
                rowwise->update(observations[row]);
            }
            CHECK(torch::allclose(batched->getMean(), rowwise->getMean(), 1e-4, 1e-5));
            CHECK(torch::allclose(batched->getVariance(), rowwise->getVariance(), 1e-4, 1e-5));
        }

        SUBCASE("Starts from supplied statistics")
        {
            RunningMeanStd rms(std::vector<float>{1, 2, 3}, std::vector<float>{4, 5, 6});
            auto mean = rms->getMean();
            auto variance = rms->getVariance();
            CHECK(rms->size() == 3);
            CHECK(mean[0].item<float>() == doctest::Approx(1));
            CHECK(mean[2].item<float>() == doctest::Approx(3));
            CHECK(variance[1].item<float>() == doctest::Approx(5));
        }

        SUBCASE("Statistics are buffers, not parameters")
        {
            RunningMeanStd rms(2);
            CHECK(rms->parameters().empty());
            auto buffers = rms->named_buffers();
            CHECK(buffers.contains("count"));
            CHECK(buffers.contains("mean"));
            CHECK(buffers.contains("variance"));
        }
    }
}
