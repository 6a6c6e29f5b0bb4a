//
// Created by moinshaikh on 2/4/26.
//

#include<doctest/doctest.h>

#include"../include/ObservationNormalizer.hpp"
#include"../include/RunningMeanStd.hpp"

namespace DistillRL
{
    ObservationNormalizerImpl::ObservationNormalizerImpl()
    : kind(NormalizationKind::Identity),
      rms(nullptr) {}

    ObservationNormalizerImpl::ObservationNormalizerImpl(int64_t size, float clip)
    : kind(NormalizationKind::Running),
      clip(register_buffer("clip", torch::full({1}, clip, torch::kFloat))),
      rms(register_module("rms", RunningMeanStd(size))) {}

    ObservationNormalizerImpl::ObservationNormalizerImpl(const std::vector<float> &means,
                                                         const std::vector<float> &variances,
                                                         float clip)
    : kind(NormalizationKind::Running),
      clip(register_buffer("clip", torch::full({1}, clip, torch::kFloat))),
      rms(register_module("rms", RunningMeanStd(means, variances))) {}

    torch::Tensor ObservationNormalizerImpl::normalize(const torch::Tensor &observations) const
    {
        if (!isRunning())
        {
            return observations;
        }
        auto normalized = (observations - rms->getMean()) / torch::sqrt(rms->getVariance() + 1e-8);
        auto bound = clip.item<float>();
        return torch::clamp(normalized, -bound, bound);
    }

    void ObservationNormalizerImpl::update(const torch::Tensor &observations)
    {
        if (isRunning())
        {
            rms->update(observations);
        }
    }

    std::vector<float> ObservationNormalizerImpl::getMean() const
    {
        TORCH_CHECK(isRunning(), "An identity observation normalizer has no statistics");
        auto mean = rms->getMean().contiguous();
        return std::vector<float>(mean.data_ptr<float>(), mean.data_ptr<float>() + mean.numel());
    }

    std::vector<float> ObservationNormalizerImpl::getVariances() const
    {
        TORCH_CHECK(isRunning(), "An identity observation normalizer has no statistics");
        auto variance = rms->getVariance().contiguous();
        return std::vector<float>(variance.data_ptr<float>(), variance.data_ptr<float>() + variance.numel());
    }

    float ObservationNormalizerImpl::getClipValue() const
    {
        TORCH_CHECK(isRunning(), "An identity observation normalizer has no clip value");
        return clip.item<float>();
    }

    double ObservationNormalizerImpl::getStepCount() const
    {
        TORCH_CHECK(isRunning(), "An identity observation normalizer has no step count");
        return rms->getCount();
    }

    ObservationNormalizer makeObservationNormalizer(bool enabled, int64_t size, float clip)
    {
        if (enabled)
        {
            return ObservationNormalizer(size, clip);
        }
        return ObservationNormalizer();
    }

    TEST_CASE("ObservationNormalizer")
    {
        SUBCASE("Identity slot passes inputs through and holds no state")
        {
            auto normalizer = makeObservationNormalizer(false, 4);
            auto observations = torch::randn({3, 4}) * 50;
            normalizer->update(observations);

            CHECK(normalizer->getKind() == NormalizationKind::Identity);
            CHECK(torch::equal(normalizer->normalize(observations), observations));
            CHECK(normalizer->named_buffers().is_empty());
            CHECK(normalizer->named_parameters().is_empty());
        }

        SUBCASE("Clips normalized values")
        {
            ObservationNormalizer normalizer(7, 1);
            auto observations = torch::tensor({-1000.f, -100.f, -10.f, 0.f, 10.f, 100.f, 1000.f}).unsqueeze(0);
            auto normalized = normalizer->normalize(observations);

            CHECK_FALSE((normalized > 1).any().item<bool>());
            CHECK_FALSE((normalized < -1).any().item<bool>());
        }

        SUBCASE("Standardizes with the running statistics")
        {
            ObservationNormalizer normalizer(2);
            normalizer->update(torch::tensor({0.f, 0.f, 2.f, 4.f}).reshape({2, 2}));

            auto mean = normalizer->getMean();
            auto variance = normalizer->getVariances();
            CHECK(mean[0] == doctest::Approx(1.0).epsilon(1e-3));
            CHECK(mean[1] == doctest::Approx(2.0).epsilon(1e-3));
            CHECK(variance[0] == doctest::Approx(1.0).epsilon(1e-3));
            CHECK(variance[1] == doctest::Approx(4.0).epsilon(1e-3));

            auto normalized = normalizer->normalize(torch::tensor({2.f, 4.f}).unsqueeze(0));
            CHECK(normalized[0][0].item<float>() == doctest::Approx(1.0).epsilon(1e-3));
            CHECK(normalized[0][1].item<float>() == doctest::Approx(1.0).epsilon(1e-3));
        }

        SUBCASE("normalize() leaves the statistics untouched")
        {
            ObservationNormalizer normalizer(3);
            normalizer->update(torch::randn({16, 3}));
            auto meanBefore = normalizer->getMean();
            auto countBefore = normalizer->getStepCount();

            normalizer->normalize(torch::randn({16, 3}) + 5);

            CHECK(normalizer->getMean() == meanBefore);
            CHECK(normalizer->getStepCount() == countBefore);
        }

        SUBCASE("Starts from supplied statistics")
        {
            ObservationNormalizer normalizer(std::vector<float>({1, 2, 3}), std::vector<float>({4, 5, 6}));
            auto mean = normalizer->getMean();
            auto variance = normalizer->getVariances();
            CHECK(mean[1] == doctest::Approx(2));
            CHECK(variance[2] == doctest::Approx(6));
            CHECK(normalizer->getClipValue() == doctest::Approx(10));
        }

        SUBCASE("Running slot exposes its statistics under stable keys")
        {
            ObservationNormalizer normalizer(3);
            auto buffers = normalizer->named_buffers();
            CHECK(buffers.size() == 4);
            CHECK(buffers.contains("clip"));
            CHECK(buffers.contains("rms.count"));
            CHECK(buffers.contains("rms.mean"));
            CHECK(buffers.contains("rms.variance"));
        }
    }
}
