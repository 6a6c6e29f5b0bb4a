//
// Created by moinshaikh on 3/5/26.
//

#include<cmath>
#include<stdexcept>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/GaussianActionHead.hpp"
#include"../../include/Errors.hpp"

namespace DistillRL
{
    NoiseStdType parseNoiseStdType(const std::string &name)
    {
        if (name == "scalar")
        {
            return NoiseStdType::Scalar;
        }
        if (name == "log")
        {
            return NoiseStdType::Log;
        }
        throw ConfigurationError("Unknown standard deviation type: " + name + ". Should be 'scalar' or 'log'");
    }

    std::string toString(NoiseStdType type)
    {
        return type == NoiseStdType::Scalar ? "scalar" : "log";
    }

    GaussianActionHead::GaussianActionHead(NoiseStdType noiseStdType, torch::Tensor noiseParameter, bool validateArgs)
    : noiseStdType(noiseStdType),
      noiseParameter(std::move(noiseParameter)),
      validateArgs(validateArgs) {}

    torch::Tensor GaussianActionHead::initialNoise(NoiseStdType type, int64_t numActions, float initStd)
    {
        auto deviation = initStd * torch::ones({numActions});
        if (type == NoiseStdType::Log)
        {
            return torch::log(deviation);
        }
        return deviation;
    }

    torch::Tensor GaussianActionHead::standardDeviation(const torch::Tensor &mean) const
    {
        if (noiseStdType == NoiseStdType::Log)
        {
            return torch::exp(noiseParameter).expand_as(mean);
        }
        return noiseParameter.expand_as(mean);
    }

    void GaussianActionHead::update(const torch::Tensor &mean)
    {
        distribution = std::make_unique<Normal>(mean, standardDeviation(mean), validateArgs);
    }

    const Normal &GaussianActionHead::current() const
    {
        if (!distribution)
        {
            throw std::logic_error("The action distribution is not available before the first update");
        }
        return *distribution;
    }

    torch::Tensor GaussianActionHead::sample() const
    {
        return current().sample();
    }

    torch::Tensor GaussianActionHead::actionMean() const
    {
        return current().mean();
    }

    torch::Tensor GaussianActionHead::actionStd() const
    {
        return current().stddev();
    }

    torch::Tensor GaussianActionHead::entropy() const
    {
        return current().entropy();
    }

    torch::Tensor GaussianActionHead::logProbability(const torch::Tensor &actions) const
    {
        return current().logProbability(actions).sum(-1);
    }

    TEST_CASE("GaussianActionHead")
    {
        auto mean = torch::tensor({0.f, 1.f, -1.f, 2.f, 0.5f, 0.f}).reshape({2, 3});

        SUBCASE("Noise type names")
        {
            CHECK(parseNoiseStdType("scalar") == NoiseStdType::Scalar);
            CHECK(parseNoiseStdType("log") == NoiseStdType::Log);
            CHECK_THROWS_AS(parseNoiseStdType("softplus"), ConfigurationError);
        }

        SUBCASE("Accessors require a distribution")
        {
            GaussianActionHead head(NoiseStdType::Scalar, torch::ones({3}), false);
            CHECK_FALSE(head.hasDistribution());
            CHECK_THROWS_AS(head.actionMean(), std::logic_error);
            CHECK_THROWS_AS(head.actionStd(), std::logic_error);
            CHECK_THROWS_AS(head.entropy(), std::logic_error);
            CHECK_THROWS_AS(head.sample(), std::logic_error);
        }

        SUBCASE("Scalar and log parameterizations give the same deviation")
        {
            GaussianActionHead scalar(NoiseStdType::Scalar,
                                      GaussianActionHead::initialNoise(NoiseStdType::Scalar, 3, 0.4f), false);
            GaussianActionHead logScale(NoiseStdType::Log,
                                        GaussianActionHead::initialNoise(NoiseStdType::Log, 3, 0.4f), false);
            scalar.update(mean);
            logScale.update(mean);

            CHECK(torch::allclose(scalar.actionStd(), logScale.actionStd(), 1e-5, 1e-6));
            CHECK(scalar.actionStd().sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(torch::equal(scalar.actionMean(), mean));
        }

        SUBCASE("Log parameterization is positive for any value")
        {
            GaussianActionHead head(NoiseStdType::Log, torch::tensor({-30.f, 0.f, 30.f}), true);
            CHECK_NOTHROW(head.update(mean));
            CHECK((head.actionStd() > 0).all().item<bool>());
        }

        SUBCASE("Entropy matches the closed form")
        {
            GaussianActionHead head(NoiseStdType::Scalar, torch::tensor({0.5f, 1.f, 2.f}), false);
            head.update(mean);
            double expected = 0;
            for (double s : {0.5, 1.0, 2.0})
            {
                expected += 0.5 * std::log(2 * M_PI * M_E * s * s);
            }
            auto entropy = head.entropy();
            CHECK(entropy.sizes().vec() == std::vector<int64_t>{2});
            CHECK(entropy[0].item<double>() == doctest::Approx(expected).epsilon(1e-5));
            CHECK(entropy[1].item<double>() == doctest::Approx(expected).epsilon(1e-5));
        }

        SUBCASE("Gradients reach the noise parameter")
        {
            auto noise = torch::full({3}, 0.5, torch::requires_grad());
            GaussianActionHead head(NoiseStdType::Scalar, noise, false);
            head.update(mean);
            head.entropy().sum().backward();
            CHECK(noise.grad().defined());
        }

        SUBCASE("Validation rejects a non-positive scalar deviation")
        {
            GaussianActionHead checked(NoiseStdType::Scalar, torch::tensor({0.5f, 0.f, 1.f}), true);
            CHECK_THROWS_AS(checked.update(mean), std::invalid_argument);

            GaussianActionHead unchecked(NoiseStdType::Scalar, torch::tensor({0.5f, -1.f, 1.f}), false);
            CHECK_NOTHROW(unchecked.update(mean));
            CHECK(std::isnan(unchecked.entropy()[0].item<double>()));
        }
    }
}
