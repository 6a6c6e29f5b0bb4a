//
// Created by moinshaikh on 2/1/26.
//
#include<cmath>
#include<limits>
#include<stdexcept>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/Normal.hpp"

namespace DistillRL
{
    namespace
    {
        const double halfLogTwoPi = 0.5 * std::log(2 * M_PI);
    }

    Normal::Normal(const torch::Tensor &loc, const torch::Tensor &scale, bool validateArgs)
    {
        auto broadcasted = torch::broadcast_tensors({loc, scale});
        this->loc = broadcasted[0];
        this->scale = broadcasted[1];
        this->batch_shape = this->loc.sizes().vec();
        this->event_shape = {};

        if (validateArgs)
        {
            torch::NoGradGuard noGrad;
            if (!(this->scale > 0).all().item<bool>())
            {
                throw std::invalid_argument("Normal: scale must be strictly positive");
            }
            if (!torch::isfinite(this->loc).all().item<bool>())
            {
                throw std::invalid_argument("Normal: loc must be finite");
            }
        }
    }

    torch::Tensor Normal::entropy() const
    {
        return (0.5 + halfLogTwoPi + torch::log(scale)).sum(-1);
    }

    /**
     * @details log p(x) = -(x - mu)^2 / (2 sigma^2) - log(sigma) - 0.5 log(2 pi)
     */
    torch::Tensor Normal::logProbability(const torch::Tensor &value) const
    {
        auto variance = scale.pow(2);
        return -(value - loc).pow(2) / (2 * variance) - scale.log() - halfLogTwoPi;
    }

    torch::Tensor Normal::rsample(c10::ArrayRef<int64_t> sampleShape) const
    {
        auto shape = extendedShape(sampleShape);
        auto eps = torch::randn(shape, loc.options());
        return loc.expand(shape) + eps * scale.expand(shape);
    }

    torch::Tensor Normal::sample(c10::ArrayRef<int64_t> sampleShape) const
    {
        torch::NoGradGuard noGrad;
        return rsample(sampleShape);
    }

    TEST_CASE("Normal")
    {
        auto locs = torch::arange(6, torch::kFloat).reshape({2, 3});
        auto scales = torch::tensor({1.f, 2.f, 3.f, 0.5f, 0.5f, 0.f}).reshape({2, 3});
        Normal dist(locs, scales);

        SUBCASE("Sampled tensors have the extended shape")
        {
            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(dist.sample({20}).sizes().vec() == std::vector<int64_t>{20, 2, 3});
            CHECK(dist.rsample({4, 5}).sizes().vec() == std::vector<int64_t>{4, 5, 2, 3});
        }

        SUBCASE("entropy() is the closed form summed over the last dimension")
        {
            auto entropies = dist.entropy();
            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});

            double expected = 0;
            for (double s : {1.0, 2.0, 3.0})
            {
                expected += 0.5 * std::log(2 * M_PI * M_E * s * s);
            }
            CHECK(entropies[0].item<double>() == doctest::Approx(expected).epsilon(1e-5));
            CHECK(entropies[1].item<double>() == -std::numeric_limits<double>::infinity());
        }

        SUBCASE("logProbability() matches the Gaussian density")
        {
            auto logProbs = dist.logProbability(torch::zeros({2, 3}));
            CHECK(logProbs.sizes().vec() == std::vector<int64_t>{2, 3});
            // x = 0, mu = 2, sigma = 3
            double expected = -4.0 / 18.0 - std::log(3.0) - 0.5 * std::log(2 * M_PI);
            CHECK(logProbs[0][2].item<double>() == doctest::Approx(expected).epsilon(1e-5));
        }

        SUBCASE("Samples concentrate around the mean")
        {
            Normal narrow(torch::full({4}, 3.0), torch::full({4}, 0.1));
            auto samples = narrow.sample({20000});
            CHECK(samples.mean().item<double>() == doctest::Approx(3.0).epsilon(1e-2));
            CHECK(samples.std().item<double>() == doctest::Approx(0.1).epsilon(5e-2));
        }

        SUBCASE("rsample() is differentiable with respect to the parameters")
        {
            auto mu = torch::zeros({3}, torch::requires_grad());
            auto sigma = torch::ones({3}, torch::requires_grad());
            Normal reparameterized(mu, sigma);
            reparameterized.rsample().sum().backward();
            CHECK(mu.grad().defined());
            CHECK(sigma.grad().defined());
            CHECK_FALSE(dist.sample().requires_grad());
        }

        SUBCASE("Argument validation is opt-in")
        {
            CHECK_THROWS_AS(Normal(locs, scales, true), std::invalid_argument);
            CHECK_THROWS_AS(Normal(torch::full({2}, NAN), torch::ones({2}), true), std::invalid_argument);
            CHECK_NOTHROW(Normal(locs, scales, false));
            CHECK_NOTHROW(Normal(locs, scales.abs() + 1, true));
        }
    }
}
