//
// Created by moinshaikh on 3/3/26.
//

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/Mlp.hpp"
#include"../../include/Errors.hpp"

namespace DistillRL
{
    torch::nn::AnyModule makeActivation(const std::string &name)
    {
        if (name == "elu")
        {
            return torch::nn::AnyModule(torch::nn::ELU());
        }
        if (name == "selu")
        {
            return torch::nn::AnyModule(torch::nn::SELU());
        }
        if (name == "relu")
        {
            return torch::nn::AnyModule(torch::nn::ReLU());
        }
        if (name == "lrelu")
        {
            return torch::nn::AnyModule(torch::nn::LeakyReLU());
        }
        if (name == "tanh")
        {
            return torch::nn::AnyModule(torch::nn::Tanh());
        }
        if (name == "sigmoid")
        {
            return torch::nn::AnyModule(torch::nn::Sigmoid());
        }
        if (name == "softplus")
        {
            return torch::nn::AnyModule(torch::nn::Softplus());
        }
        if (name == "gelu")
        {
            return torch::nn::AnyModule(torch::nn::GELU());
        }
        if (name == "silu" || name == "swish")
        {
            return torch::nn::AnyModule(torch::nn::SiLU());
        }
        if (name == "mish")
        {
            return torch::nn::AnyModule(torch::nn::Mish());
        }
        if (name == "identity")
        {
            return torch::nn::AnyModule(torch::nn::Identity());
        }
        throw ConfigurationError("Unknown activation function: " + name);
    }

    torch::nn::Sequential buildMlp(int64_t numInputs,
                                   int64_t numOutputs,
                                   const std::vector<int64_t> &hiddenDims,
                                   const std::string &activation)
    {
        if (numInputs <= 0 || numOutputs <= 0)
        {
            throw ConfigurationError("MLP needs positive input and output sizes, got " +
                                     std::to_string(numInputs) + " and " + std::to_string(numOutputs));
        }

        torch::nn::Sequential layers;
        auto previous = numInputs;
        for (auto hidden : hiddenDims)
        {
            if (hidden == -1)
            {
                hidden = numInputs;
            }
            if (hidden <= 0)
            {
                throw ConfigurationError("Invalid hidden layer size: " + std::to_string(hidden));
            }
            layers->push_back(torch::nn::Linear(previous, hidden));
            layers->push_back(makeActivation(activation));
            previous = hidden;
        }
        layers->push_back(torch::nn::Linear(previous, numOutputs));
        return layers;
    }

    TEST_CASE("Mlp")
    {
        SUBCASE("Output has the requested width")
        {
            auto mlp = buildMlp(6, 3, {32, 16}, "elu");
            auto output = mlp->forward(torch::rand({5, 6}));
            CHECK(output.sizes().vec() == std::vector<int64_t>{5, 3});
        }

        SUBCASE("Linear layers sit at even indices")
        {
            auto mlp = buildMlp(4, 2, {8, 8, 8}, "tanh");
            auto parameters = mlp->named_parameters();
            CHECK(mlp->size() == 7);
            CHECK(parameters.size() == 8);
            for (const auto &key : {"0.weight", "0.bias", "2.weight", "4.weight", "6.weight", "6.bias"})
            {
                CHECK(parameters.contains(key));
            }
            CHECK(parameters["0.weight"].sizes().vec() == std::vector<int64_t>{8, 4});
            CHECK(parameters["6.weight"].sizes().vec() == std::vector<int64_t>{2, 8});
        }

        SUBCASE("-1 hidden size follows the input width")
        {
            auto mlp = buildMlp(5, 2, {-1}, "relu");
            CHECK(mlp->named_parameters()["0.weight"].sizes().vec() == std::vector<int64_t>{5, 5});
        }

        SUBCASE("No hidden layers gives a single linear map")
        {
            auto mlp = buildMlp(5, 2, {}, "relu");
            CHECK(mlp->size() == 1);
        }

        SUBCASE("Every named activation is accepted")
        {
            for (const auto &name : {"elu", "selu", "relu", "lrelu", "tanh", "sigmoid", "softplus",
                                     "gelu", "silu", "swish", "mish", "identity"})
            {
                CHECK_NOTHROW(makeActivation(name));
            }
        }

        SUBCASE("Invalid configuration is rejected")
        {
            CHECK_THROWS_AS(makeActivation("crelu"), ConfigurationError);
            CHECK_THROWS_AS(buildMlp(0, 2, {8}, "elu"), ConfigurationError);
            CHECK_THROWS_AS(buildMlp(4, 2, {0}, "elu"), ConfigurationError);
        }
    }
}
