//
// Created by moinshaikh on 3/3/26.
//

#ifndef DISTILLRL_MLP_HPP
#define DISTILLRL_MLP_HPP

#include<string>
#include<vector>

#include<torch/nn.h>

namespace DistillRL
{
    /**
     * @brief Builds an activation layer from its configuration name.
     *
     * Accepted names: "elu", "selu", "relu", "lrelu", "tanh", "sigmoid", "softplus",
     * "gelu", "silu" (or "swish"), "mish", "identity".
     *
     * @throws ConfigurationError for any other name.
     */
    torch::nn::AnyModule makeActivation(const std::string &name);

    /**
     * @brief Feed-forward approximator used for both the student and the teacher.
     *
     * Layout: Linear, activation, Linear, activation, ..., Linear. Each hidden dimension adds
     * one Linear + activation pair; the last Linear maps to @p numOutputs without activation.
     * Parameters are therefore named "<index>.weight" / "<index>.bias" with even indices,
     * the same layout an actor network of an actor-critic run has.
     *
     * @param numInputs Width of the (normalized) observation vector
     * @param numOutputs Width of the output, the action dimensionality
     * @param hiddenDims Hidden layer widths; -1 stands for numInputs
     * @param activation Name passed to makeActivation()
     */
    torch::nn::Sequential buildMlp(int64_t numInputs,
                                   int64_t numOutputs,
                                   const std::vector<int64_t> &hiddenDims,
                                   const std::string &activation);
}

#endif //DISTILLRL_MLP_HPP
