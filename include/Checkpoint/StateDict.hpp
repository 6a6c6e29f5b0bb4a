#pragma once
//
// Created by moinshaikh on 3/4/26.
//

#ifndef DISTILLRL_STATEDICT_HPP
#define DISTILLRL_STATEDICT_HPP

#include<string>
#include<utility>
#include<vector>

#include<torch/torch.h>

namespace DistillRL
{
    /**
     * @brief Flat parameter/buffer name to tensor mapping, keys are dotted module paths.
     */
    using StateDict = torch::OrderedDict<std::string, torch::Tensor>;

    /**
     * @brief Validated set of copies that a state dictionary load will perform.
     *
     * Building a plan never writes to the module, so several plans can be checked before any
     * of them is applied. That is how a load stays all-or-nothing when it spans submodules.
     */
    struct StateDictLoadPlan
    {
        std::vector<std::pair<torch::Tensor, torch::Tensor>> copies; ///< (destination, source)
        std::vector<std::string> missingKeys;
        std::vector<std::string> unexpectedKeys;
    };

    /**
     * @brief All parameters followed by all buffers of @p module, recursively.
     *
     * The tensors are detached copies, so later training does not alter the snapshot.
     */
    StateDict collectStateDict(const torch::nn::Module &module);

    /**
     * @brief Matches @p stateDict against the parameters and buffers of @p module.
     *
     * @param strict Missing or unexpected keys are an error. Otherwise they are only
     *               recorded in the plan.
     * @throws StateDictError on key mismatch in strict mode, or on any shape mismatch.
     */
    StateDictLoadPlan planStateDictLoad(const torch::nn::Module &module, const StateDict &stateDict, bool strict);

    /**
     * @brief Performs the copies of a plan in place, without gradient tracking.
     */
    void applyStateDictLoad(const StateDictLoadPlan &plan);

    /**
     * @brief planStateDictLoad() followed by applyStateDictLoad().
     */
    StateDictLoadPlan loadStateDictInto(torch::nn::Module &module, const StateDict &stateDict, bool strict);
}

#endif //DISTILLRL_STATEDICT_HPP
