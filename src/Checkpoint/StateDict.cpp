//
// Created by moinshaikh on 3/4/26.
//

#include<sstream>

#include<torch/torch.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Checkpoint/StateDict.hpp"
#include"../../include/Errors.hpp"

namespace DistillRL
{
    namespace
    {
        StateDict namedTensors(const torch::nn::Module &module)
        {
            StateDict tensors;
            for (const auto &item : module.named_parameters(true))
            {
                tensors.insert(item.key(), item.value());
            }
            for (const auto &item : module.named_buffers(true))
            {
                tensors.insert(item.key(), item.value());
            }
            return tensors;
        }

        std::string joinKeys(const std::vector<std::string> &keys)
        {
            std::ostringstream joined;
            for (size_t i = 0; i < keys.size(); ++i)
            {
                joined << (i == 0 ? "" : ", ") << '"' << keys[i] << '"';
            }
            return joined.str();
        }
    }

    StateDict collectStateDict(const torch::nn::Module &module)
    {
        StateDict snapshot;
        for (const auto &item : namedTensors(module))
        {
            snapshot.insert(item.key(), item.value().detach().clone());
        }
        return snapshot;
    }

    StateDictLoadPlan planStateDictLoad(const torch::nn::Module &module, const StateDict &stateDict, bool strict)
    {
        StateDictLoadPlan plan;
        auto targets = namedTensors(module);
        std::vector<std::string> shapeErrors;

        for (const auto &target : targets)
        {
            const auto *source = stateDict.find(target.key());
            if (source == nullptr)
            {
                plan.missingKeys.push_back(target.key());
                continue;
            }
            if (source->sizes() != target.value().sizes())
            {
                std::ostringstream message;
                message << "size mismatch for " << target.key() << ": checkpoint has " << source->sizes()
                        << ", module has " << target.value().sizes();
                shapeErrors.push_back(message.str());
                continue;
            }
            plan.copies.emplace_back(target.value(), *source);
        }
        for (const auto &item : stateDict)
        {
            if (!targets.contains(item.key()))
            {
                plan.unexpectedKeys.push_back(item.key());
            }
        }

        std::ostringstream errors;
        if (strict && !plan.missingKeys.empty())
        {
            errors << "Missing key(s) in state_dict: " << joinKeys(plan.missingKeys) << ". ";
        }
        if (strict && !plan.unexpectedKeys.empty())
        {
            errors << "Unexpected key(s) in state_dict: " << joinKeys(plan.unexpectedKeys) << ". ";
        }
        for (const auto &shapeError : shapeErrors)
        {
            errors << shapeError << ". ";
        }
        auto message = errors.str();
        if (!message.empty())
        {
            throw StateDictError("Error(s) in loading state_dict for " + module.name() + ": " + message);
        }

        if (!plan.missingKeys.empty() || !plan.unexpectedKeys.empty())
        {
            spdlog::debug("Non-strict load into {}: {} missing, {} unexpected key(s)",
                          module.name(), plan.missingKeys.size(), plan.unexpectedKeys.size());
        }
        return plan;
    }

    void applyStateDictLoad(const StateDictLoadPlan &plan)
    {
        torch::NoGradGuard noGrad;
        for (const auto &copy : plan.copies)
        {
            // copy_ on the handle keeps parameter identity, optimizers stay attached
            auto destination = copy.first;
            destination.copy_(copy.second);
        }
    }

    StateDictLoadPlan loadStateDictInto(torch::nn::Module &module, const StateDict &stateDict, bool strict)
    {
        auto plan = planStateDictLoad(module, stateDict, strict);
        applyStateDictLoad(plan);
        return plan;
    }

    TEST_CASE("StateDict")
    {
        auto makeNet = []() {
            return torch::nn::Sequential(torch::nn::Linear(3, 4), torch::nn::Tanh(), torch::nn::Linear(4, 2));
        };

        SUBCASE("Collected keys are parameters and buffers")
        {
            auto net = makeNet();
            auto state = collectStateDict(*net);
            CHECK(state.size() == 4);
            CHECK(state.contains("0.weight"));
            CHECK(state.contains("2.bias"));

            auto withBuffer = torch::nn::BatchNorm1d(3);
            auto bnState = collectStateDict(*withBuffer);
            CHECK(bnState.contains("running_mean"));
            CHECK(bnState.contains("weight"));
        }

        SUBCASE("Collected tensors are a snapshot")
        {
            auto net = makeNet();
            auto state = collectStateDict(*net);
            {
                torch::NoGradGuard noGrad;
                net->named_parameters()["0.weight"].fill_(7);
            }
            CHECK_FALSE(torch::equal(state["0.weight"], net->named_parameters()["0.weight"]));
        }

        SUBCASE("Loading copies values in place")
        {
            auto source = makeNet();
            auto target = makeNet();
            auto weightHandle = target->named_parameters()["0.weight"];

            loadStateDictInto(*target, collectStateDict(*source), true);

            CHECK(torch::equal(target->named_parameters()["0.weight"], source->named_parameters()["0.weight"]));
            CHECK(weightHandle.data_ptr() == target->named_parameters()["0.weight"].data_ptr());
            CHECK(torch::equal(weightHandle, source->named_parameters()["0.weight"]));
        }

        SUBCASE("Strict loading rejects missing and unexpected keys without writing")
        {
            auto target = makeNet();
            auto before = collectStateDict(*target);
            auto state = collectStateDict(*makeNet());

            StateDict missing;
            missing.insert("0.weight", state["0.weight"]);
            CHECK_THROWS_AS(loadStateDictInto(*target, missing, true), StateDictError);

            auto extra = state;
            extra.insert("head.weight", torch::zeros({1}));
            CHECK_THROWS_AS(loadStateDictInto(*target, extra, true), StateDictError);

            CHECK(torch::equal(target->named_parameters()["0.weight"], before["0.weight"]));
        }

        SUBCASE("Non-strict loading skips mismatched keys")
        {
            auto target = makeNet();
            auto source = collectStateDict(*makeNet());
            StateDict partial;
            partial.insert("2.weight", source["2.weight"]);
            partial.insert("critic.0.weight", torch::zeros({5}));

            auto plan = loadStateDictInto(*target, partial, false);
            CHECK(plan.copies.size() == 1);
            CHECK(plan.missingKeys.size() == 3);
            CHECK(plan.unexpectedKeys == std::vector<std::string>{"critic.0.weight"});
            CHECK(torch::equal(target->named_parameters()["2.weight"], source["2.weight"]));
        }

        SUBCASE("Shape mismatch is always an error")
        {
            auto target = makeNet();
            StateDict wrong;
            wrong.insert("0.weight", torch::zeros({2, 2}));
            CHECK_THROWS_AS(loadStateDictInto(*target, wrong, false), StateDictError);
        }
    }
}
