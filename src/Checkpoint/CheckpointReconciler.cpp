//
// Created by moinshaikh on 3/4/26.
//

#include<algorithm>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Checkpoint/CheckpointReconciler.hpp"

namespace DistillRL
{
    namespace
    {
        bool anyKeyContains(const std::vector<std::string> &keys, const std::string &marker)
        {
            return std::any_of(keys.begin(), keys.end(), [&marker](const std::string &key) {
                return key.find(marker) != std::string::npos;
            });
        }

        std::string removeAll(std::string key, const std::string &pattern)
        {
            auto position = key.find(pattern);
            while (position != std::string::npos)
            {
                key.erase(position, pattern.size());
                position = key.find(pattern, position);
            }
            return key;
        }
    }

    CheckpointKind classifyCheckpoint(const std::vector<std::string> &keys)
    {
        if (anyKeyContains(keys, CheckpointKeys::actorMarker))
        {
            return CheckpointKind::PriorPolicy;
        }
        if (anyKeyContains(keys, CheckpointKeys::studentMarker))
        {
            return CheckpointKind::PriorDistillation;
        }
        return CheckpointKind::Unknown;
    }

    StateDict extractRenamed(const StateDict &stateDict, const std::string &prefix)
    {
        StateDict renamed;
        for (const auto &item : stateDict)
        {
            if (item.key().find(prefix) != std::string::npos)
            {
                renamed.insert(removeAll(item.key(), prefix), item.value());
            }
        }
        return renamed;
    }

    std::string toString(CheckpointKind kind)
    {
        switch (kind)
        {
            case CheckpointKind::PriorPolicy:
                return "prior policy training";
            case CheckpointKind::PriorDistillation:
                return "prior distillation training";
            case CheckpointKind::Unknown:
                break;
        }
        return "unknown";
    }

    std::string toString(CheckpointState state)
    {
        switch (state)
        {
            case CheckpointState::LoadedFromPriorPolicyTraining:
                return "loaded from prior policy training";
            case CheckpointState::LoadedFromPriorDistillation:
                return "loaded from prior distillation";
            case CheckpointState::Unloaded:
                break;
        }
        return "unloaded";
    }

    TEST_CASE("CheckpointReconciler")
    {
        SUBCASE("Actor-critic keys are a prior policy checkpoint")
        {
            CHECK(classifyCheckpoint({"actor.0.weight", "actor.0.bias", "critic.0.weight", "std"}) ==
                  CheckpointKind::PriorPolicy);
            CHECK(classifyCheckpoint({"actor_obs_normalizer.rms.mean"}) == CheckpointKind::PriorPolicy);
        }

        SUBCASE("Student keys are a prior distillation checkpoint")
        {
            CHECK(classifyCheckpoint({"student.0.weight", "teacher.0.weight", "log_std"}) ==
                  CheckpointKind::PriorDistillation);
        }

        SUBCASE("The actor rule wins when both markers are present")
        {
            CHECK(classifyCheckpoint({"student.0.weight", "actor.0.weight"}) == CheckpointKind::PriorPolicy);
        }

        SUBCASE("Markers match anywhere in the key")
        {
            CHECK(classifyCheckpoint({"model.actor_head.weight"}) == CheckpointKind::PriorPolicy);
            CHECK(classifyCheckpoint({"module.student_net.bias"}) == CheckpointKind::PriorDistillation);
        }

        SUBCASE("Anything else is unknown")
        {
            CHECK(classifyCheckpoint(std::vector<std::string>{}) == CheckpointKind::Unknown);
            CHECK(classifyCheckpoint({"teacher.0.weight", "critic.0.weight", "std"}) == CheckpointKind::Unknown);
        }

        SUBCASE("Renaming keeps only prefixed entries")
        {
            StateDict state;
            state.insert("actor.0.weight", torch::ones({2, 2}));
            state.insert("actor.2.bias", torch::ones({2}));
            state.insert("critic.0.weight", torch::ones({2, 2}));
            state.insert("actor_obs_normalizer.rms.mean", torch::zeros({2}));
            state.insert("std", torch::ones({2}));

            auto teacher = extractRenamed(state, CheckpointKeys::actorPrefix);
            CHECK(teacher.keys() == std::vector<std::string>{"0.weight", "2.bias"});

            auto normalizer = extractRenamed(state, CheckpointKeys::actorNormalizerPrefix);
            CHECK(normalizer.keys() == std::vector<std::string>{"rms.mean"});
            CHECK(torch::equal(normalizer["rms.mean"], state["actor_obs_normalizer.rms.mean"]));
        }

        SUBCASE("Every occurrence of the prefix is removed")
        {
            StateDict state;
            state.insert("actor.memory.actor.0.weight", torch::ones({1}));
            auto renamed = extractRenamed(state, CheckpointKeys::actorPrefix);
            CHECK(renamed.contains("memory.0.weight"));
        }
    }
}
