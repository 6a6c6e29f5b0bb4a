#pragma once
//
// Created by moinshaikh on 3/4/26.
//

#ifndef DISTILLRL_CHECKPOINTRECONCILER_HPP
#define DISTILLRL_CHECKPOINTRECONCILER_HPP

#include<string>
#include<vector>

#include"StateDict.hpp"

namespace DistillRL
{
    /**
     * @brief Training regime a checkpoint was written by.
     */
    enum class CheckpointKind
    {
        PriorPolicy,       ///< Actor-critic run: "actor.*", "critic.*", "actor_obs_normalizer.*", ...
        PriorDistillation, ///< Earlier distillation run: "student.*", "teacher.*", ...
        Unknown
    };

    /**
     * @brief Outcome of the most recent checkpoint load of a StudentTeacher module.
     */
    enum class CheckpointState
    {
        Unloaded,
        LoadedFromPriorPolicyTraining,
        LoadedFromPriorDistillation
    };

    /**
     * @brief Key substrings the classification and remapping rely on.
     *
     * Persisted checkpoints carry no format tag; these names are the only contract.
     */
    namespace CheckpointKeys
    {
        constexpr const char *actorMarker = "actor";
        constexpr const char *studentMarker = "student";
        constexpr const char *actorPrefix = "actor.";
        constexpr const char *actorNormalizerPrefix = "actor_obs_normalizer.";
    }

    /**
     * @brief Classifies a checkpoint by its key names, first match wins.
     *
     * Any key containing "actor" makes it PriorPolicy, even when "student" keys are present
     * too. Otherwise any key containing "student" makes it PriorDistillation.
     */
    CheckpointKind classifyCheckpoint(const std::vector<std::string> &keys);

    /**
     * @brief Entries whose key contains @p prefix, with every occurrence of @p prefix removed.
     *
     * "actor.0.weight" with prefix "actor." becomes "0.weight"; keys without the prefix
     * (critic weights, the other normalizer) are dropped.
     */
    StateDict extractRenamed(const StateDict &stateDict, const std::string &prefix);

    std::string toString(CheckpointKind kind);
    std::string toString(CheckpointState state);
}

#endif //DISTILLRL_CHECKPOINTRECONCILER_HPP
