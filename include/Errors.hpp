#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef DISTILLRL_ERRORS_HPP
#define DISTILLRL_ERRORS_HPP

#include<stdexcept>
#include<string>

namespace DistillRL
{
    /**
     * @brief Raised at construction for an unusable configuration.
     *
     * Unknown noise parameterization, unknown activation, non-positive action count,
     * or an observation group with the wrong rank in the shape probe.
     */
    class ConfigurationError : public std::invalid_argument
    {
    public:
        explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {}
    };

    /**
     * @brief Raised when routing observations that lack a configured group,
     * or whose group tensor has the wrong rank or width.
     */
    class ObservationError : public std::invalid_argument
    {
    public:
        explicit ObservationError(const std::string &message) : std::invalid_argument(message) {}
    };

    /**
     * @brief Raised when a checkpoint contains neither actor nor student parameters.
     */
    class CheckpointFormatError : public std::runtime_error
    {
    public:
        explicit CheckpointFormatError(const std::string &message) : std::runtime_error(message) {}
    };

    /**
     * @brief Raised when a state dictionary does not match the target module
     * (missing or unexpected keys in strict mode, or a shape mismatch).
     */
    class StateDictError : public std::runtime_error
    {
    public:
        explicit StateDictError(const std::string &message) : std::runtime_error(message) {}
    };
}

#endif //DISTILLRL_ERRORS_HPP
