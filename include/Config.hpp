#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef DISTILLRL_CONFIG_HPP
#define DISTILLRL_CONFIG_HPP

#include<cstdint>
#include<map>
#include<string>
#include<vector>

namespace DistillRL
{
    /**
     * @brief Construction parameters of a StudentTeacher module.
     *
     * Defaults follow the usual locomotion distillation setup: two 3x256 ELU networks,
     * no observation normalization and a scalar action noise of 0.1.
     *
     * extraOptions collects settings this module does not understand (for example
     * keys written for a different policy class in a shared run configuration).
     * They are reported once at construction and otherwise ignored.
     */
    struct StudentTeacherConfig
    {
        int64_t numActions = 0;

        bool studentObsNormalization = false;
        bool teacherObsNormalization = false;

        std::vector<int64_t> studentHiddenDims{256, 256, 256};
        std::vector<int64_t> teacherHiddenDims{256, 256, 256};
        std::string activation = "elu";

        float initNoiseStd = 0.1f;
        std::string noiseStdType = "scalar";

        // Checks scale > 0 and a finite mean each time the action distribution is rebuilt.
        bool validateDistributionArgs = false;

        float normalizerClip = 10.0f;

        std::map<std::string, std::string> extraOptions;
    };
}

#endif //DISTILLRL_CONFIG_HPP
