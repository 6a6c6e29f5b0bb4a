#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef DISTILLRL_OBSERVATIONROUTER_HPP
#define DISTILLRL_OBSERVATIONROUTER_HPP

#include<map>
#include<string>
#include<vector>

#include<torch/torch.h>

namespace DistillRL
{
    /**
     * @brief Named observation groups of one environment step, each a (batch, features) tensor.
     */
    using ObservationMap = std::map<std::string, torch::Tensor>;

    /**
     * @brief Which network an observation vector is assembled for.
     */
    enum class PolicyRole
    {
        Student,
        Teacher
    };

    /**
     * @brief Ordered group names feeding the student ("policy") and the teacher.
     *
     * The order is part of the network contract: the concatenated input of a trained
     * network only makes sense with the group order it was trained with.
     */
    struct ObservationGroups
    {
        std::vector<std::string> policy;
        std::vector<std::string> teacher;

        /**
         * @brief Builds the record from a role-name to group-list mapping.
         *
         * Run configurations usually carry more roles than this module needs (e.g. "critic");
         * only "policy" and "teacher" are read and both are required.
         *
         * @throws ConfigurationError if "policy" or "teacher" is absent.
         */
        static ObservationGroups fromMapping(const std::map<std::string, std::vector<std::string>> &mapping);

        const std::vector<std::string> &forRole(PolicyRole role) const
        {
            return role == PolicyRole::Student ? policy : teacher;
        }
    };

    /**
     * @class ObservationRouter
     * @brief Concatenates the configured observation groups of a role into one flat input.
     *
     * Feature widths are read once from a shape probe at construction and used to check
     * every routed batch afterwards. Only flat (batch, features) groups are supported.
     */
    class ObservationRouter
    {
    private:
        ObservationGroups groups;
        std::map<std::string, int64_t> groupWidths;
        int64_t numStudentObs;
        int64_t numTeacherObs;

        int64_t registerGroups(const std::vector<std::string> &names, const ObservationMap &shapeProbe);
    public:
        /**
         * @param groups Group lists of both roles.
         * @param shapeProbe One representative tensor per group. Only the shapes are read.
         *
         * @throws ConfigurationError if a listed group is missing from the probe or is not 2-D.
         */
        ObservationRouter(ObservationGroups groups, const ObservationMap &shapeProbe);

        /**
         * @brief Concatenates the role's groups along the feature axis, in configured order.
         *
         * @return Tensor of shape (batch, numObs(role)).
         * @throws ObservationError if a group is missing, is not 2-D, or has a different
         *         width than at construction.
         */
        torch::Tensor route(PolicyRole role, const ObservationMap &observations) const;

        inline int64_t numObs(PolicyRole role) const
        {
            return role == PolicyRole::Student ? numStudentObs : numTeacherObs;
        }

        inline int64_t getNumStudentObs() const
        {
            return numStudentObs;
        }

        inline int64_t getNumTeacherObs() const
        {
            return numTeacherObs;
        }

        inline const ObservationGroups &getGroups() const
        {
            return groups;
        }
    };
}

#endif //DISTILLRL_OBSERVATIONROUTER_HPP
