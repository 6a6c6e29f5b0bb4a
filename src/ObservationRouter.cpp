//
// Created by moinshaikh on 3/2/26.
//

#include<sstream>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/ObservationRouter.hpp"
#include"../include/Errors.hpp"

namespace DistillRL
{
    namespace
    {
        const char *roleName(PolicyRole role)
        {
            return role == PolicyRole::Student ? "policy" : "teacher";
        }
    }

    ObservationGroups ObservationGroups::fromMapping(const std::map<std::string, std::vector<std::string>> &mapping)
    {
        auto policy = mapping.find("policy");
        auto teacher = mapping.find("teacher");
        if (policy == mapping.end() || teacher == mapping.end())
        {
            throw ConfigurationError("Observation groups must define both 'policy' and 'teacher' entries");
        }
        return ObservationGroups{policy->second, teacher->second};
    }

    /**
     * @brief Records the width of each listed group and returns their sum.
     *
     * A group shared by both roles is recorded once; the probe holds a single tensor for it.
     */
    int64_t ObservationRouter::registerGroups(const std::vector<std::string> &names, const ObservationMap &shapeProbe)
    {
        int64_t total = 0;
        for (const auto &name : names)
        {
            auto entry = shapeProbe.find(name);
            if (entry == shapeProbe.end())
            {
                throw ConfigurationError("Observation group '" + name + "' is missing from the observations");
            }
            if (entry->second.dim() != 2)
            {
                std::ostringstream message;
                message << "Observation group '" << name << "' has " << entry->second.dim()
                        << " dimensions, only flat (batch, features) observations are supported";
                throw ConfigurationError(message.str());
            }
            auto width = entry->second.size(1);
            groupWidths[name] = width;
            total += width;
        }
        return total;
    }

    ObservationRouter::ObservationRouter(ObservationGroups groups, const ObservationMap &shapeProbe) :
    groups(std::move(groups)),
    numStudentObs(0),
    numTeacherObs(0)
    {
        numStudentObs = registerGroups(this->groups.policy, shapeProbe);
        numTeacherObs = registerGroups(this->groups.teacher, shapeProbe);
    }

    torch::Tensor ObservationRouter::route(PolicyRole role, const ObservationMap &observations) const
    {
        const auto &names = groups.forRole(role);
        std::vector<torch::Tensor> parts;
        parts.reserve(names.size());
        for (const auto &name : names)
        {
            auto entry = observations.find(name);
            if (entry == observations.end())
            {
                throw ObservationError(std::string("Observation group '") + name + "' required by the " +
                                       roleName(role) + " is missing");
            }
            const auto &tensor = entry->second;
            if (tensor.dim() != 2)
            {
                throw ObservationError("Observation group '" + name + "' must be 2-D, got " +
                                       std::to_string(tensor.dim()) + " dimensions");
            }
            if (tensor.size(1) != groupWidths.at(name))
            {
                throw ObservationError("Observation group '" + name + "' has width " +
                                       std::to_string(tensor.size(1)) + ", expected " +
                                       std::to_string(groupWidths.at(name)));
            }
            parts.push_back(tensor);
        }
        return torch::cat(parts, -1);
    }

    TEST_CASE("ObservationRouter")
    {
        ObservationMap probe{
            {"proprio", torch::zeros({1, 3})},
            {"command", torch::zeros({1, 2})},
            {"privileged", torch::zeros({1, 4})}};
        ObservationGroups groups{{"proprio", "command"}, {"proprio", "command", "privileged"}};
        ObservationRouter router(groups, probe);

        SUBCASE("Widths are the sum of the configured groups")
        {
            CHECK(router.getNumStudentObs() == 5);
            CHECK(router.getNumTeacherObs() == 9);
        }

        SUBCASE("Routed width does not depend on batch size")
        {
            for (int64_t batch : {1, 7, 32})
            {
                ObservationMap obs{
                    {"proprio", torch::rand({batch, 3})},
                    {"command", torch::rand({batch, 2})},
                    {"privileged", torch::rand({batch, 4})}};
                auto student = router.route(PolicyRole::Student, obs);
                auto teacher = router.route(PolicyRole::Teacher, obs);
                CHECK(student.sizes().vec() == std::vector<int64_t>{batch, 5});
                CHECK(teacher.sizes().vec() == std::vector<int64_t>{batch, 9});
            }
        }

        SUBCASE("Groups are concatenated in configured order")
        {
            ObservationMap obs{
                {"proprio", torch::full({2, 3}, 1.0)},
                {"command", torch::full({2, 2}, 2.0)},
                {"privileged", torch::full({2, 4}, 3.0)}};
            ObservationRouter swapped(ObservationGroups{{"command", "proprio"}, {"privileged"}}, probe);

            auto ordered = router.route(PolicyRole::Student, obs);
            auto reordered = swapped.route(PolicyRole::Student, obs);
            CHECK(ordered[0][0].item<float>() == doctest::Approx(1.0));
            CHECK(ordered[0][4].item<float>() == doctest::Approx(2.0));
            CHECK(reordered[0][0].item<float>() == doctest::Approx(2.0));
            CHECK(reordered[0][4].item<float>() == doctest::Approx(1.0));
            CHECK_FALSE(torch::equal(ordered, reordered));
        }

        SUBCASE("Missing group is rejected")
        {
            ObservationMap obs{{"proprio", torch::rand({2, 3})}};
            CHECK_THROWS_AS(router.route(PolicyRole::Student, obs), ObservationError);
        }

        SUBCASE("Non-flat group is rejected")
        {
            ObservationMap obs{
                {"proprio", torch::rand({2, 3, 1})},
                {"command", torch::rand({2, 2})}};
            CHECK_THROWS_AS(router.route(PolicyRole::Student, obs), ObservationError);
        }

        SUBCASE("Width mismatch is rejected")
        {
            ObservationMap obs{
                {"proprio", torch::rand({2, 4})},
                {"command", torch::rand({2, 2})}};
            CHECK_THROWS_AS(router.route(PolicyRole::Student, obs), ObservationError);
        }

        SUBCASE("Shape probe is validated at construction")
        {
            ObservationMap badProbe{{"proprio", torch::zeros({3})}, {"command", torch::zeros({1, 2})}};
            CHECK_THROWS_AS(ObservationRouter(ObservationGroups{{"proprio"}, {"command"}}, badProbe),
                            ConfigurationError);
            CHECK_THROWS_AS(ObservationRouter(ObservationGroups{{"proprio"}, {"height_scan"}}, probe),
                            ConfigurationError);
        }

        SUBCASE("Groups are read from a role mapping")
        {
            auto parsed = ObservationGroups::fromMapping(
                {{"policy", {"proprio"}}, {"critic", {"proprio", "privileged"}}, {"teacher", {"privileged"}}});
            CHECK(parsed.policy == std::vector<std::string>{"proprio"});
            CHECK(parsed.teacher == std::vector<std::string>{"privileged"});
            CHECK_THROWS_AS(ObservationGroups::fromMapping({{"policy", {"proprio"}}}), ConfigurationError);
        }
    }
}
