//
// Created by moinshaikh on 3/5/26.
//

#include<cmath>
#include<sstream>
#include<stdexcept>
#include<string>

#include<torch/torch.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Model/StudentTeacher.hpp"
#include"../../include/Model/Mlp.hpp"
#include"../../include/Errors.hpp"

namespace DistillRL
{
    StudentTeacherImpl::StudentTeacherImpl(const ObservationMap &shapeProbe,
                                           const ObservationGroups &groups,
                                           const StudentTeacherConfig &config)
    : config(config),
      router(groups, shapeProbe),
      noiseType(parseNoiseStdType(config.noiseStdType)),
      teacherLoaded(false),
      checkpointState(CheckpointState::Unloaded)
    {
        if (config.numActions <= 0)
        {
            throw ConfigurationError("numActions must be positive, got " + std::to_string(config.numActions));
        }
        // fail on an unknown activation before any layer is allocated
        makeActivation(config.activation);

        if (!config.extraOptions.empty())
        {
            std::ostringstream ignored;
            for (const auto &option : config.extraOptions)
            {
                ignored << (ignored.tellp() == 0 ? "" : ", ") << option.first;
            }
            spdlog::warn("StudentTeacher got unexpected options, which will be ignored: {}", ignored.str());
        }

        student = register_module("student", buildMlp(router.getNumStudentObs(), config.numActions,
                                                      config.studentHiddenDims, config.activation));
        studentObsNormalizer = register_module("student_obs_normalizer",
                                               makeObservationNormalizer(config.studentObsNormalization,
                                                                         router.getNumStudentObs(),
                                                                         config.normalizerClip));

        teacher = register_module("teacher", buildMlp(router.getNumTeacherObs(), config.numActions,
                                                      config.teacherHiddenDims, config.activation));
        teacherObsNormalizer = register_module("teacher_obs_normalizer",
                                               makeObservationNormalizer(config.teacherObsNormalization,
                                                                         router.getNumTeacherObs(),
                                                                         config.normalizerClip));

        noiseParameter = register_parameter(noiseType == NoiseStdType::Log ? "log_std" : "std",
                                            GaussianActionHead::initialNoise(noiseType, config.numActions,
                                                                             config.initNoiseStd));
        actionHead = std::make_unique<GaussianActionHead>(noiseType, noiseParameter,
                                                          config.validateDistributionArgs);

        freezeTeacher();

        std::ostringstream studentDescription;
        studentDescription << *student;
        spdlog::info("Student MLP: {}", studentDescription.str());

        std::ostringstream teacherDescription;
        teacherDescription << *teacher;
        spdlog::info("Teacher MLP: {}", teacherDescription.str());
    }

    void StudentTeacherImpl::freezeTeacher()
    {
        teacher->eval();
        teacherObsNormalizer->eval();
    }

    torch::Tensor StudentTeacherImpl::act(const ObservationMap &observations)
    {
        auto studentObservations = router.route(PolicyRole::Student, observations);
        updateDistribution(studentObsNormalizer->normalize(studentObservations));
        return actionHead->sample();
    }

    torch::Tensor StudentTeacherImpl::actInference(const ObservationMap &observations)
    {
        auto studentObservations = router.route(PolicyRole::Student, observations);
        return student->forward(studentObsNormalizer->normalize(studentObservations));
    }

    torch::Tensor StudentTeacherImpl::evaluate(const ObservationMap &observations)
    {
        torch::NoGradGuard noGrad;
        auto teacherObservations = router.route(PolicyRole::Teacher, observations);
        return teacher->forward(teacherObsNormalizer->normalize(teacherObservations));
    }

    void StudentTeacherImpl::updateDistribution(const torch::Tensor &studentObservations)
    {
        actionHead->update(student->forward(studentObservations));
    }

    void StudentTeacherImpl::updateNormalization(const ObservationMap &observations)
    {
        if (config.studentObsNormalization)
        {
            studentObsNormalizer->update(router.route(PolicyRole::Student, observations));
        }
    }

    torch::Tensor StudentTeacherImpl::actionMean() const
    {
        return actionHead->actionMean();
    }

    torch::Tensor StudentTeacherImpl::actionStd() const
    {
        return actionHead->actionStd();
    }

    torch::Tensor StudentTeacherImpl::entropy() const
    {
        return actionHead->entropy();
    }

    torch::Tensor StudentTeacherImpl::getActionsLogProbability(const torch::Tensor &actions) const
    {
        return actionHead->logProbability(actions);
    }

    // no temporal state to clear or detach
    void StudentTeacherImpl::reset(const torch::Tensor &) {}

    torch::Tensor StudentTeacherImpl::getHiddenStates() const
    {
        return {};
    }

    void StudentTeacherImpl::detachHiddenStates(const torch::Tensor &) {}

    void StudentTeacherImpl::train(bool on)
    {
        torch::nn::Module::train(on);
        freezeTeacher();
    }

    StateDict StudentTeacherImpl::stateDict() const
    {
        return collectStateDict(*this);
    }

    bool StudentTeacherImpl::loadStateDict(const StateDict &stateDict, bool strict)
    {
        switch (classifyCheckpoint(stateDict.keys()))
        {
            case CheckpointKind::PriorPolicy:
            {
                auto teacherState = extractRenamed(stateDict, CheckpointKeys::actorPrefix);
                auto normalizerState = extractRenamed(stateDict, CheckpointKeys::actorNormalizerPrefix);
                spdlog::debug("Remapped {} actor entries and {} actor normalizer entries onto the teacher",
                              teacherState.size(), normalizerState.size());

                // both plans are validated before either is applied
                auto teacherPlan = planStateDictLoad(*teacher, teacherState, strict);
                auto normalizerPlan = planStateDictLoad(*teacherObsNormalizer, normalizerState, strict);
                applyStateDictLoad(teacherPlan);
                applyStateDictLoad(normalizerPlan);

                teacherLoaded = true;
                checkpointState = CheckpointState::LoadedFromPriorPolicyTraining;
                freezeTeacher();
                spdlog::info("Teacher {}, student left untrained", toString(checkpointState));
                return false;
            }
            case CheckpointKind::PriorDistillation:
            {
                loadStateDictInto(*this, stateDict, strict);

                teacherLoaded = true;
                checkpointState = CheckpointState::LoadedFromPriorDistillation;
                freezeTeacher();
                spdlog::info("Student and teacher {}, resuming training", toString(checkpointState));
                return true;
            }
            case CheckpointKind::Unknown:
                break;
        }
        throw CheckpointFormatError("state_dict does not contain student or teacher parameters");
    }

    TEST_CASE("StudentTeacher")
    {
        ObservationMap probe{{"policy", torch::zeros({1, 4})}, {"privileged", torch::zeros({1, 3})}};
        ObservationGroups groups{{"policy"}, {"policy", "privileged"}};

        StudentTeacherConfig config;
        config.numActions = 2;
        config.studentHiddenDims = {16, 16};
        config.teacherHiddenDims = {32, 32};

        auto makeObservations = [](int64_t batch) {
            return ObservationMap{{"policy", torch::randn({batch, 4})}, {"privileged", torch::randn({batch, 3})}};
        };

        auto sameTensors = [](const StateDict &actual, const StateDict &expected) {
            if (actual.size() != expected.size())
            {
                return false;
            }
            for (const auto &item : expected)
            {
                const auto *value = actual.find(item.key());
                if (value == nullptr || !torch::equal(*value, item.value()))
                {
                    return false;
                }
            }
            return true;
        };

        auto insertWithPrefix = [](StateDict &into, const std::string &prefix, const torch::nn::Module &module) {
            for (const auto &item : collectStateDict(module))
            {
                into.insert(prefix + item.key(), item.value());
            }
        };

        SUBCASE("Sizes and keys follow the configuration")
        {
            StudentTeacher model(probe, groups, config);

            CHECK(model->numStudentObs() == 4);
            CHECK(model->numTeacherObs() == 7);
            CHECK(model->numActions() == 2);
            CHECK(model->noiseStdType() == NoiseStdType::Scalar);
            CHECK(model->observationGroups().teacher == std::vector<std::string>{"policy", "privileged"});
            CHECK_FALSE(model->loadedTeacher());
            CHECK(model->getCheckpointState() == CheckpointState::Unloaded);

            auto state = model->stateDict();
            CHECK(state.contains("student.0.weight"));
            CHECK(state.contains("student.4.bias"));
            CHECK(state.contains("teacher.4.weight"));
            CHECK(state.contains("std"));
            CHECK_FALSE(state.contains("log_std"));
            CHECK(state["student.0.weight"].sizes().vec() == std::vector<int64_t>{16, 4});
            CHECK(state["teacher.0.weight"].sizes().vec() == std::vector<int64_t>{32, 7});
            CHECK(torch::allclose(state["std"], torch::full({2}, 0.1)));
            for (const auto &key : state.keys())
            {
                CHECK(key.find("normalizer") == std::string::npos);
            }
        }

        SUBCASE("No recurrent state")
        {
            StudentTeacher model(probe, groups, config);
            CHECK_FALSE(StudentTeacherImpl::isRecurrent);
            model->reset();
            model->detachHiddenStates(torch::ones({3}));
            CHECK_FALSE(model->getHiddenStates().defined());
        }

        SUBCASE("Teacher stays in evaluation mode")
        {
            config.teacherObsNormalization = true;
            StudentTeacher model(probe, groups, config);
            CHECK_FALSE(model->getTeacher()->is_training());
            CHECK_FALSE(model->getTeacherObsNormalizer()->is_training());

            for (int i = 0; i < 3; ++i)
            {
                model->train();
                CHECK(model->getStudent()->is_training());
                CHECK(model->getStudentObsNormalizer()->is_training());
                CHECK_FALSE(model->getTeacher()->is_training());
                CHECK_FALSE(model->getTeacherObsNormalizer()->is_training());

                model->eval();
                CHECK_FALSE(model->getStudent()->is_training());
                CHECK_FALSE(model->getTeacher()->is_training());
            }
        }

        SUBCASE("Acting and normalization updates never touch the teacher")
        {
            config.studentObsNormalization = true;
            config.teacherObsNormalization = true;
            StudentTeacher model(probe, groups, config);
            auto teacherBefore = collectStateDict(*model->getTeacher());
            auto normalizerBefore = collectStateDict(*model->getTeacherObsNormalizer());

            for (int i = 0; i < 5; ++i)
            {
                auto observations = makeObservations(8);
                model->act(observations);
                model->updateNormalization(observations);
                model->evaluate(observations);
            }

            CHECK(sameTensors(collectStateDict(*model->getTeacher()), teacherBefore));
            CHECK(sameTensors(collectStateDict(*model->getTeacherObsNormalizer()), normalizerBefore));
            CHECK(model->getStudentObsNormalizer()->getStepCount() == doctest::Approx(40.0001));
        }

        SUBCASE("Normalization update is a no-op when disabled")
        {
            StudentTeacher model(probe, groups, config);
            auto before = model->stateDict();
            model->updateNormalization(makeObservations(8));
            CHECK(sameTensors(model->stateDict(), before));
        }

        SUBCASE("A distillation step only moves the student")
        {
            StudentTeacher model(probe, groups, config);
            torch::optim::Adam optimizer(model->parameters(), torch::optim::AdamOptions(1e-2));
            auto teacherBefore = collectStateDict(*model->getTeacher());
            auto studentBefore = collectStateDict(*model->getStudent());

            auto observations = makeObservations(16);
            auto loss = torch::mse_loss(model->actInference(observations), model->evaluate(observations));
            optimizer.zero_grad();
            loss.backward();
            optimizer.step();

            CHECK(sameTensors(collectStateDict(*model->getTeacher()), teacherBefore));
            CHECK_FALSE(sameTensors(collectStateDict(*model->getStudent()), studentBefore));
            CHECK_FALSE(model->evaluate(observations).requires_grad());
        }

        SUBCASE("Scalar and log noise describe the same distribution")
        {
            config.initNoiseStd = 0.3f;
            torch::manual_seed(7);
            StudentTeacher scalar(probe, groups, config);

            config.noiseStdType = "log";
            torch::manual_seed(7);
            StudentTeacher logScale(probe, groups, config);

            CHECK(logScale->noiseStdType() == NoiseStdType::Log);
            CHECK(logScale->stateDict().contains("log_std"));
            CHECK_FALSE(logScale->stateDict().contains("std"));

            auto observations = makeObservations(4);
            scalar->act(observations);
            logScale->act(observations);
            CHECK(torch::allclose(scalar->actionMean(), logScale->actionMean()));
            CHECK(torch::allclose(scalar->actionStd(), logScale->actionStd(), 1e-5, 1e-6));
            CHECK(torch::allclose(scalar->actionStd(), torch::full({4, 2}, 0.3), 1e-5, 1e-6));
        }

        SUBCASE("Entropy matches the closed form")
        {
            config.initNoiseStd = 0.5f;
            StudentTeacher model(probe, groups, config);
            model->act(makeObservations(3));

            auto expected = 2 * 0.5 * std::log(2 * M_PI * M_E * 0.25);
            auto entropy = model->entropy();
            REQUIRE(entropy.sizes().vec() == std::vector<int64_t>{3});
            for (int64_t i = 0; i < 3; ++i)
            {
                CHECK(entropy[i].item<double>() == doctest::Approx(expected).epsilon(1e-5));
            }
        }

        SUBCASE("Inference is deterministic, acting samples")
        {
            StudentTeacher model(probe, groups, config);
            auto observations = makeObservations(32);

            auto inference = model->actInference(observations);
            CHECK(torch::equal(inference, model->actInference(observations)));

            auto first = model->act(observations);
            auto mean = model->actionMean().clone();
            auto deviation = model->actionStd().clone();
            auto second = model->act(observations);

            CHECK(first.sizes().vec() == std::vector<int64_t>{32, 2});
            CHECK_FALSE(torch::equal(first, second));
            CHECK(torch::equal(model->actionMean(), mean));
            CHECK(torch::equal(model->actionStd(), deviation));
            CHECK(torch::allclose(mean, inference));
            CHECK(model->getActionsLogProbability(second).sizes().vec() == std::vector<int64_t>{32});
        }

        SUBCASE("Distribution accessors need a prior act")
        {
            StudentTeacher model(probe, groups, config);
            CHECK_THROWS_AS(model->actionMean(), std::logic_error);
            CHECK_THROWS_AS(model->actionStd(), std::logic_error);
            CHECK_THROWS_AS(model->entropy(), std::logic_error);
        }

        SUBCASE("Routing errors surface from act and evaluate")
        {
            StudentTeacher model(probe, groups, config);
            ObservationMap studentOnly{{"policy", torch::randn({2, 4})}};
            CHECK_NOTHROW(model->act(studentOnly));
            CHECK_THROWS_AS(model->evaluate(studentOnly), ObservationError);
            CHECK_THROWS_AS(model->act({{"policy", torch::randn({4})}}), ObservationError);
        }

        SUBCASE("Actor-critic checkpoint")
        {
            torch::manual_seed(3);
            auto actor = buildMlp(7, 2, {32, 32}, "elu");
            auto critic = buildMlp(7, 1, {32, 32}, "elu");
            ObservationNormalizer actorNormalizer(7);
            actorNormalizer->update(torch::randn({64, 7}) * 3 + 1);
            ObservationNormalizer criticNormalizer(7);

            StateDict checkpoint;
            insertWithPrefix(checkpoint, "actor.", *actor);
            insertWithPrefix(checkpoint, "critic.", *critic);
            insertWithPrefix(checkpoint, "actor_obs_normalizer.", *actorNormalizer);
            insertWithPrefix(checkpoint, "critic_obs_normalizer.", *criticNormalizer);
            checkpoint.insert("std", torch::full({2}, 0.7));

            SUBCASE("Loads the teacher side only")
            {
                config.studentObsNormalization = true;
                config.teacherObsNormalization = true;
                StudentTeacher model(probe, groups, config);
                auto studentBefore = collectStateDict(*model->getStudent());
                auto studentNormalizerBefore = collectStateDict(*model->getStudentObsNormalizer());

                model->train();
                CHECK_FALSE(model->loadStateDict(checkpoint));
                CHECK(model->loadedTeacher());
                CHECK(model->getCheckpointState() == CheckpointState::LoadedFromPriorPolicyTraining);

                CHECK(sameTensors(collectStateDict(*model->getTeacher()), collectStateDict(*actor)));
                CHECK(sameTensors(collectStateDict(*model->getTeacherObsNormalizer()),
                                  collectStateDict(*actorNormalizer)));
                CHECK(sameTensors(collectStateDict(*model->getStudent()), studentBefore));
                CHECK(sameTensors(collectStateDict(*model->getStudentObsNormalizer()), studentNormalizerBefore));
                CHECK(torch::allclose(model->getNoiseParameter(), torch::full({2}, 0.1)));
                CHECK_FALSE(model->getTeacher()->is_training());
                CHECK_FALSE(model->getTeacherObsNormalizer()->is_training());

                auto observations = makeObservations(5);
                auto flat = torch::cat({observations["policy"], observations["privileged"]}, -1);
                torch::NoGradGuard noGrad;
                CHECK(torch::allclose(model->evaluate(observations),
                                      actor->forward(actorNormalizer->normalize(flat))));
            }

            SUBCASE("Strict load rejects normalizer keys without a teacher normalizer")
            {
                StudentTeacher model(probe, groups, config);
                auto before = model->stateDict();

                CHECK_THROWS_AS(model->loadStateDict(checkpoint), StateDictError);
                CHECK(sameTensors(model->stateDict(), before));
                CHECK_FALSE(model->loadedTeacher());
                CHECK(model->getCheckpointState() == CheckpointState::Unloaded);

                CHECK_FALSE(model->loadStateDict(checkpoint, false));
                CHECK(model->loadedTeacher());
                CHECK(sameTensors(collectStateDict(*model->getTeacher()), collectStateDict(*actor)));
            }

            SUBCASE("The actor marker wins over student keys")
            {
                config.teacherObsNormalization = true;
                StudentTeacher model(probe, groups, config);
                checkpoint.insert("student.0.weight", torch::zeros({16, 4}));
                CHECK_FALSE(model->loadStateDict(checkpoint));
                CHECK(model->getCheckpointState() == CheckpointState::LoadedFromPriorPolicyTraining);
            }
        }

        SUBCASE("Distillation checkpoint")
        {
            config.studentObsNormalization = true;
            torch::manual_seed(1);
            StudentTeacher source(probe, groups, config);
            source->updateNormalization(makeObservations(32));
            {
                torch::NoGradGuard noGrad;
                source->getNoiseParameter().fill_(0.25);
            }
            auto saved = source->stateDict();

            torch::manual_seed(2);
            StudentTeacher model(probe, groups, config);

            SUBCASE("Restores the whole module in place")
            {
                auto weight = model->getStudent()->parameters().front();
                auto *storage = weight.data_ptr();

                CHECK(model->loadStateDict(saved));
                CHECK(model->loadedTeacher());
                CHECK(model->getCheckpointState() == CheckpointState::LoadedFromPriorDistillation);
                CHECK(sameTensors(model->stateDict(), saved));
                CHECK(model->getStudent()->parameters().front().data_ptr() == storage);
                CHECK_FALSE(model->getTeacher()->is_training());

                auto observations = makeObservations(6);
                CHECK(torch::equal(model->actInference(observations), source->actInference(observations)));
            }

            SUBCASE("Strict load rejects a missing key")
            {
                StateDict partial;
                for (const auto &item : saved)
                {
                    if (item.key() != "std")
                    {
                        partial.insert(item.key(), item.value());
                    }
                }
                auto before = model->stateDict();

                CHECK_THROWS_AS(model->loadStateDict(partial), StateDictError);
                CHECK(sameTensors(model->stateDict(), before));
                CHECK_FALSE(model->loadedTeacher());

                CHECK(model->loadStateDict(partial, false));
                CHECK(torch::equal(model->stateDict()["student.0.weight"], saved["student.0.weight"]));
                CHECK(torch::equal(model->getNoiseParameter(), before["std"]));
            }

            SUBCASE("Shape mismatches are always rejected")
            {
                StateDict resized = saved;
                resized["std"] = torch::ones({3});
                auto before = model->stateDict();
                CHECK_THROWS_AS(model->loadStateDict(resized, false), StateDictError);
                CHECK(sameTensors(model->stateDict(), before));
            }
        }

        SUBCASE("Unrecognized checkpoints leave the module unchanged")
        {
            StudentTeacher model(probe, groups, config);
            auto before = model->stateDict();

            StateDict checkpoint;
            checkpoint.insert("teacher.0.weight", torch::zeros({32, 7}));
            checkpoint.insert("critic.0.weight", torch::zeros({32, 7}));
            checkpoint.insert("std", torch::ones({2}));

            CHECK_THROWS_AS(model->loadStateDict(checkpoint), CheckpointFormatError);
            CHECK_THROWS_AS(model->loadStateDict(StateDict{}), CheckpointFormatError);
            CHECK(sameTensors(model->stateDict(), before));
            CHECK_FALSE(model->loadedTeacher());
            CHECK(model->getCheckpointState() == CheckpointState::Unloaded);
        }

        SUBCASE("Invalid configurations are rejected")
        {
            auto badNoise = config;
            badNoise.noiseStdType = "softplus";
            CHECK_THROWS_AS((StudentTeacher(probe, groups, badNoise)), ConfigurationError);

            auto noActions = config;
            noActions.numActions = 0;
            CHECK_THROWS_AS((StudentTeacher(probe, groups, noActions)), ConfigurationError);

            auto badActivation = config;
            badActivation.activation = "swishy";
            CHECK_THROWS_AS((StudentTeacher(probe, groups, badActivation)), ConfigurationError);

            ObservationMap imageProbe{{"policy", torch::zeros({1, 4})}, {"privileged", torch::zeros({1, 3, 8})}};
            CHECK_THROWS_AS((StudentTeacher(imageProbe, groups, config)), ConfigurationError);

            ObservationMap partialProbe{{"policy", torch::zeros({1, 4})}};
            CHECK_THROWS_AS((StudentTeacher(partialProbe, groups, config)), ConfigurationError);
        }

        SUBCASE("Unknown options are tolerated")
        {
            config.extraOptions = {{"rnn_type", "lstm"}, {"rnn_hidden_dim", "256"}};
            CHECK_NOTHROW((StudentTeacher(probe, groups, config)));
        }

        SUBCASE("Distribution validation is opt-in")
        {
            StudentTeacher unchecked(probe, groups, config);
            config.validateDistributionArgs = true;
            StudentTeacher checked(probe, groups, config);
            {
                torch::NoGradGuard noGrad;
                unchecked->getNoiseParameter().fill_(-1);
                checked->getNoiseParameter().fill_(-1);
            }

            auto observations = makeObservations(2);
            CHECK_NOTHROW(unchecked->act(observations));
            CHECK_THROWS_AS(checked->act(observations), std::invalid_argument);
        }
    }
}
