#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

#include <torch/torch.h>

#include "TestConfig.h"
#include "modules/CognitiveArchitecture.h"

using namespace cogarch;

class CognitiveArchitectureTest : public ::testing::Test {
protected:
    void SetUp() override {
        torch::manual_seed(1);
        config_ = fixtures::smallModelConfig();
        images_ = torch::rand({3, 3, 16, 16});
        sequences_ = torch::randn({3, 5, 1});
    }

    ModelConfig config_;
    torch::Tensor images_;
    torch::Tensor sequences_;
};

TEST_F(CognitiveArchitectureTest, ForwardResultShapes) {
    CognitiveArchitecture model(config_);
    auto result = model->forward(images_, sequences_, model->initialState(3), model->initialKnowledge(3));

    EXPECT_EQ(result.output.sizes(), torch::IntArrayRef({3, 3}));
    EXPECT_EQ(result.ethical_score.sizes(), torch::IntArrayRef({3, 1}));
    EXPECT_EQ(result.intermediate_ethical_score.sizes(), torch::IntArrayRef({3, 1}));
    EXPECT_EQ(result.knowledge.sizes(), torch::IntArrayRef({3, 16}));
    EXPECT_EQ(std::get<0>(result.recurrent_state).sizes(), torch::IntArrayRef({1, 3, 16}));
    EXPECT_EQ(result.meta_state.sizes(), torch::IntArrayRef({1, 3, 16}));
    EXPECT_EQ(result.q_values.sizes(), torch::IntArrayRef({3, 3}));
    EXPECT_EQ(result.action_values.sizes(), torch::IntArrayRef({3, 3}));
}

TEST_F(CognitiveArchitectureTest, UndefinedStateDefaultsToZeros) {
    CognitiveArchitecture model(config_);
    model->eval();
    torch::NoGradGuard no_grad;

    auto explicit_zeros = model->forward(images_, sequences_, model->initialState(3), model->initialKnowledge(3));
    auto defaulted = model->forward(images_, sequences_, RecurrentState{}, torch::Tensor());

    EXPECT_TRUE(torch::allclose(explicit_zeros.output, defaulted.output));
    EXPECT_TRUE(torch::allclose(explicit_zeros.ethical_score, defaulted.ethical_score));
}

TEST_F(CognitiveArchitectureTest, EthicalValuesReceiveGradientFromOutput) {
    CognitiveArchitecture model(config_);
    auto result = model->forward(images_, sequences_, model->initialState(3), model->initialKnowledge(3));
    result.output.sum().backward();

    ASSERT_TRUE(model->ethicalValues().grad().defined());
    EXPECT_GT(model->ethicalValues().grad().abs().sum().item<float>(), 0.0f);
}

TEST_F(CognitiveArchitectureTest, RejectsImpossibleConfiguration) {
    auto config = config_;
    config.hidden_size = 10;  // not divisible by four heads
    EXPECT_THROW(CognitiveArchitecture{config}, std::invalid_argument);
}

TEST_F(CognitiveArchitectureTest, RejectsMismatchedBatchSizes) {
    CognitiveArchitecture model(config_);
    EXPECT_THROW(model->forward(images_, torch::randn({2, 5, 1}), RecurrentState{}, torch::Tensor()),
                 std::invalid_argument);
}

TEST_F(CognitiveArchitectureTest, ParameterCountsCoverEveryModule) {
    CognitiveArchitecture model(config_);
    auto counts = model->parameterCounts();

    std::set<std::string> names;
    for (const auto& [name, count] : counts) {
        names.insert(name);
        EXPECT_GT(count, 0) << name;
    }
    EXPECT_EQ(names, (std::set<std::string>{"perception", "cognition", "ethics", "adaptive_learning",
                                            "action_generation", "meta_cognition", "output_projection"}));

    int64_t expected = 0;
    for (const auto& parameter : model->parameters()) {
        expected += parameter.numel();
    }
    EXPECT_EQ(model->totalParameterCount(), expected);
}

TEST_F(CognitiveArchitectureTest, CapturedTensorsRestoreIntoFreshModel) {
    CognitiveArchitecture source(config_);
    torch::manual_seed(99);
    CognitiveArchitecture target(config_);

    ASSERT_TRUE(target->restoreTensors(source->captureTensors()));

    auto source_params = source->named_parameters();
    for (const auto& item : target->named_parameters()) {
        EXPECT_TRUE(torch::equal(item.value(), source_params[item.key()])) << item.key();
    }
}

TEST_F(CognitiveArchitectureTest, RestoreRejectsMissingOrMisshapenTensors) {
    CognitiveArchitecture model(config_);

    auto records = model->captureTensors();
    records.pop_back();
    EXPECT_FALSE(model->restoreTensors(records));

    auto other_config = config_;
    other_config.hidden_size = 8;
    CognitiveArchitecture other(other_config);
    EXPECT_FALSE(model->restoreTensors(other->captureTensors()));
}

TEST_F(CognitiveArchitectureTest, RestoreReadsRecordsWithoutModifyingThem) {
    CognitiveArchitecture source(config_);
    CognitiveArchitecture target(config_);

    const auto records = source->captureTensors();
    const auto pristine = records;
    ASSERT_TRUE(target->restoreTensors(records));

    ASSERT_EQ(records.size(), pristine.size());
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].values, pristine[i].values) << records[i].name;
    }

    // The descriptor alone is not enough, the payload must match too
    auto truncated = source->captureTensors();
    truncated.front().values.pop_back();
    EXPECT_FALSE(target->restoreTensors(truncated));
}
