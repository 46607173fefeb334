#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "TestConfig.h"
#include "interfaces/TrainingLoop.h"
#include "persistence/CheckpointReader.h"

using namespace cogarch;
namespace fs = std::filesystem;

class TrainingLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        torch::manual_seed(5);
        dir_ = fixtures::scratchDirectory(::testing::UnitTest::GetInstance()->current_test_info()->name());
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::unique_ptr<TrainingLoop> makeLoop(const TrainingConfig& training_config,
                                           const ModelConfig& model_config) {
        auto generator = std::make_shared<SyntheticDataGenerator>(fixtures::smallDataConfig());
        return std::make_unique<TrainingLoop>(training_config, CognitiveArchitecture(model_config),
                                              generator, torch::kCPU);
    }

    std::string dir_;
};

TEST_F(TrainingLoopTest, OneEpochOnDefaultGeometryHasFiniteLosses) {
    ModelConfig model_config;
    model_config.seq_length = 10;
    model_config.action_dim = 4;

    TrainingConfig training_config;
    training_config.num_samples = 100;
    training_config.seq_length = 10;
    training_config.action_dim = 4;
    training_config.batch_size = 10;
    training_config.num_epochs = 1;
    training_config.checkpoint_dir = dir_;

    auto generator = std::make_shared<SyntheticDataGenerator>(DataConfig{});
    TrainingLoop loop(training_config, CognitiveArchitecture(model_config), generator, torch::kCPU);
    auto report = loop.train();

    ASSERT_EQ(report.history.size(), 1u);
    EXPECT_EQ(report.epochs_run, 1);
    EXPECT_FALSE(report.stopped_early);
    EXPECT_TRUE(std::isfinite(report.history[0].train_loss));
    EXPECT_TRUE(std::isfinite(report.history[0].val_loss));
    EXPECT_EQ(loop.trainingSampleCount(), 80);
    EXPECT_EQ(loop.validationSampleCount(), 20);
    EXPECT_EQ(loop.getSamplesSeen(), 80u);
    EXPECT_EQ(loop.getPhase(), TrainingLoop::TrainingPhase::DONE);

    // First epoch always improves on +inf, so a checkpoint exists
    EXPECT_TRUE(fs::exists(loop.checkpointPath()));
    EXPECT_TRUE(fs::exists(fs::path(dir_) / "training_history.csv"));
}

TEST_F(TrainingLoopTest, FrozenWeightsStopAfterPatienceEpochs) {
    auto config = fixtures::smallTrainingConfig(dir_);
    config.learning_rate = 0.0;
    config.patience = 2;
    config.num_epochs = 10;

    auto loop = makeLoop(config, fixtures::smallModelConfig());
    auto report = loop->train();

    EXPECT_TRUE(report.stopped_early);
    EXPECT_EQ(report.best_epoch, 0);
    EXPECT_EQ(report.epochs_run, 0 + 2 + 1);
    ASSERT_EQ(report.history.size(), 3u);
    EXPECT_TRUE(report.history[0].improved);
    EXPECT_FALSE(report.history[1].improved);
    EXPECT_FALSE(report.history[2].improved);
    EXPECT_DOUBLE_EQ(report.history[2].val_loss, report.history[0].val_loss);
}

TEST_F(TrainingLoopTest, HistoryCsvHasOneRowPerEpoch) {
    auto config = fixtures::smallTrainingConfig(dir_);
    config.num_epochs = 2;
    auto loop = makeLoop(config, fixtures::smallModelConfig());
    loop->train();

    std::ifstream csv(fs::path(dir_) / "training_history.csv");
    ASSERT_TRUE(csv.is_open());

    std::string line;
    std::getline(csv, line);
    EXPECT_EQ(line, "epoch,train_loss,val_loss,learning_rate,improved");

    int rows = 0;
    while (std::getline(csv, line)) {
        if (!line.empty()) {
            ++rows;
        }
    }
    EXPECT_EQ(rows, 2);
}

TEST_F(TrainingLoopTest, ResumeContinuesAfterSavedEpoch) {
    auto first_config = fixtures::smallTrainingConfig(dir_);
    auto first = makeLoop(first_config, fixtures::smallModelConfig());
    first->train();
    ASSERT_TRUE(fs::exists(first->checkpointPath()));

    auto resumed_config = first_config;
    resumed_config.resume = true;
    resumed_config.num_epochs = 2;
    auto resumed = makeLoop(resumed_config, fixtures::smallModelConfig());
    auto report = resumed->train();

    EXPECT_EQ(report.epochs_run, 1);
    ASSERT_EQ(report.history.size(), 2u);
    EXPECT_EQ(report.history.back().epoch, 1);
}

TEST_F(TrainingLoopTest, ContinuedTrainingKeepsTheBetterCheckpoint) {
    auto config = fixtures::smallTrainingConfig(dir_);
    config.learning_rate = 0.0;  // every epoch repeats the first validation loss
    auto loop = makeLoop(config, fixtures::smallModelConfig());

    auto first = loop->train();
    ASSERT_TRUE(first.history.front().improved);
    EXPECT_EQ(loop->nextEpoch(), 1);

    auto second = loop->continueTraining(2);
    EXPECT_EQ(second.epochs_run, 2);
    EXPECT_EQ(loop->nextEpoch(), 3);
    ASSERT_EQ(second.history.size(), 3u);
    EXPECT_EQ(second.history[1].epoch, 1);
    EXPECT_EQ(second.history[2].epoch, 2);
    EXPECT_FALSE(second.history[1].improved);
    EXPECT_FALSE(second.history[2].improved);

    // Same split, so the losses of separate calls are comparable
    EXPECT_DOUBLE_EQ(second.history[1].val_loss, first.history[0].val_loss);
    EXPECT_EQ(second.best_epoch, 0);

    persistence::CheckpointReader reader(loop->checkpointPath());
    auto saved = reader.read();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->epoch, 0);

    EXPECT_THROW(loop->continueTraining(0), std::invalid_argument);
}

TEST_F(TrainingLoopTest, ResumeRestoresSchedulerShuffleAndHistory) {
    auto config = fixtures::smallTrainingConfig(dir_);
    torch::manual_seed(11);
    auto original = makeLoop(config, fixtures::smallModelConfig());
    original->train();

    auto resumed = makeLoop(config, fixtures::smallModelConfig());
    auto status = resumed->loadCheckpoint(original->checkpointPath());
    ASSERT_TRUE(status.loaded);

    EXPECT_EQ(resumed->nextEpoch(), 1);
    EXPECT_DOUBLE_EQ(resumed->getScheduler().getBest(), original->getScheduler().getBest());
    EXPECT_EQ(resumed->getScheduler().getBadEpochs(), original->getScheduler().getBadEpochs());
    EXPECT_DOUBLE_EQ(resumed->getEarlyStopping().bestLoss(), original->getEarlyStopping().bestLoss());

    // Full precision survives the round trip
    ASSERT_EQ(resumed->getHistory().size(), 1u);
    EXPECT_EQ(resumed->getHistory()[0].train_loss, original->getHistory()[0].train_loss);
    EXPECT_EQ(resumed->getHistory()[0].val_loss, original->getHistory()[0].val_loss);

    // Identical weights, optimizer state, data and shuffle order give the same next epoch
    torch::manual_seed(12);
    double continued = original->trainEpoch(1);
    torch::manual_seed(12);
    double restored = resumed->trainEpoch(1);
    EXPECT_NEAR(restored, continued, 1e-6);
}

TEST_F(TrainingLoopTest, KnowledgeIsResetPerBatchByDefault) {
    auto loop = makeLoop(fixtures::smallTrainingConfig(dir_), fixtures::smallModelConfig());
    loop->trainEpoch(0);
    EXPECT_FALSE(loop->carriedKnowledge().defined());
}

TEST_F(TrainingLoopTest, PersistedKnowledgeIsCarriedDetached) {
    auto model_config = fixtures::smallModelConfig();
    model_config.persist_knowledge = true;

    auto config = fixtures::smallTrainingConfig(dir_);
    config.num_samples = 30;  // 24 training samples: batches of 10, 10, 4

    auto loop = makeLoop(config, model_config);
    loop->trainEpoch(0);

    ASSERT_TRUE(loop->carriedKnowledge().defined());
    EXPECT_EQ(loop->carriedKnowledge().size(0), 4);
    EXPECT_FALSE(loop->carriedKnowledge().requires_grad());

    // Validation starts and ends with a clean slate
    loop->validate();
    EXPECT_FALSE(loop->carriedKnowledge().defined());
}

TEST_F(TrainingLoopTest, PredictIsDeterministicInEvalMode) {
    auto loop = makeLoop(fixtures::smallTrainingConfig(dir_), fixtures::smallModelConfig());
    SyntheticDataGenerator generator(fixtures::smallDataConfig(123));
    auto batch = generator.generate(4, 5, 3);

    auto first = loop->predict(batch.images, batch.sequences);
    auto second = loop->predict(batch.images, batch.sequences);

    EXPECT_EQ(first.output.sizes(), torch::IntArrayRef({4, 3}));
    EXPECT_FALSE(first.output.requires_grad());
    EXPECT_TRUE(torch::equal(first.output, second.output));
}

TEST_F(TrainingLoopTest, EmptyValidationSplitIsRejected) {
    auto config = fixtures::smallTrainingConfig(dir_);
    config.num_samples = 2;
    auto loop = makeLoop(config, fixtures::smallModelConfig());
    EXPECT_THROW(loop->loadTrainingData(), std::invalid_argument);
}

TEST_F(TrainingLoopTest, MismatchedSequenceLengthIsRejected) {
    auto config = fixtures::smallTrainingConfig(dir_);
    config.seq_length = 7;
    EXPECT_THROW(makeLoop(config, fixtures::smallModelConfig()), std::invalid_argument);
}

TEST_F(TrainingLoopTest, PhaseNamesAreStable) {
    EXPECT_STREQ(trainingPhaseToString(TrainingLoop::TrainingPhase::TRAIN_EPOCH), "TRAIN_EPOCH");
    EXPECT_STREQ(trainingPhaseToString(TrainingLoop::TrainingPhase::EARLY_STOP_CHECK), "EARLY_STOP_CHECK");
    EXPECT_STREQ(trainingPhaseToString(TrainingLoop::TrainingPhase::DONE), "DONE");
}
