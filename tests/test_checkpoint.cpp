#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <stdexcept>

#include <torch/torch.h>

#include "TestConfig.h"
#include "interfaces/TrainingLoop.h"
#include "persistence/CheckpointFormat.h"
#include "persistence/CheckpointReader.h"
#include "persistence/CheckpointWriter.h"

using namespace cogarch;
namespace fs = std::filesystem;

class CheckpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fixtures::scratchDirectory(::testing::UnitTest::GetInstance()->current_test_info()->name());
        path_ = (fs::path(dir_) / "model.ckpt").string();
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::unique_ptr<TrainingLoop> makeLoop(uint64_t torch_seed, const ModelConfig& model_config) {
        torch::manual_seed(torch_seed);
        auto generator = std::make_shared<SyntheticDataGenerator>(fixtures::smallDataConfig());
        return std::make_unique<TrainingLoop>(fixtures::smallTrainingConfig(dir_),
                                              CognitiveArchitecture(model_config),
                                              generator,
                                              torch::kCPU);
    }

    std::string dir_;
    std::string path_;
};

TEST_F(CheckpointTest, RoundTripRestoresParametersEpochAndLoss) {
    auto source = makeLoop(1, fixtures::smallModelConfig());
    source->trainEpoch(0);
    ASSERT_TRUE(source->saveCheckpoint(path_, 7, 0.25));

    auto target = makeLoop(2, fixtures::smallModelConfig());
    auto status = target->loadCheckpoint(path_);

    EXPECT_TRUE(status.loaded);
    EXPECT_EQ(status.epoch, 7);
    EXPECT_DOUBLE_EQ(status.loss, 0.25);
    EXPECT_EQ(target->getSamplesSeen(), source->getSamplesSeen());

    auto expected = source->getModel()->named_parameters();
    for (const auto& item : target->getModel()->named_parameters()) {
        EXPECT_TRUE(torch::equal(item.value(), expected[item.key()])) << item.key();
    }
}

TEST_F(CheckpointTest, MissingFileStartsFresh) {
    auto loop = makeLoop(1, fixtures::smallModelConfig());
    auto status = loop->loadCheckpoint((fs::path(dir_) / "absent.ckpt").string());

    EXPECT_FALSE(status.loaded);
    EXPECT_EQ(status.epoch, 0);
    EXPECT_TRUE(std::isinf(status.loss));
}

TEST_F(CheckpointTest, GarbageFileThrows) {
    fs::create_directories(dir_);
    {
        std::ofstream file(path_, std::ios::binary);
        file << "this is not a checkpoint at all, just some text padding it out";
    }

    auto loop = makeLoop(1, fixtures::smallModelConfig());
    EXPECT_THROW(loop->loadCheckpoint(path_), std::runtime_error);
}

TEST_F(CheckpointTest, TruncatedFileThrows) {
    auto loop = makeLoop(1, fixtures::smallModelConfig());
    ASSERT_TRUE(loop->saveCheckpoint(path_, 0, 1.0));
    fs::resize_file(path_, fs::file_size(path_) / 2);

    EXPECT_THROW(loop->loadCheckpoint(path_), std::runtime_error);
}

TEST_F(CheckpointTest, DifferentModelShapeThrows) {
    auto source = makeLoop(1, fixtures::smallModelConfig());
    ASSERT_TRUE(source->saveCheckpoint(path_, 3, 0.5));

    auto wider = fixtures::smallModelConfig();
    wider.hidden_size = 32;
    auto target = makeLoop(1, wider);
    EXPECT_THROW(target->loadCheckpoint(path_), std::runtime_error);
}

TEST_F(CheckpointTest, WriterAndReaderAgreeOnEverySection) {
    persistence::ModelSnapshot snapshot;
    snapshot.epoch = 12;
    snapshot.loss = 0.75;
    snapshot.best_loss = 0.5;
    snapshot.learning_rate = 5e-4;
    snapshot.samples_seen = 4096;
    snapshot.config = {16, 3, 5, 16};

    persistence::TensorRecord record;
    record.name = "layer.weight";
    record.descriptor = persistence::describeTensor({2, 3});
    record.values = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f};
    snapshot.tensors.push_back(record);

    snapshot.optimizer_state.state_blob = {0x01, 0x02, 0xff};
    snapshot.rng_state.seeds = {42, 7};
    snapshot.rng_state.shuffle_state = "5489 1 2 3";
    snapshot.scheduler.best = 0.625;
    snapshot.scheduler.bad_epochs = 2;
    snapshot.history.push_back({0, 1.5, 1.1, 1e-3, 1});
    snapshot.history.push_back({1, 1.4, 1.3, 1e-3, 0});

    persistence::CheckpointWriter writer(path_);
    ASSERT_TRUE(writer.write(snapshot));

    persistence::CheckpointReader reader(path_);
    auto loaded = reader.read();
    ASSERT_TRUE(loaded.has_value());

    EXPECT_EQ(loaded->epoch, 12);
    EXPECT_DOUBLE_EQ(loaded->loss, 0.75);
    EXPECT_DOUBLE_EQ(loaded->best_loss, 0.5);
    EXPECT_DOUBLE_EQ(loaded->learning_rate, 5e-4);
    EXPECT_EQ(loaded->samples_seen, 4096u);
    EXPECT_EQ(loaded->config.hidden_size, 16);
    EXPECT_EQ(loaded->config.image_size, 16);

    ASSERT_EQ(loaded->tensors.size(), 1u);
    EXPECT_EQ(loaded->tensors[0].name, "layer.weight");
    EXPECT_EQ(loaded->tensors[0].descriptor.rank, 2u);
    EXPECT_EQ(loaded->tensors[0].descriptor.dimensions[1], 3u);
    EXPECT_EQ(loaded->tensors[0].values, record.values);

    EXPECT_EQ(loaded->optimizer_state.state_blob, snapshot.optimizer_state.state_blob);
    EXPECT_EQ(loaded->rng_state.seeds, snapshot.rng_state.seeds);
    EXPECT_EQ(loaded->rng_state.shuffle_state, "5489 1 2 3");
    EXPECT_DOUBLE_EQ(loaded->scheduler.best, 0.625);
    EXPECT_EQ(loaded->scheduler.bad_epochs, 2);

    ASSERT_EQ(loaded->history.size(), 2u);
    EXPECT_EQ(loaded->history[1].epoch, 1);
    // Stored at full precision, 1.1 is not representable as a float
    EXPECT_EQ(loaded->history[0].val_loss, 1.1);
    EXPECT_EQ(loaded->history[1].learning_rate, 1e-3);
    EXPECT_EQ(loaded->history[0].improved, 1);
    EXPECT_EQ(loaded->history[1].improved, 0);
}

TEST_F(CheckpointTest, ReaderReportsFailureForMissingFile) {
    persistence::CheckpointReader reader((fs::path(dir_) / "nothing.ckpt").string());
    EXPECT_FALSE(reader.read().has_value());
}

TEST(CheckpointFormat, HeaderChecksRejectForeignFiles) {
    auto header = persistence::makeCheckpointHeader(4, 100, 42);
    EXPECT_EQ(header.endianness, persistence::hostEndianness());
    EXPECT_EQ(header.section_count, persistence::kSectionCount);
    EXPECT_EQ(header.epoch, 4);

    std::string reason;
    EXPECT_TRUE(persistence::checkHeader(header, &reason));

    auto newer = header;
    newer.version = persistence::kCheckpointFormatVersion + 1;
    EXPECT_FALSE(persistence::checkHeader(newer, &reason));
    EXPECT_FALSE(reason.empty());

    auto foreign = header;
    foreign.magic[0] = 'X';
    EXPECT_FALSE(persistence::checkHeader(foreign));

    auto empty = header;
    empty.section_count = 0;
    EXPECT_FALSE(persistence::checkHeader(empty));
}

TEST(CheckpointFormat, TensorDescriptors) {
    auto descriptor = persistence::describeTensor({4, 5, 6});
    EXPECT_EQ(descriptor.rank, 3u);
    EXPECT_EQ(descriptor.element_count, 120u);
    EXPECT_TRUE(persistence::isDescriptorConsistent(descriptor, 120 * sizeof(float)));
    EXPECT_FALSE(persistence::isDescriptorConsistent(descriptor, 119 * sizeof(float)));

    descriptor.element_count = 119;
    EXPECT_FALSE(persistence::isDescriptorConsistent(descriptor, 1 << 20));

    EXPECT_THROW(persistence::describeTensor({1, 1, 1, 1, 1, 1, 1}), std::invalid_argument);
    EXPECT_THROW(persistence::describeTensor({2, -1}), std::invalid_argument);

    EXPECT_STREQ(persistence::sectionTypeToString(persistence::SectionType::Parameters), "Parameters");
    EXPECT_STREQ(persistence::elementTypeToString(persistence::TensorElementType::Float32), "float32");
}

TEST_F(CheckpointTest, WriterLeavesNoStagingFileBehind) {
    persistence::ModelSnapshot snapshot;
    snapshot.epoch = 1;

    persistence::CheckpointWriter writer(path_);
    ASSERT_TRUE(writer.write(snapshot));
    EXPECT_TRUE(fs::exists(path_));
    EXPECT_FALSE(fs::exists(path_ + ".tmp"));
}

TEST_F(CheckpointTest, ReaderRejectsForeignBytes) {
    fs::create_directories(dir_);
    {
        std::ofstream out(path_, std::ios::binary);
        out << "this is not a checkpoint, just some text padded out to header length......";
    }
    persistence::CheckpointReader reader(path_);
    EXPECT_FALSE(reader.read().has_value());
}

namespace {

persistence::SectionDescriptor readDescriptor(const std::string& path, persistence::SectionType type) {
    std::ifstream in(path, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(sizeof(persistence::CheckpointHeader) +
                                         static_cast<size_t>(type) * sizeof(persistence::SectionDescriptor)));
    persistence::SectionDescriptor descriptor;
    in.read(reinterpret_cast<char*>(&descriptor), sizeof(descriptor));
    return descriptor;
}

template <typename T>
void patchAt(const std::string& path, uint64_t offset, const T& value) {
    std::fstream io(path, std::ios::binary | std::ios::in | std::ios::out);
    io.seekp(static_cast<std::streamoff>(offset));
    io.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

} // namespace

class CorruptCheckpointTest : public CheckpointTest {
protected:
    void writeValidCheckpoint() {
        persistence::ModelSnapshot snapshot;
        snapshot.epoch = 3;

        persistence::TensorRecord record;
        record.name = "w";
        record.descriptor = persistence::describeTensor({2, 2});
        record.values = {1.0f, 2.0f, 3.0f, 4.0f};
        snapshot.tensors.push_back(record);

        snapshot.rng_state.seeds = {42, 7};
        snapshot.rng_state.shuffle_state = "1 2 3";
        snapshot.history.push_back({0, 1.0, 0.9, 1e-3, 1});

        persistence::CheckpointWriter writer(path_);
        ASSERT_TRUE(writer.write(snapshot));
        ASSERT_TRUE(persistence::CheckpointReader(path_).read().has_value());
    }
};

TEST_F(CorruptCheckpointTest, HugeSeedCountIsRejectedBeforeAllocating) {
    writeValidCheckpoint();
    auto section = readDescriptor(path_, persistence::SectionType::RandomState);
    patchAt(path_, section.offset_bytes, uint64_t{1} << 32);

    EXPECT_FALSE(persistence::CheckpointReader(path_).read().has_value());
}

TEST_F(CorruptCheckpointTest, HugeStringLengthIsRejected) {
    writeValidCheckpoint();
    auto section = readDescriptor(path_, persistence::SectionType::RandomState);
    // Shuffle state length follows the seed count and two seeds
    patchAt(path_, section.offset_bytes + sizeof(uint64_t) + 2 * sizeof(uint64_t),
            std::numeric_limits<uint32_t>::max());

    EXPECT_FALSE(persistence::CheckpointReader(path_).read().has_value());
}

TEST_F(CorruptCheckpointTest, HugeHistoryCountIsRejected) {
    writeValidCheckpoint();
    auto section = readDescriptor(path_, persistence::SectionType::TrainingHistory);
    patchAt(path_, section.offset_bytes, uint64_t{1} << 40);

    EXPECT_FALSE(persistence::CheckpointReader(path_).read().has_value());
}

TEST_F(CorruptCheckpointTest, TensorCountBeyondSectionIsRejected) {
    writeValidCheckpoint();
    const uint64_t huge = uint64_t{1} << 31;

    // Keep the record count in the table consistent so only the size check can fail
    auto section = readDescriptor(path_, persistence::SectionType::Parameters);
    section.record_count = huge;
    patchAt(path_, sizeof(persistence::CheckpointHeader) +
                       static_cast<size_t>(persistence::SectionType::Parameters) *
                           sizeof(persistence::SectionDescriptor),
            section);
    patchAt(path_, section.offset_bytes, huge);

    EXPECT_FALSE(persistence::CheckpointReader(path_).read().has_value());
}

TEST_F(CorruptCheckpointTest, SectionPastEndOfFileIsRejected) {
    writeValidCheckpoint();
    auto section = readDescriptor(path_, persistence::SectionType::Optimizer);
    section.length_bytes = uint64_t{1} << 40;
    patchAt(path_, sizeof(persistence::CheckpointHeader) +
                       static_cast<size_t>(persistence::SectionType::Optimizer) *
                           sizeof(persistence::SectionDescriptor),
            section);

    EXPECT_FALSE(persistence::CheckpointReader(path_).read().has_value());
}

TEST_F(CorruptCheckpointTest, LoadCheckpointThrowsRuntimeError) {
    auto model_config = fixtures::smallModelConfig();
    auto generator = std::make_shared<SyntheticDataGenerator>(fixtures::smallDataConfig());
    TrainingLoop loop(fixtures::smallTrainingConfig(dir_), CognitiveArchitecture(model_config),
                      generator, torch::kCPU);
    ASSERT_TRUE(loop.saveCheckpoint(path_, 0, 1.0));

    auto section = readDescriptor(path_, persistence::SectionType::RandomState);
    patchAt(path_, section.offset_bytes, uint64_t{1} << 32);

    EXPECT_THROW(loop.loadCheckpoint(path_), std::runtime_error);
}
