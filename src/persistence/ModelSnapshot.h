#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "persistence/CheckpointFormat.h"

namespace cogarch {
namespace persistence {

// Host copy of one named parameter or buffer
struct TensorRecord {
    std::string name;
    TensorDescriptor descriptor;
    std::vector<float> values;
};

// Shape-determining hyperparameters, checked on restore
struct ModelConfigSnapshot {
    int32_t hidden_size = 0;
    int32_t action_dim = 0;
    int32_t seq_length = 0;
    int32_t image_size = 0;
};

struct OptimizerSnapshot {
    std::vector<uint8_t> state_blob;
};

struct RNGSnapshot {
    std::vector<uint64_t> seeds;
    std::string shuffle_state;  // textual std::mt19937 state
};

// Plateau tracking at the time of the save
struct SchedulerSnapshot {
    double best = std::numeric_limits<double>::infinity();
    int32_t bad_epochs = 0;
};

struct EpochRecord {
    int32_t epoch = 0;
    double train_loss = 0.0;
    double val_loss = 0.0;
    double learning_rate = 0.0;
    uint8_t improved = 0;
};

struct ModelSnapshot {
    uint32_t format_version = kCheckpointFormatVersion;
    int64_t epoch = 0;
    double loss = std::numeric_limits<double>::infinity();
    double best_loss = std::numeric_limits<double>::infinity();
    double learning_rate = 0.0;
    uint64_t samples_seen = 0;
    ModelConfigSnapshot config;
    SchedulerSnapshot scheduler;
    std::vector<TensorRecord> tensors;
    OptimizerSnapshot optimizer_state;
    RNGSnapshot rng_state;
    std::vector<EpochRecord> history;
};

} // namespace persistence
} // namespace cogarch
