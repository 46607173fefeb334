#include "persistence/CheckpointWriter.h"
#include "utils/Logger.h"

#include <filesystem>
#include <system_error>

namespace cogarch {
namespace persistence {

namespace fs = std::filesystem;

CheckpointWriter::CheckpointWriter(std::string output_path)
    : output_path_(std::move(output_path)),
      staging_path_(output_path_ + ".tmp"),
      sections_(kSectionCount) {}

CheckpointWriter::~CheckpointWriter() {
    if (stream_.is_open()) {
        discard();
    }
}

void CheckpointWriter::putString(const std::string& value) {
    put(static_cast<uint32_t>(value.size()));
    stream_.write(value.data(), static_cast<std::streamsize>(value.size()));
}

bool CheckpointWriter::write(const ModelSnapshot& snapshot) {
    bool ok = open(snapshot) &&
              writeMetadata(snapshot) &&
              writeParameters(snapshot.tensors) &&
              writeOptimizer(snapshot.optimizer_state) &&
              writeRandomState(snapshot.rng_state) &&
              writeHistory(snapshot.history) &&
              commit();
    if (!ok) {
        discard();
    }
    return ok;
}

bool CheckpointWriter::open(const ModelSnapshot& snapshot) {
    fs::path parent = fs::path(output_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            log::error() << "❌ Cannot create checkpoint directory " << parent.string() << ": " << ec.message();
            return false;
        }
    }

    stream_.open(staging_path_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        log::error() << "❌ Cannot open " << staging_path_ << " for writing";
        return false;
    }

    const uint64_t seed = snapshot.rng_state.seeds.empty() ? 0 : snapshot.rng_state.seeds.front();
    put(makeCheckpointHeader(snapshot.epoch, snapshot.samples_seen, seed));

    // Placeholder table, rewritten by commit() once the offsets are known
    for (const auto& descriptor : sections_) {
        put(descriptor);
    }
    return stream_.good();
}

bool CheckpointWriter::writeMetadata(const ModelSnapshot& snapshot) {
    return section(SectionType::Metadata, 1, [&] {
        put(snapshot.epoch);
        put(snapshot.loss);
        put(snapshot.best_loss);
        put(snapshot.learning_rate);
        put(snapshot.samples_seen);
        put(snapshot.config.hidden_size);
        put(snapshot.config.action_dim);
        put(snapshot.config.seq_length);
        put(snapshot.config.image_size);
        put(snapshot.scheduler.best);
        put(snapshot.scheduler.bad_epochs);
        return true;
    });
}

bool CheckpointWriter::writeParameters(const std::vector<TensorRecord>& tensors) {
    return section(SectionType::Parameters, tensors.size(), [&] {
        put(static_cast<uint64_t>(tensors.size()));
        for (const auto& tensor : tensors) {
            if (tensor.descriptor.element_type != TensorElementType::Float32 ||
                tensor.descriptor.element_count != tensor.values.size()) {
                log::error() << "❌ Tensor " << tensor.name << " holds " << tensor.values.size()
                             << " values, descriptor says " << tensor.descriptor.element_count << " "
                             << elementTypeToString(tensor.descriptor.element_type);
                return false;
            }
            putString(tensor.name);
            put(tensor.descriptor);
            stream_.write(reinterpret_cast<const char*>(tensor.values.data()),
                          static_cast<std::streamsize>(tensor.values.size() * sizeof(float)));
        }
        return true;
    });
}

bool CheckpointWriter::writeOptimizer(const OptimizerSnapshot& optimizer) {
    return section(SectionType::Optimizer, optimizer.state_blob.empty() ? 0 : 1, [&] {
        putVector(optimizer.state_blob);
        return true;
    });
}

bool CheckpointWriter::writeRandomState(const RNGSnapshot& rng) {
    return section(SectionType::RandomState, rng.seeds.size(), [&] {
        putVector(rng.seeds);
        putString(rng.shuffle_state);
        return true;
    });
}

bool CheckpointWriter::writeHistory(const std::vector<EpochRecord>& history) {
    return section(SectionType::TrainingHistory, history.size(), [&] {
        put(static_cast<uint64_t>(history.size()));
        for (const auto& record : history) {
            put(record.epoch);
            put(record.train_loss);
            put(record.val_loss);
            put(record.learning_rate);
            put(record.improved);
        }
        return true;
    });
}

bool CheckpointWriter::commit() {
    stream_.seekp(static_cast<std::streamoff>(sizeof(CheckpointHeader)), std::ios::beg);
    for (const auto& descriptor : sections_) {
        put(descriptor);
    }
    stream_.close();
    if (stream_.fail()) {
        log::error() << "❌ Failed to flush checkpoint " << staging_path_;
        return false;
    }

    std::error_code ec;
    fs::rename(staging_path_, output_path_, ec);
    if (ec) {
        log::error() << "❌ Cannot move checkpoint into place at " << output_path_ << ": " << ec.message();
        return false;
    }

    log::info() << "💾 Saved checkpoint to " << output_path_;
    return true;
}

void CheckpointWriter::discard() {
    if (stream_.is_open()) {
        stream_.close();
    }
    std::error_code ec;
    fs::remove(staging_path_, ec);
    if (ec) {
        log::warning() << "⚠️  Could not remove partial checkpoint " << staging_path_ << ": " << ec.message();
    }
}

} // namespace persistence
} // namespace cogarch
