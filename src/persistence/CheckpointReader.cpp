#include "persistence/CheckpointReader.h"
#include "utils/Logger.h"

#include <fstream>
#include <string>
#include <vector>

namespace cogarch {
namespace persistence {

namespace {

/**
 * @brief Reads from one section without ever consuming more than its
 * recorded length
 *
 * Every count taken from the file is checked against the bytes left in the
 * section before anything is allocated for it.
 */
class SectionCursor {
public:
    SectionCursor(std::istream& stream, uint64_t length)
        : stream_(stream), remaining_(length) {}

    template <typename T>
    bool read(T& value) {
        return readBytes(reinterpret_cast<char*>(&value), sizeof(T));
    }

    bool readBytes(char* destination, uint64_t size) {
        if (size > remaining_) {
            return false;
        }
        if (size > 0) {
            stream_.read(destination, static_cast<std::streamsize>(size));
            remaining_ -= size;
        }
        return stream_.good();
    }

    bool readString(std::string& value) {
        uint32_t size = 0;
        if (!read(size) || size > remaining_) {
            return false;
        }
        value.resize(size);
        return readBytes(value.data(), size);
    }

    template <typename T>
    bool readVector(std::vector<T>& values) {
        uint64_t count = 0;
        if (!read(count) || count > remaining_ / sizeof(T)) {
            return false;
        }
        values.resize(static_cast<size_t>(count));
        return readBytes(reinterpret_cast<char*>(values.data()), count * sizeof(T));
    }

    // True if `count` records of at least `min_record_bytes` each could fit
    bool canHold(uint64_t count, uint64_t min_record_bytes) const {
        return count <= remaining_ / min_record_bytes;
    }

    uint64_t remaining() const { return remaining_; }

private:
    std::istream& stream_;
    uint64_t remaining_;
};

constexpr uint64_t kMinTensorRecordBytes = sizeof(uint32_t) + sizeof(TensorDescriptor);
constexpr uint64_t kEpochRecordBytes =
    sizeof(int32_t) + 3 * sizeof(double) + sizeof(uint8_t);

} // namespace

CheckpointReader::CheckpointReader(std::string input_path)
    : input_path_(std::move(input_path)) {}

bool CheckpointReader::read(ModelSnapshot& snapshot) {
    std::ifstream stream(input_path_, std::ios::binary);
    if (!stream.is_open()) {
        log::error() << "❌ Failed to open checkpoint: " << input_path_;
        return false;
    }

    stream.seekg(0, std::ios::end);
    const auto end_position = stream.tellg();
    stream.seekg(0, std::ios::beg);
    if (end_position < 0) {
        log::error() << "❌ Cannot determine the size of checkpoint: " << input_path_;
        return false;
    }
    const auto file_size = static_cast<uint64_t>(end_position);

    CheckpointHeader header{};
    stream.read(reinterpret_cast<char*>(&header), sizeof(header));
    if (!stream.good()) {
        log::error() << "❌ Failed to read checkpoint header: " << input_path_;
        return false;
    }

    std::string reason;
    if (!checkHeader(header, &reason)) {
        log::error() << "❌ Incompatible checkpoint " << input_path_ << ": " << reason;
        return false;
    }

    std::vector<SectionDescriptor> descriptors(header.section_count);
    stream.read(reinterpret_cast<char*>(descriptors.data()),
                static_cast<std::streamsize>(descriptors.size() * sizeof(SectionDescriptor)));
    if (!stream.good()) {
        log::error() << "❌ Failed to read section descriptors: " << input_path_;
        return false;
    }

    const uint64_t payload_start =
        sizeof(CheckpointHeader) + descriptors.size() * sizeof(SectionDescriptor);
    for (const auto& descriptor : descriptors) {
        if (descriptor.offset_bytes < payload_start ||
            descriptor.offset_bytes > file_size ||
            descriptor.length_bytes > file_size - descriptor.offset_bytes) {
            log::error() << "❌ " << sectionTypeToString(descriptor.type)
                         << " section lies outside checkpoint " << input_path_;
            return false;
        }
    }

    snapshot = ModelSnapshot{};
    snapshot.format_version = header.version;
    snapshot.epoch = header.epoch;
    snapshot.samples_seen = header.samples_seen;

    bool saw_metadata = false;
    bool saw_parameters = false;

    for (const auto& descriptor : descriptors) {
        stream.seekg(static_cast<std::streamoff>(descriptor.offset_bytes), std::ios::beg);
        bool ok = true;
        switch (descriptor.type) {
            case SectionType::Metadata:
                ok = parseMetadataSection(stream, descriptor, snapshot);
                saw_metadata = ok;
                break;
            case SectionType::Parameters:
                ok = parseParameterSection(stream, descriptor, snapshot);
                saw_parameters = ok;
                break;
            case SectionType::Optimizer:
                ok = parseOptimizerSection(stream, descriptor, snapshot);
                break;
            case SectionType::RandomState:
                ok = parseRandomStateSection(stream, descriptor, snapshot);
                break;
            case SectionType::TrainingHistory:
                ok = parseHistorySection(stream, descriptor, snapshot);
                break;
            default:
                log::warning() << "⚠️  Unknown checkpoint section ignored.";
                break;
        }

        if (!ok) {
            log::error() << "❌ Corrupt " << sectionTypeToString(descriptor.type)
                         << " section in checkpoint: " << input_path_;
            return false;
        }
    }

    if (!saw_metadata || !saw_parameters) {
        log::error() << "❌ Checkpoint is missing required sections: " << input_path_;
        return false;
    }

    return true;
}

std::optional<ModelSnapshot> CheckpointReader::read() {
    ModelSnapshot snapshot;
    if (read(snapshot)) {
        return snapshot;
    }
    return std::nullopt;
}

bool CheckpointReader::parseMetadataSection(std::istream& stream,
                                            const SectionDescriptor& descriptor,
                                            ModelSnapshot& snapshot) {
    SectionCursor cursor(stream, descriptor.length_bytes);
    return cursor.read(snapshot.epoch) &&
           cursor.read(snapshot.loss) &&
           cursor.read(snapshot.best_loss) &&
           cursor.read(snapshot.learning_rate) &&
           cursor.read(snapshot.samples_seen) &&
           cursor.read(snapshot.config.hidden_size) &&
           cursor.read(snapshot.config.action_dim) &&
           cursor.read(snapshot.config.seq_length) &&
           cursor.read(snapshot.config.image_size) &&
           cursor.read(snapshot.scheduler.best) &&
           cursor.read(snapshot.scheduler.bad_epochs);
}

bool CheckpointReader::parseParameterSection(std::istream& stream,
                                             const SectionDescriptor& descriptor,
                                             ModelSnapshot& snapshot) {
    SectionCursor cursor(stream, descriptor.length_bytes);

    uint64_t tensor_count = 0;
    if (!cursor.read(tensor_count)) return false;
    if (tensor_count != descriptor.record_count ||
        !cursor.canHold(tensor_count, kMinTensorRecordBytes)) {
        return false;
    }

    snapshot.tensors.clear();
    snapshot.tensors.reserve(static_cast<size_t>(tensor_count));

    for (uint64_t i = 0; i < tensor_count; ++i) {
        TensorRecord record;
        if (!cursor.readString(record.name)) return false;
        if (!cursor.read(record.descriptor)) return false;

        const auto& tensor = record.descriptor;
        if (tensor.element_type != TensorElementType::Float32 ||
            !isDescriptorConsistent(tensor, cursor.remaining())) {
            log::error() << "❌ Bad descriptor for tensor " << record.name << " ("
                         << elementTypeToString(tensor.element_type) << ", rank " << tensor.rank << ")";
            return false;
        }

        record.values.resize(static_cast<size_t>(tensor.element_count));
        if (!cursor.readBytes(reinterpret_cast<char*>(record.values.data()),
                              tensor.element_count * sizeof(float))) {
            return false;
        }
        snapshot.tensors.push_back(std::move(record));
    }

    return true;
}

bool CheckpointReader::parseOptimizerSection(std::istream& stream,
                                             const SectionDescriptor& descriptor,
                                             ModelSnapshot& snapshot) {
    SectionCursor cursor(stream, descriptor.length_bytes);
    return cursor.readVector(snapshot.optimizer_state.state_blob);
}

bool CheckpointReader::parseRandomStateSection(std::istream& stream,
                                               const SectionDescriptor& descriptor,
                                               ModelSnapshot& snapshot) {
    SectionCursor cursor(stream, descriptor.length_bytes);
    return cursor.readVector(snapshot.rng_state.seeds) &&
           cursor.readString(snapshot.rng_state.shuffle_state);
}

bool CheckpointReader::parseHistorySection(std::istream& stream,
                                           const SectionDescriptor& descriptor,
                                           ModelSnapshot& snapshot) {
    SectionCursor cursor(stream, descriptor.length_bytes);

    uint64_t count = 0;
    if (!cursor.read(count) || !cursor.canHold(count, kEpochRecordBytes)) return false;

    snapshot.history.clear();
    snapshot.history.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        EpochRecord record;
        bool ok = cursor.read(record.epoch) &&
                  cursor.read(record.train_loss) &&
                  cursor.read(record.val_loss) &&
                  cursor.read(record.learning_rate) &&
                  cursor.read(record.improved);
        if (!ok) return false;
        snapshot.history.push_back(record);
    }
    return true;
}

} // namespace persistence
} // namespace cogarch
