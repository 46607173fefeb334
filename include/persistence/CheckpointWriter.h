#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "persistence/CheckpointFormat.h"
#include "persistence/ModelSnapshot.h"

namespace cogarch {
namespace persistence {

/**
 * @brief Serializes a ModelSnapshot into the sectioned checkpoint format
 *
 * The file is assembled under "<path>.tmp" and renamed over the target only
 * once every section has been written, so an interrupted save never leaves a
 * truncated checkpoint behind.
 */
class CheckpointWriter {
public:
    explicit CheckpointWriter(std::string output_path);
    ~CheckpointWriter();

    bool write(const ModelSnapshot& snapshot);

    const std::string& getPath() const { return output_path_; }

private:
    std::string output_path_;
    std::string staging_path_;
    std::ofstream stream_;
    std::vector<SectionDescriptor> sections_;

    template <typename T>
    void put(const T& value) {
        stream_.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    void putString(const std::string& value);

    template <typename T>
    void putVector(const std::vector<T>& values) {
        put(static_cast<uint64_t>(values.size()));
        if (!values.empty()) {
            stream_.write(reinterpret_cast<const char*>(values.data()),
                          static_cast<std::streamsize>(values.size() * sizeof(T)));
        }
    }

    /**
     * @brief Record offset and length of whatever `body` writes
     */
    template <typename Body>
    bool section(SectionType type, uint64_t record_count, Body&& body) {
        auto& descriptor = sections_[static_cast<size_t>(type)];
        descriptor.type = type;
        descriptor.offset_bytes = static_cast<uint64_t>(stream_.tellp());
        if (!body()) {
            return false;
        }
        descriptor.record_count = record_count;
        descriptor.length_bytes = static_cast<uint64_t>(stream_.tellp()) - descriptor.offset_bytes;
        return stream_.good();
    }

    bool open(const ModelSnapshot& snapshot);
    bool writeMetadata(const ModelSnapshot& snapshot);
    bool writeParameters(const std::vector<TensorRecord>& tensors);
    bool writeOptimizer(const OptimizerSnapshot& optimizer);
    bool writeRandomState(const RNGSnapshot& rng);
    bool writeHistory(const std::vector<EpochRecord>& history);
    bool commit();
    void discard();
};

} // namespace persistence
} // namespace cogarch
