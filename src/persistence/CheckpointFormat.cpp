#include "persistence/CheckpointFormat.h"

#include <chrono>
#include <cstring>
#include <stdexcept>

namespace cogarch {
namespace persistence {

Endianness hostEndianness() {
    const uint32_t marker = 0x01020304;
    unsigned char bytes[sizeof(marker)];
    std::memcpy(bytes, &marker, sizeof(marker));
    return bytes[0] == 0x04 ? Endianness::Little : Endianness::Big;
}

bool checkHeader(const CheckpointHeader& header, std::string* reason) {
    auto fail = [reason](const char* why) {
        if (reason) {
            *reason = why;
        }
        return false;
    };

    if (header.magic != kCheckpointMagic) {
        return fail("bad magic, not a CogArch checkpoint");
    }
    if (header.version == 0 || header.version > kCheckpointFormatVersion) {
        return fail("unsupported format version");
    }
    if (header.header_size != sizeof(CheckpointHeader)) {
        return fail("header size differs from this build");
    }
    if (header.endianness != hostEndianness()) {
        return fail("written on a host with a different byte order");
    }
    if (header.section_count == 0 || header.section_count > kSectionCount) {
        return fail("section count out of range");
    }
    return true;
}

bool isDescriptorConsistent(const TensorDescriptor& descriptor, uint64_t available_bytes) {
    if (descriptor.rank > kMaxTensorRank) {
        return false;
    }

    uint64_t product = 1;
    for (uint32_t d = 0; d < descriptor.rank; ++d) {
        product *= descriptor.dimensions[d];
    }
    if (product != descriptor.element_count) {
        return false;
    }

    return descriptor.element_count <= available_bytes / elementSize(descriptor.element_type);
}

size_t elementSize(TensorElementType type) {
    switch (type) {
        case TensorElementType::Float32: return sizeof(float);
        case TensorElementType::Float64: return sizeof(double);
        case TensorElementType::Int64: return sizeof(int64_t);
    }
    throw std::invalid_argument("unknown tensor element type");
}

const char* sectionTypeToString(SectionType type) {
    switch (type) {
        case SectionType::Metadata: return "Metadata";
        case SectionType::Parameters: return "Parameters";
        case SectionType::Optimizer: return "Optimizer";
        case SectionType::RandomState: return "RandomState";
        case SectionType::TrainingHistory: return "TrainingHistory";
    }
    return "Unknown";
}

const char* elementTypeToString(TensorElementType type) {
    switch (type) {
        case TensorElementType::Float32: return "float32";
        case TensorElementType::Float64: return "float64";
        case TensorElementType::Int64: return "int64";
    }
    return "unknown";
}

TensorDescriptor describeTensor(const std::vector<int64_t>& shape, TensorElementType type) {
    if (shape.size() > kMaxTensorRank) {
        throw std::invalid_argument("tensor rank " + std::to_string(shape.size()) +
                                    " exceeds the checkpoint limit of " + std::to_string(kMaxTensorRank));
    }

    TensorDescriptor descriptor;
    descriptor.element_type = type;
    descriptor.rank = static_cast<uint32_t>(shape.size());
    descriptor.element_count = 1;
    for (size_t d = 0; d < shape.size(); ++d) {
        if (shape[d] < 0) {
            throw std::invalid_argument("negative tensor dimension");
        }
        descriptor.dimensions[d] = static_cast<uint64_t>(shape[d]);
        descriptor.element_count *= descriptor.dimensions[d];
    }
    return descriptor;
}

CheckpointHeader makeCheckpointHeader(int64_t epoch, uint64_t samples_seen, uint64_t rng_seed) {
    CheckpointHeader header;
    header.endianness = hostEndianness();
    header.section_count = kSectionCount;
    header.creation_timestamp = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    header.epoch = epoch;
    header.samples_seen = samples_seen;
    header.rng_seed = rng_seed;
    return header;
}

} // namespace persistence
} // namespace cogarch
