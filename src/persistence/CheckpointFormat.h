#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cogarch {
namespace persistence {

// On-disk layout: CheckpointHeader, kSectionCount SectionDescriptors, then
// the section payloads at the offsets the descriptors record.
inline constexpr uint32_t kCheckpointFormatVersion = 1;
inline constexpr size_t kMaxTensorRank = 6;
inline constexpr std::array<char, 8> kCheckpointMagic = {'C', 'G', 'C', 'H', 'K', 'P', 'T', '1'};

enum class Endianness : uint8_t {
    Little = 0,
    Big = 1
};

enum class SectionType : uint32_t {
    Metadata = 0,
    Parameters = 1,
    Optimizer = 2,
    RandomState = 3,
    TrainingHistory = 4
};

inline constexpr uint32_t kSectionCount = 5;

// Parameters are always stored as Float32; the other tags are reserved
enum class TensorElementType : uint16_t {
    Float32 = 0,
    Float64 = 1,
    Int64 = 2
};

struct TensorDescriptor {
    TensorElementType element_type = TensorElementType::Float32;
    uint32_t rank = 0;
    uint64_t element_count = 0;
    std::array<uint64_t, kMaxTensorRank> dimensions = {0, 0, 0, 0, 0, 0};
};

struct SectionDescriptor {
    SectionType type = SectionType::Metadata;
    uint64_t offset_bytes = 0;
    uint64_t length_bytes = 0;
    uint64_t record_count = 0;
};

struct CheckpointHeader {
    std::array<char, 8> magic = kCheckpointMagic;
    uint32_t version = kCheckpointFormatVersion;
    uint32_t header_size = sizeof(CheckpointHeader);
    Endianness endianness = Endianness::Little;
    uint32_t section_count = 0;
    uint64_t creation_timestamp = 0;
    int64_t epoch = 0;
    uint64_t samples_seen = 0;
    uint64_t rng_seed = 0;
};

Endianness hostEndianness();

/**
 * @brief Check that a header was written by a compatible build on a host of
 * the same byte order
 * @param reason filled with a human readable cause when the check fails
 */
bool checkHeader(const CheckpointHeader& header, std::string* reason = nullptr);

/**
 * @brief Rank, dimension product and payload size are consistent
 */
bool isDescriptorConsistent(const TensorDescriptor& descriptor, uint64_t available_bytes);

size_t elementSize(TensorElementType type);
const char* sectionTypeToString(SectionType type);
const char* elementTypeToString(TensorElementType type);

/**
 * @brief Descriptor for a dense tensor of the given shape
 * @throws std::invalid_argument if the rank exceeds kMaxTensorRank or a
 * dimension is negative
 */
TensorDescriptor describeTensor(const std::vector<int64_t>& shape,
                                TensorElementType type = TensorElementType::Float32);

CheckpointHeader makeCheckpointHeader(int64_t epoch, uint64_t samples_seen, uint64_t rng_seed);

} // namespace persistence
} // namespace cogarch
