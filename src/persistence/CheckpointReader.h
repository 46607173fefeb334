#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "persistence/ModelSnapshot.h"

namespace cogarch {
namespace persistence {

class CheckpointReader {
public:
    explicit CheckpointReader(std::string input_path);

    bool read(ModelSnapshot& snapshot);
    std::optional<ModelSnapshot> read();

private:
    std::string input_path_;

    bool parseMetadataSection(std::istream& stream,
                              const SectionDescriptor& descriptor,
                              ModelSnapshot& snapshot);
    bool parseParameterSection(std::istream& stream,
                               const SectionDescriptor& descriptor,
                               ModelSnapshot& snapshot);
    bool parseOptimizerSection(std::istream& stream,
                               const SectionDescriptor& descriptor,
                               ModelSnapshot& snapshot);
    bool parseRandomStateSection(std::istream& stream,
                                 const SectionDescriptor& descriptor,
                                 ModelSnapshot& snapshot);
    bool parseHistorySection(std::istream& stream,
                             const SectionDescriptor& descriptor,
                             ModelSnapshot& snapshot);
};

} // namespace persistence
} // namespace cogarch
