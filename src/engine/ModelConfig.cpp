#include "engine/ModelConfig.h"

#include <stdexcept>
#include <string>

namespace cogarch {

void ModelConfig::validate() const {
    if (image_channels <= 0 || image_size < 8) {
        throw std::invalid_argument("image geometry must be at least 8x8 with one channel, got size " +
                                    std::to_string(image_size));
    }
    if (seq_length <= 0 || sequence_features <= 0) {
        throw std::invalid_argument("seq_length must be positive, got " + std::to_string(seq_length));
    }
    if (hidden_size <= 0 || action_dim <= 0 || ethics_dim <= 0) {
        throw std::invalid_argument("hidden_size, action_dim and ethics_dim must be positive");
    }
    if (num_heads <= 0 || hidden_size % num_heads != 0) {
        throw std::invalid_argument("hidden_size (" + std::to_string(hidden_size) +
                                    ") must be divisible by num_heads (" +
                                    std::to_string(num_heads) + ")");
    }
    if (num_transformer_layers <= 0 || ff_dim <= 0) {
        throw std::invalid_argument("transformer stack needs at least one layer and a positive ff_dim");
    }
    if (conv1_channels <= 0 || conv2_channels <= 0 || pooled_size <= 0) {
        throw std::invalid_argument("convolution channel counts and pooled_size must be positive");
    }
}

} // namespace cogarch
