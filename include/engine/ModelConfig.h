#ifndef COGARCH_MODEL_CONFIG_H
#define COGARCH_MODEL_CONFIG_H

#include <cstdint>

namespace cogarch {

/**
 * @brief Hyperparameters shared by every module of the architecture
 */
struct ModelConfig {
    // Input geometry
    int image_channels = 3;
    int image_size = 64;
    int seq_length = 20;
    int sequence_features = 1;

    // Representation sizes
    int hidden_size = 128;
    int action_dim = 4;
    int ethics_dim = 32;

    // Perception
    int conv1_channels = 32;
    int conv2_channels = 64;
    int pooled_size = 8;
    float conv_dropout = 0.25f;
    float fusion_dropout = 0.3f;

    // Cognition
    int num_heads = 4;
    int num_transformer_layers = 2;
    int ff_dim = 512;
    float transformer_dropout = 0.1f;

    // Action blending (call-time constants, not parameters)
    float action_primary_weight = 0.7f;
    float action_secondary_weight = 0.3f;

    // Carry the knowledge vector across batches instead of zeroing it
    bool persist_knowledge = false;

    /**
     * @brief Throws std::invalid_argument on an impossible configuration
     */
    void validate() const;

    int metaInputSize() const { return hidden_size + 1 + 2 * action_dim; }
};

} // namespace cogarch

#endif // COGARCH_MODEL_CONFIG_H
