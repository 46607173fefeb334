#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include <torch/torch.h>

namespace cogarch {

/**
 * @brief One batch of generated training data with a shared leading dimension
 */
struct SyntheticBatch {
    torch::Tensor images;     // [N, 3, S, S] in [0, 1]
    torch::Tensor sequences;  // [N, T, 1]
    torch::Tensor targets;    // [N, A]

    int64_t size() const { return images.defined() ? images.size(0) : 0; }
};

/**
 * @brief Produces random shape images, parametric sequences and noise targets
 *
 * The targets are independent of the inputs, so the data carries no
 * learnable signal. It exists to drive the architecture end to end.
 */
class SyntheticDataGenerator {
public:
    enum class ShapeKind {
        RECTANGLE,
        ELLIPSE,
        LINE
    };

    enum class SequenceFamily {
        LINEAR,
        SINUSOIDAL,
        EXPONENTIAL,
        GAUSSIAN
    };

    struct Config {
        int image_size = 64;
        int image_channels = 3;
        int min_shapes = 1;
        int max_shapes = 5;
        float sequence_noise_scale = 0.1f;
        uint64_t seed = 42;
    };

    explicit SyntheticDataGenerator(const Config& config);
    ~SyntheticDataGenerator() = default;

    /**
     * @brief Generate images, sequences and targets for num_samples samples
     * @throws std::invalid_argument on non-positive dimensions
     * @throws std::runtime_error if sequence generation yields nothing
     */
    SyntheticBatch generate(int num_samples, int seq_length, int action_dim);

    /**
     * @brief Shape canvases as a [N, C, S, S] float tensor in [0, 1]
     */
    torch::Tensor generateImages(int num_samples);

    /**
     * @brief Standardized, noise-perturbed series as a [N, T, 1] tensor
     */
    torch::Tensor generateSequences(int num_samples, int seq_length);

    /**
     * @brief Standard normal target vectors [N, A]
     */
    torch::Tensor generateTargets(int num_samples, int action_dim);

    /**
     * @brief Raw (unstandardized) series of the given family
     */
    std::vector<float> generateSeries(SequenceFamily family, int seq_length);

    /**
     * @brief Shift to zero mean and scale to unit (population) variance
     *
     * A constant series is only centred.
     */
    static std::vector<float> standardize(const std::vector<float>& series);

    void reseed(uint64_t seed);
    uint64_t getSeed() const { return seed_; }
    const Config& getConfig() const { return config_; }

private:
    Config config_;
    uint64_t seed_;
    std::mt19937 rng_;

    std::vector<uint8_t> renderCanvas();
};

using DataConfig = SyntheticDataGenerator::Config;

const char* shapeKindToString(SyntheticDataGenerator::ShapeKind kind);
const char* sequenceFamilyToString(SyntheticDataGenerator::SequenceFamily family);

} // namespace cogarch
