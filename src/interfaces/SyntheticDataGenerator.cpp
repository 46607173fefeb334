#include "interfaces/SyntheticDataGenerator.h"
#include "utils/Logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace cogarch {

namespace {

constexpr float kPi = 3.14159265358979323846f;

// Byte canvas in HWC layout with clipped fill primitives
class ShapeCanvas {
public:
    ShapeCanvas(int size, int channels)
        : size_(size), channels_(channels),
          pixels_(static_cast<size_t>(size) * size * channels, 0) {}

    void setPixel(int x, int y, const std::vector<uint8_t>& color) {
        if (x < 0 || y < 0 || x >= size_ || y >= size_) return;
        size_t base = (static_cast<size_t>(y) * size_ + x) * channels_;
        for (int c = 0; c < channels_; ++c) {
            pixels_[base + c] = color[c];
        }
    }

    void fillRect(int x0, int y0, int x1, int y1, const std::vector<uint8_t>& color) {
        x0 = std::max(0, x0);
        y0 = std::max(0, y0);
        x1 = std::min(size_ - 1, x1);
        y1 = std::min(size_ - 1, y1);
        for (int y = y0; y <= y1; ++y) {
            for (int x = x0; x <= x1; ++x) {
                setPixel(x, y, color);
            }
        }
    }

    // Filled ellipse inscribed in the bounding box
    void fillEllipse(int x0, int y0, int x1, int y1, const std::vector<uint8_t>& color) {
        float cx = 0.5f * (x0 + x1);
        float cy = 0.5f * (y0 + y1);
        float rx = std::max(0.5f, 0.5f * (x1 - x0));
        float ry = std::max(0.5f, 0.5f * (y1 - y0));

        for (int y = y0; y <= y1; ++y) {
            float dy = (y - cy) / ry;
            for (int x = x0; x <= x1; ++x) {
                float dx = (x - cx) / rx;
                if (dx * dx + dy * dy <= 1.0f) {
                    setPixel(x, y, color);
                }
            }
        }
    }

    // Bresenham line stamped with a square brush
    void drawLine(int x0, int y0, int x1, int y1, int width, const std::vector<uint8_t>& color) {
        int dx = std::abs(x1 - x0);
        int dy = std::abs(y1 - y0);
        int sx = (x0 < x1) ? 1 : -1;
        int sy = (y0 < y1) ? 1 : -1;
        int err = dx - dy;
        int half = width / 2;

        int x = x0;
        int y = y0;
        while (true) {
            for (int oy = -half; oy < width - half; ++oy) {
                for (int ox = -half; ox < width - half; ++ox) {
                    setPixel(x + ox, y + oy, color);
                }
            }

            if (x == x1 && y == y1) break;

            int e2 = 2 * err;
            if (e2 > -dy) {
                err -= dy;
                x += sx;
            }
            if (e2 < dx) {
                err += dx;
                y += sy;
            }
        }
    }

    std::vector<uint8_t> release() { return std::move(pixels_); }

private:
    int size_;
    int channels_;
    std::vector<uint8_t> pixels_;
};

} // namespace

const char* shapeKindToString(SyntheticDataGenerator::ShapeKind kind) {
    switch (kind) {
        case SyntheticDataGenerator::ShapeKind::RECTANGLE: return "rectangle";
        case SyntheticDataGenerator::ShapeKind::ELLIPSE: return "ellipse";
        case SyntheticDataGenerator::ShapeKind::LINE: return "line";
    }
    return "unknown";
}

const char* sequenceFamilyToString(SyntheticDataGenerator::SequenceFamily family) {
    switch (family) {
        case SyntheticDataGenerator::SequenceFamily::LINEAR: return "linear";
        case SyntheticDataGenerator::SequenceFamily::SINUSOIDAL: return "sinusoidal";
        case SyntheticDataGenerator::SequenceFamily::EXPONENTIAL: return "exponential";
        case SyntheticDataGenerator::SequenceFamily::GAUSSIAN: return "gaussian";
    }
    return "unknown";
}

SyntheticDataGenerator::SyntheticDataGenerator(const Config& config)
    : config_(config), seed_(config.seed), rng_(static_cast<std::mt19937::result_type>(config.seed)) {

    if (config_.image_size < 8 || config_.image_channels <= 0) {
        throw std::invalid_argument("image_size must be >= 8 and image_channels positive");
    }
    if (config_.min_shapes < 1 || config_.max_shapes < config_.min_shapes) {
        throw std::invalid_argument("shape count range is empty");
    }

    log::debug() << "Initialized SyntheticDataGenerator with image_size="
                 << config_.image_size << ", seed=" << seed_;
}

void SyntheticDataGenerator::reseed(uint64_t seed) {
    seed_ = seed;
    rng_.seed(static_cast<std::mt19937::result_type>(seed));
}

SyntheticBatch SyntheticDataGenerator::generate(int num_samples, int seq_length, int action_dim) {
    if (num_samples <= 0) {
        throw std::invalid_argument("num_samples must be positive, got " + std::to_string(num_samples));
    }
    if (action_dim <= 0) {
        throw std::invalid_argument("action_dim must be positive, got " + std::to_string(action_dim));
    }

    SyntheticBatch batch;
    batch.images = generateImages(num_samples);
    batch.sequences = generateSequences(num_samples, seq_length);
    batch.targets = generateTargets(num_samples, action_dim);

    log::info() << "📂 Generated " << num_samples << " synthetic samples (images "
                << batch.images.sizes() << ", sequences " << batch.sequences.sizes()
                << ", targets " << batch.targets.sizes() << ")";
    return batch;
}

std::vector<uint8_t> SyntheticDataGenerator::renderCanvas() {
    const int size = config_.image_size;
    ShapeCanvas canvas(size, config_.image_channels);

    std::uniform_int_distribution<int> shape_count(config_.min_shapes, config_.max_shapes);
    std::uniform_int_distribution<int> shape_kind(0, 2);
    std::uniform_int_distribution<int> coordinate(0, size - 1);
    std::uniform_int_distribution<int> channel_value(0, 255);
    std::uniform_int_distribution<int> line_width(1, 3);

    const int count = shape_count(rng_);
    for (int s = 0; s < count; ++s) {
        std::vector<uint8_t> color(config_.image_channels);
        for (auto& value : color) {
            value = static_cast<uint8_t>(channel_value(rng_));
        }

        int x0 = coordinate(rng_);
        int y0 = coordinate(rng_);
        int x1 = coordinate(rng_);
        int y1 = coordinate(rng_);

        switch (static_cast<ShapeKind>(shape_kind(rng_))) {
            case ShapeKind::RECTANGLE:
                canvas.fillRect(std::min(x0, x1), std::min(y0, y1),
                                std::max(x0, x1), std::max(y0, y1), color);
                break;
            case ShapeKind::ELLIPSE:
                canvas.fillEllipse(std::min(x0, x1), std::min(y0, y1),
                                   std::max(x0, x1), std::max(y0, y1), color);
                break;
            case ShapeKind::LINE:
                canvas.drawLine(x0, y0, x1, y1, line_width(rng_), color);
                break;
        }
    }

    return canvas.release();
}

torch::Tensor SyntheticDataGenerator::generateImages(int num_samples) {
    if (num_samples <= 0) {
        throw std::invalid_argument("num_samples must be positive, got " + std::to_string(num_samples));
    }

    const int64_t size = config_.image_size;
    const int64_t channels = config_.image_channels;
    const size_t canvas_bytes = static_cast<size_t>(size * size * channels);

    std::vector<uint8_t> pixels;
    pixels.reserve(canvas_bytes * num_samples);
    for (int i = 0; i < num_samples; ++i) {
        auto canvas = renderCanvas();
        pixels.insert(pixels.end(), canvas.begin(), canvas.end());
    }

    // NHWC bytes -> NCHW floats in [0, 1]
    auto raw = torch::from_blob(pixels.data(), {num_samples, size, size, channels}, torch::kUInt8);
    return raw.permute({0, 3, 1, 2}).to(torch::kFloat32).div(255.0).contiguous();
}

std::vector<float> SyntheticDataGenerator::generateSeries(SequenceFamily family, int seq_length) {
    std::vector<float> series(static_cast<size_t>(std::max(0, seq_length)));

    switch (family) {
        case SequenceFamily::LINEAR: {
            std::uniform_real_distribution<float> slope_dist(-1.0f, 1.0f);
            std::uniform_real_distribution<float> intercept_dist(-5.0f, 5.0f);
            float slope = slope_dist(rng_);
            float intercept = intercept_dist(rng_);
            for (int t = 0; t < seq_length; ++t) {
                series[t] = slope * t + intercept;
            }
            break;
        }
        case SequenceFamily::SINUSOIDAL: {
            std::uniform_real_distribution<float> amplitude_dist(0.5f, 2.0f);
            std::uniform_real_distribution<float> frequency_dist(0.05f, 0.5f);
            std::uniform_real_distribution<float> phase_dist(0.0f, 2.0f * kPi);
            float amplitude = amplitude_dist(rng_);
            float frequency = frequency_dist(rng_);
            float phase = phase_dist(rng_);
            for (int t = 0; t < seq_length; ++t) {
                series[t] = amplitude * std::sin(frequency * t + phase);
            }
            break;
        }
        case SequenceFamily::EXPONENTIAL: {
            std::uniform_real_distribution<float> scale_dist(0.5f, 2.0f);
            std::uniform_real_distribution<float> rate_dist(0.01f, 0.1f);
            float scale = scale_dist(rng_);
            float rate = rate_dist(rng_);
            for (int t = 0; t < seq_length; ++t) {
                series[t] = scale * std::exp(rate * t);
            }
            break;
        }
        case SequenceFamily::GAUSSIAN: {
            std::normal_distribution<float> noise(0.0f, 1.0f);
            for (auto& value : series) {
                value = noise(rng_);
            }
            break;
        }
    }

    return series;
}

std::vector<float> SyntheticDataGenerator::standardize(const std::vector<float>& series) {
    if (series.empty()) {
        return {};
    }

    double mean = std::accumulate(series.begin(), series.end(), 0.0) / series.size();
    double variance = 0.0;
    for (float value : series) {
        double diff = value - mean;
        variance += diff * diff;
    }
    variance /= series.size();
    double stddev = std::sqrt(variance);

    std::vector<float> result(series.size());
    for (size_t i = 0; i < series.size(); ++i) {
        double centred = series[i] - mean;
        result[i] = static_cast<float>(stddev > 1e-8 ? centred / stddev : centred);
    }
    return result;
}

torch::Tensor SyntheticDataGenerator::generateSequences(int num_samples, int seq_length) {
    if (num_samples <= 0 || seq_length <= 0) {
        throw std::runtime_error("Sequence generation produced no data (num_samples=" +
                                 std::to_string(num_samples) + ", seq_length=" +
                                 std::to_string(seq_length) + "); check the data configuration");
    }

    std::uniform_int_distribution<int> family_dist(0, 3);
    std::normal_distribution<float> noise(0.0f, 1.0f);

    std::vector<float> values;
    values.reserve(static_cast<size_t>(num_samples) * seq_length);
    for (int i = 0; i < num_samples; ++i) {
        auto family = static_cast<SequenceFamily>(family_dist(rng_));
        auto series = standardize(generateSeries(family, seq_length));
        for (float value : series) {
            values.push_back(value + config_.sequence_noise_scale * noise(rng_));
        }
    }

    if (values.empty()) {
        throw std::runtime_error("Sequence generation produced no data");
    }

    return torch::from_blob(values.data(), {num_samples, seq_length, 1}, torch::kFloat32).clone();
}

torch::Tensor SyntheticDataGenerator::generateTargets(int num_samples, int action_dim) {
    if (num_samples <= 0 || action_dim <= 0) {
        throw std::invalid_argument("targets need positive num_samples and action_dim");
    }

    std::normal_distribution<float> noise(0.0f, 1.0f);
    std::vector<float> values(static_cast<size_t>(num_samples) * action_dim);
    for (auto& value : values) {
        value = noise(rng_);
    }
    return torch::from_blob(values.data(), {num_samples, action_dim}, torch::kFloat32).clone();
}

} // namespace cogarch
