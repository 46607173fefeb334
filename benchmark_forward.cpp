#include <chrono>
#include <exception>
#include <memory>
#include <vector>

#include <torch/torch.h>

#include "engine/Device.h"
#include "engine/ModelConfig.h"
#include "interfaces/SyntheticDataGenerator.h"
#include "modules/CognitiveArchitecture.h"
#include "utils/Logger.h"

using namespace cogarch;

namespace {

void synchronize(const torch::Device& device) {
    if (device.is_cuda()) {
        torch::cuda::synchronize();
    }
}

void benchmarkBatchSize(CognitiveArchitecture& model,
                        SyntheticDataGenerator& generator,
                        const torch::Device& device,
                        int batch_size) {
    log::info() << "========================================";
    log::info() << "Benchmarking batch size " << batch_size;
    log::info() << "========================================";

    const auto& config = model->getConfig();
    auto batch = generator.generate(batch_size, config.seq_length, config.action_dim);
    auto images = batch.images.to(device);
    auto sequences = batch.sequences.to(device);

    torch::NoGradGuard no_grad;
    model->eval();

    // Warmup
    for (int i = 0; i < 5; ++i) {
        model->forward(images, sequences, model->initialState(batch_size), model->initialKnowledge(batch_size));
    }
    synchronize(device);

    const int num_steps = 50;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < num_steps; ++i) {
        model->forward(images, sequences, model->initialState(batch_size), model->initialKnowledge(batch_size));
    }
    synchronize(device);

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    double samples_per_second = (static_cast<double>(num_steps) * batch_size) / elapsed.count();
    double ms_per_batch = (elapsed.count() * 1000.0) / num_steps;

    log::info() << "📊 Results:";
    log::info() << "   Batches: " << num_steps;
    log::info() << "   Time: " << elapsed.count() << " seconds";
    log::info() << "   Throughput: " << samples_per_second << " samples/s";
    log::info() << "   Latency: " << ms_per_batch << " ms/batch";
}

} // namespace

int main() {
    log::info() << "🧠 CogArch: Forward Pass Benchmark";

    try {
        ModelConfig model_config;
        DataConfig data_config;
        data_config.image_size = model_config.image_size;
        data_config.image_channels = model_config.image_channels;

        torch::manual_seed(0);
        torch::Device device = selectDevice();

        CognitiveArchitecture model(model_config);
        model->to(device);
        SyntheticDataGenerator generator(data_config);

        for (int batch_size : std::vector<int>{1, 8, 32, 128}) {
            benchmarkBatchSize(model, generator, device, batch_size);
        }
    } catch (const std::exception& e) {
        log::error() << "Benchmark failed: " << e.what();
        return 1;
    }

    return 0;
}
