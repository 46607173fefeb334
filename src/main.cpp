#include <exception>
#include <memory>

#include <torch/torch.h>

#include "engine/Device.h"
#include "engine/ModelConfig.h"
#include "interfaces/SyntheticDataGenerator.h"
#include "interfaces/TrainingLoop.h"
#include "utils/Logger.h"

using namespace cogarch;

int main() {
    log::info() << "🧠 CogArch: Cognitive Architecture Training";

    try {
        // Configuration
        ModelConfig model_config;
        DataConfig data_config;
        TrainingConfig training_config;

        model_config.seq_length = training_config.seq_length;
        model_config.action_dim = training_config.action_dim;
        data_config.image_size = model_config.image_size;
        data_config.image_channels = model_config.image_channels;

        torch::manual_seed(training_config.seed);
        torch::Device device = selectDevice();

        log::info() << "🚀 Building cognitive architecture...";
        CognitiveArchitecture model(model_config);

        auto generator = std::make_shared<SyntheticDataGenerator>(data_config);
        TrainingLoop trainer(training_config, model, generator, device);

        auto report = trainer.train();

        log::info() << "✅ Finished after " << report.epochs_run << " epochs"
                    << (report.stopped_early ? " (early stop)" : "")
                    << ", best validation loss " << report.best_val_loss
                    << " at epoch " << (report.best_epoch + 1);
    } catch (const std::exception& e) {
        log::error() << "Training failed: " << e.what();
        return 1;
    }

    return 0;
}
