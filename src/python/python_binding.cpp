#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "engine/Device.h"
#include "engine/ModelConfig.h"
#include "interfaces/SyntheticDataGenerator.h"
#include "interfaces/TrainingLoop.h"

namespace py = pybind11;

namespace {

std::vector<std::vector<float>> toNestedList(const torch::Tensor& tensor) {
    auto host = tensor.detach().to(torch::kCPU, torch::kFloat32).contiguous();
    auto rows = host.accessor<float, 2>();

    std::vector<std::vector<float>> nested(static_cast<size_t>(rows.size(0)));
    for (int64_t i = 0; i < rows.size(0); ++i) {
        nested[static_cast<size_t>(i)].reserve(static_cast<size_t>(rows.size(1)));
        for (int64_t j = 0; j < rows.size(1); ++j) {
            nested[static_cast<size_t>(i)].push_back(rows[i][j]);
        }
    }
    return nested;
}

} // namespace

/**
 * @brief Python wrapper around the cognitive architecture and its trainer
 *
 * One trainer lives as long as the wrapper, so repeated train() calls share
 * the data split, the optimizer and the best validation loss.
 */
class CogArchModel {
public:
    CogArchModel(int hidden_size = 128, int action_dim = 4, int seq_length = 20,
                 int num_samples = 1000, int batch_size = 32, double learning_rate = 1e-3)
        : device_(cogarch::selectDevice()) {
        model_config_.hidden_size = hidden_size;
        model_config_.action_dim = action_dim;
        model_config_.seq_length = seq_length;

        training_config_.num_samples = num_samples;
        training_config_.batch_size = batch_size;
        training_config_.learning_rate = learning_rate;
        training_config_.seq_length = seq_length;
        training_config_.action_dim = action_dim;

        data_config_.image_size = model_config_.image_size;
        data_config_.image_channels = model_config_.image_channels;

        model_ = cogarch::CognitiveArchitecture(model_config_);
        generator_ = std::make_shared<cogarch::SyntheticDataGenerator>(data_config_);
        trainer_ = std::make_unique<cogarch::TrainingLoop>(training_config_, model_, generator_, device_);
    }

    /**
     * @brief Train for num_epochs and return per-epoch metrics
     */
    py::dict train(int num_epochs) {
        if (num_epochs <= 0) {
            throw std::invalid_argument("num_epochs must be positive");
        }
        auto report = trainer_->continueTraining(num_epochs);

        py::list history;
        for (const auto& metrics : report.history) {
            py::dict entry;
            entry["epoch"] = metrics.epoch;
            entry["train_loss"] = metrics.train_loss;
            entry["val_loss"] = metrics.val_loss;
            entry["learning_rate"] = metrics.learning_rate;
            entry["improved"] = metrics.improved;
            history.append(entry);
        }

        py::dict result;
        result["epochs_run"] = report.epochs_run;
        result["best_epoch"] = report.best_epoch;
        result["best_val_loss"] = report.best_val_loss;
        result["stopped_early"] = report.stopped_early;
        result["history"] = history;
        return result;
    }

    /**
     * @brief Run the model on freshly generated samples
     * @return dict with "output" [N][action_dim] and "ethical_score" [N]
     */
    py::dict predict(int num_samples) {
        auto batch = generator_->generate(num_samples, training_config_.seq_length,
                                          training_config_.action_dim);
        auto result = trainer_->predict(batch.images, batch.sequences);

        std::vector<float> scores;
        for (const auto& row : toNestedList(result.ethical_score)) {
            scores.push_back(row.front());
        }

        py::dict prediction;
        prediction["output"] = toNestedList(result.output);
        prediction["ethical_score"] = scores;
        return prediction;
    }

    // Defaults to the last finished epoch and the best validation loss so far
    bool save_checkpoint(const std::string& path, std::optional<int> epoch, std::optional<double> loss) {
        return trainer_->saveCheckpoint(path,
                                        epoch.value_or(trainer_->nextEpoch() - 1),
                                        loss.value_or(trainer_->getEarlyStopping().bestLoss()));
    }

    py::dict load_checkpoint(const std::string& path) {
        auto status = trainer_->loadCheckpoint(path);
        py::dict result;
        result["epoch"] = status.epoch;
        result["loss"] = status.loss;
        result["loaded"] = status.loaded;
        return result;
    }

    py::dict get_statistics() {
        py::dict stats;
        stats["total_parameters"] = model_->totalParameterCount();
        stats["samples_seen"] = trainer_->getSamplesSeen();
        stats["learning_rate"] = trainer_->learningRate();
        stats["epochs_recorded"] = trainer_->getHistory().size();
        stats["device"] = device_.str();

        py::dict modules;
        for (const auto& [name, count] : model_->parameterCounts()) {
            modules[name.c_str()] = count;
        }
        stats["modules"] = modules;
        return stats;
    }

private:
    torch::Device device_;
    cogarch::ModelConfig model_config_;
    cogarch::DataConfig data_config_;
    cogarch::TrainingConfig training_config_;

    cogarch::CognitiveArchitecture model_{nullptr};
    std::shared_ptr<cogarch::SyntheticDataGenerator> generator_;
    std::unique_ptr<cogarch::TrainingLoop> trainer_;
};


PYBIND11_MODULE(cogarch, m) {
    m.doc() = "CogArch cognitive architecture - Python binding for training and inference";

    py::class_<CogArchModel>(m, "CogArchModel")
        .def(py::init<int, int, int, int, int, double>(),
             py::arg("hidden_size") = 128,
             py::arg("action_dim") = 4,
             py::arg("seq_length") = 20,
             py::arg("num_samples") = 1000,
             py::arg("batch_size") = 32,
             py::arg("learning_rate") = 1e-3,
             "Build the architecture and its trainer")

        .def("train", &CogArchModel::train,
             py::arg("num_epochs"),
             "Train for the given number of epochs")

        .def("predict", &CogArchModel::predict,
             py::arg("num_samples"),
             "Predict on freshly generated samples")

        .def("save_checkpoint", &CogArchModel::save_checkpoint,
             py::arg("path"),
             py::arg("epoch") = py::none(),
             py::arg("loss") = py::none(),
             "Save a checkpoint")

        .def("load_checkpoint", &CogArchModel::load_checkpoint,
             py::arg("path"),
             "Load a checkpoint")

        .def("get_statistics", &CogArchModel::get_statistics,
             "Get model and training statistics");
}
