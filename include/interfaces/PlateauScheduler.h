#pragma once

#include <limits>

#include <torch/torch.h>

namespace cogarch {

/**
 * @brief Halve the learning rate when the monitored loss stops improving
 *
 * Mode "min" with a relative threshold: a loss counts as better only if it
 * is below best * (1 - threshold). After more than `patience` bad epochs
 * every parameter group's rate is multiplied by `factor`, clamped at
 * `min_lr`, and the bad-epoch counter is reset.
 */
class PlateauScheduler {
public:
    struct Config {
        double factor = 0.5;
        int patience = 3;
        double threshold = 1e-4;
        double min_lr = 1e-6;
        double eps = 1e-8;
    };

    PlateauScheduler(torch::optim::Optimizer& optimizer, const Config& config);

    // Returns true if the learning rate was reduced
    bool step(double loss);

    // Reinstate the plateau tracking of an interrupted run
    void restore(double best, int bad_epochs);

    double currentLearningRate() const;
    int getBadEpochs() const { return bad_epochs_; }
    double getBest() const { return best_; }
    const Config& getConfig() const { return config_; }

private:
    torch::optim::Optimizer& optimizer_;
    Config config_;
    double best_ = std::numeric_limits<double>::infinity();
    int bad_epochs_ = 0;

    bool reduceLearningRate();
};

} // namespace cogarch
