#include "interfaces/PlateauScheduler.h"
#include "utils/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace cogarch {

PlateauScheduler::PlateauScheduler(torch::optim::Optimizer& optimizer, const Config& config)
    : optimizer_(optimizer), config_(config) {
    if (config_.factor <= 0.0 || config_.factor >= 1.0) {
        throw std::invalid_argument("plateau factor must lie in (0, 1)");
    }
    if (config_.patience < 0) {
        throw std::invalid_argument("plateau patience must be non-negative");
    }
}

bool PlateauScheduler::step(double loss) {
    if (loss < best_ * (1.0 - config_.threshold)) {
        best_ = loss;
        bad_epochs_ = 0;
        return false;
    }

    ++bad_epochs_;
    if (bad_epochs_ > config_.patience) {
        bad_epochs_ = 0;
        return reduceLearningRate();
    }
    return false;
}

void PlateauScheduler::restore(double best, int bad_epochs) {
    if (bad_epochs < 0) {
        throw std::invalid_argument("bad epoch count must be non-negative");
    }
    best_ = best;
    bad_epochs_ = bad_epochs;
}

bool PlateauScheduler::reduceLearningRate() {
    bool reduced = false;
    for (auto& group : optimizer_.param_groups()) {
        auto& options = group.options();
        const double old_lr = options.get_lr();
        const double new_lr = std::max(old_lr * config_.factor, config_.min_lr);
        if (old_lr - new_lr > config_.eps) {
            options.set_lr(new_lr);
            reduced = true;
            log::info() << "📉 Reducing learning rate " << old_lr << " -> " << new_lr;
        }
    }
    return reduced;
}

double PlateauScheduler::currentLearningRate() const {
    const auto& groups = optimizer_.param_groups();
    if (groups.empty()) {
        return 0.0;
    }
    return groups.front().options().get_lr();
}

} // namespace cogarch
