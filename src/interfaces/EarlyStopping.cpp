#include "interfaces/EarlyStopping.h"

#include <stdexcept>

namespace cogarch {

EarlyStopping::EarlyStopping(int patience)
    : patience_(patience) {
    if (patience_ <= 0) {
        throw std::invalid_argument("early stopping patience must be positive");
    }
}

bool EarlyStopping::update(double loss, int epoch) {
    if (loss < best_loss_) {
        best_loss_ = loss;
        best_epoch_ = epoch;
        counter_ = 0;
        return true;
    }
    ++counter_;
    return false;
}

void EarlyStopping::restore(double best_loss, int best_epoch) {
    best_loss_ = best_loss;
    best_epoch_ = best_epoch;
    counter_ = 0;
}

void EarlyStopping::reset() {
    counter_ = 0;
    best_loss_ = std::numeric_limits<double>::infinity();
    best_epoch_ = -1;
}

} // namespace cogarch
