#pragma once

#include <limits>

namespace cogarch {

/**
 * @brief Tracks the best validation loss and counts epochs without improvement
 *
 * Only a strictly smaller loss counts as an improvement. If the best loss is
 * reached at epoch k, shouldStop() first returns true after epoch k + patience.
 */
class EarlyStopping {
public:
    explicit EarlyStopping(int patience);

    // Returns true when loss improved on the best seen so far
    bool update(double loss, int epoch);

    bool shouldStop() const { return counter_ >= patience_; }

    /**
     * @brief Restore tracking state from a resumed checkpoint
     */
    void restore(double best_loss, int best_epoch);
    void reset();

    double bestLoss() const { return best_loss_; }
    int bestEpoch() const { return best_epoch_; }
    int getCounter() const { return counter_; }
    int getPatience() const { return patience_; }

private:
    int patience_;
    int counter_ = 0;
    double best_loss_ = std::numeric_limits<double>::infinity();
    int best_epoch_ = -1;
};

} // namespace cogarch
