#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "interfaces/EarlyStopping.h"
#include "interfaces/PlateauScheduler.h"
#include "interfaces/SyntheticDataGenerator.h"
#include "modules/CognitiveArchitecture.h"

namespace cogarch {

/**
 * @brief The three terms of the training objective
 *
 * total = task + ethics + hidden, each term already weighted.
 */
struct LossBreakdown {
    torch::Tensor task;    // MSE(output, target)
    torch::Tensor ethics;  // weight * mean(|ethical_values|)
    torch::Tensor hidden;  // weight * MSE(h_final, 0)
    torch::Tensor total;
};

struct EpochMetrics {
    int epoch = 0;
    double train_loss = 0.0;
    double val_loss = 0.0;
    double learning_rate = 0.0;
    bool improved = false;
};

struct TrainingReport {
    int epochs_run = 0;
    int best_epoch = -1;
    double best_val_loss = std::numeric_limits<double>::infinity();
    bool stopped_early = false;
    std::vector<EpochMetrics> history;
};

struct CheckpointStatus {
    int64_t epoch = 0;
    double loss = std::numeric_limits<double>::infinity();
    bool loaded = false;
};

/**
 * @brief Train / validate / checkpoint / early-stop driver for the architecture
 *
 * Each epoch walks the phases TRAIN_EPOCH -> VALIDATE -> CHECKPOINT_DECISION
 * -> EARLY_STOP_CHECK, then either starts the next epoch or finishes.
 */
class TrainingLoop {
public:
    enum class TrainingPhase {
        TRAIN_EPOCH,
        VALIDATE,
        CHECKPOINT_DECISION,
        EARLY_STOP_CHECK,
        DONE
    };

    struct Config {
        // Dataset
        int num_samples = 1000;
        int seq_length = 20;
        int action_dim = 4;
        double validation_split = 0.2;

        // Optimisation
        int batch_size = 32;
        int num_epochs = 50;
        double learning_rate = 1e-3;
        double grad_clip_norm = 1.0;
        uint64_t seed = 42;

        // Loss weights
        double ethics_weight = 0.1;
        double hidden_penalty_weight = 0.01;

        // Early stopping and plateau schedule
        int patience = 5;
        double scheduler_factor = 0.5;
        int scheduler_patience = 3;
        double min_lr = 1e-6;

        // Persistence
        std::string checkpoint_dir = "checkpoints";
        std::string checkpoint_name = "best_model.ckpt";
        bool resume = false;
        bool write_history = true;

        int log_interval = 10;  // batches between progress lines
    };

    TrainingLoop(const Config& config,
                 CognitiveArchitecture model,
                 std::shared_ptr<SyntheticDataGenerator> generator,
                 torch::Device device);
    ~TrainingLoop() = default;

    /**
     * @brief Run the full state machine until num_epochs or early stop
     */
    TrainingReport train();

    /**
     * @brief Train for further epochs on the same data split
     *
     * The optimizer, scheduler and best validation loss carry over, so a
     * checkpoint is only replaced by a genuinely better one.
     */
    TrainingReport continueTraining(int additional_epochs);

    /**
     * @brief One shuffled pass over the training split
     * @return mean batch loss
     */
    double trainEpoch(int epoch);

    /**
     * @brief Mean composite loss over the validation split, no gradients
     */
    double validate();

    LossBreakdown computeLoss(const ForwardResult& result, const torch::Tensor& targets) const;

    /**
     * @brief Eval-mode, no-grad forward pass with fresh recurrent state
     */
    ForwardResult predict(const torch::Tensor& images, const torch::Tensor& sequences);

    bool saveCheckpoint(const std::string& path, int64_t epoch, double loss);

    /**
     * @brief Restore parameters, optimizer, scheduler, shuffle state and history
     *
     * Training then continues with the epoch after the checkpointed one.
     * A missing file logs a warning and returns loaded == false.
     * @throws std::runtime_error on a corrupt or mismatched checkpoint
     */
    CheckpointStatus loadCheckpoint(const std::string& path);

    /**
     * @brief Generate the dataset and split off the validation tail
     */
    void loadTrainingData();

    bool writeHistory(const std::string& path) const;

    std::string checkpointPath() const;
    double learningRate() const;

    const Config& getConfig() const { return config_; }
    CognitiveArchitecture& getModel() { return model_; }
    torch::optim::Adam& getOptimizer() { return *optimizer_; }
    TrainingPhase getPhase() const { return phase_; }
    const std::vector<EpochMetrics>& getHistory() const { return history_; }
    const torch::Tensor& carriedKnowledge() const { return carried_knowledge_; }
    int64_t trainingSampleCount() const { return train_data_.size(); }
    int64_t validationSampleCount() const { return val_data_.size(); }
    uint64_t getSamplesSeen() const { return samples_seen_; }
    int nextEpoch() const { return next_epoch_; }
    const EarlyStopping& getEarlyStopping() const { return early_stopping_; }
    const PlateauScheduler& getScheduler() const { return *scheduler_; }

private:
    Config config_;
    CognitiveArchitecture model_;
    std::shared_ptr<SyntheticDataGenerator> generator_;
    torch::Device device_;

    std::unique_ptr<torch::optim::Adam> optimizer_;
    std::unique_ptr<PlateauScheduler> scheduler_;
    EarlyStopping early_stopping_;

    SyntheticBatch train_data_;
    SyntheticBatch val_data_;
    bool data_loaded_ = false;

    TrainingPhase phase_ = TrainingPhase::TRAIN_EPOCH;
    bool stop_requested_ = false;
    int next_epoch_ = 0;

    torch::Tensor carried_knowledge_;
    std::mt19937 shuffle_rng_;
    uint64_t samples_seen_ = 0;
    std::vector<EpochMetrics> history_;

    void advancePhase();
    double runBatch(const SyntheticBatch& data, const torch::Tensor& indices, bool training);
    torch::Tensor knowledgeForBatch(int64_t batch_size);
    void rememberKnowledge(const torch::Tensor& knowledge);
    void printProgress(int epoch, int batch, int num_batches, double loss) const;
};

using TrainingConfig = TrainingLoop::Config;

const char* trainingPhaseToString(TrainingLoop::TrainingPhase phase);

} // namespace cogarch
