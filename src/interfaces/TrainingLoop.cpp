#include "interfaces/TrainingLoop.h"
#include "persistence/CheckpointReader.h"
#include "persistence/CheckpointWriter.h"
#include "utils/Logger.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace cogarch {

const char* trainingPhaseToString(TrainingLoop::TrainingPhase phase) {
    switch (phase) {
        case TrainingLoop::TrainingPhase::TRAIN_EPOCH: return "TRAIN_EPOCH";
        case TrainingLoop::TrainingPhase::VALIDATE: return "VALIDATE";
        case TrainingLoop::TrainingPhase::CHECKPOINT_DECISION: return "CHECKPOINT_DECISION";
        case TrainingLoop::TrainingPhase::EARLY_STOP_CHECK: return "EARLY_STOP_CHECK";
        case TrainingLoop::TrainingPhase::DONE: return "DONE";
    }
    return "UNKNOWN";
}

TrainingLoop::TrainingLoop(const Config& config,
                           CognitiveArchitecture model,
                           std::shared_ptr<SyntheticDataGenerator> generator,
                           torch::Device device)
    : config_(config),
      model_(std::move(model)),
      generator_(std::move(generator)),
      device_(device),
      early_stopping_(config.patience),
      shuffle_rng_(static_cast<std::mt19937::result_type>(config.seed)) {

    if (model_.is_empty()) {
        throw std::invalid_argument("TrainingLoop needs a constructed model");
    }
    if (!generator_) {
        throw std::invalid_argument("TrainingLoop needs a data generator");
    }
    if (config_.batch_size <= 0 || config_.num_epochs < 0) {
        throw std::invalid_argument("batch_size must be positive and num_epochs non-negative");
    }
    if (config_.validation_split <= 0.0 || config_.validation_split >= 1.0) {
        throw std::invalid_argument("validation_split must lie in (0, 1)");
    }

    const auto& model_config = model_->getConfig();
    if (config_.seq_length != model_config.seq_length || config_.action_dim != model_config.action_dim) {
        throw std::invalid_argument("training seq_length/action_dim (" +
                                    std::to_string(config_.seq_length) + "/" +
                                    std::to_string(config_.action_dim) +
                                    ") do not match the model (" +
                                    std::to_string(model_config.seq_length) + "/" +
                                    std::to_string(model_config.action_dim) + ")");
    }

    model_->to(device_);

    optimizer_ = std::make_unique<torch::optim::Adam>(
        model_->parameters(), torch::optim::AdamOptions(config_.learning_rate));

    PlateauScheduler::Config scheduler_config;
    scheduler_config.factor = config_.scheduler_factor;
    scheduler_config.patience = config_.scheduler_patience;
    scheduler_config.min_lr = config_.min_lr;
    scheduler_ = std::make_unique<PlateauScheduler>(*optimizer_, scheduler_config);

    log::info() << "🎓 Initialized TrainingLoop (" << model_->totalParameterCount()
                << " trainable parameters)";
}

void TrainingLoop::loadTrainingData() {
    log::info() << "📂 Generating " << config_.num_samples << " synthetic samples...";

    auto all = generator_->generate(config_.num_samples, config_.seq_length, config_.action_dim);

    const int64_t total = all.size();
    const auto val_count = static_cast<int64_t>(static_cast<double>(total) * config_.validation_split);
    const int64_t train_count = total - val_count;
    if (train_count <= 0 || val_count <= 0) {
        throw std::invalid_argument("split of " + std::to_string(total) +
                                    " samples leaves an empty training or validation set");
    }

    train_data_.images = all.images.slice(0, 0, train_count);
    train_data_.sequences = all.sequences.slice(0, 0, train_count);
    train_data_.targets = all.targets.slice(0, 0, train_count);

    val_data_.images = all.images.slice(0, train_count, total);
    val_data_.sequences = all.sequences.slice(0, train_count, total);
    val_data_.targets = all.targets.slice(0, train_count, total);

    data_loaded_ = true;
    log::info() << "✓ Loaded " << train_count << " training and " << val_count << " validation samples";
}

TrainingReport TrainingLoop::train() {
    if (!data_loaded_) {
        loadTrainingData();
    }

    log::info() << "🚀 Starting training for " << config_.num_epochs << " epochs on " << device_;
    for (const auto& [name, count] : model_->parameterCounts()) {
        log::debug() << "  " << name << ": " << count << " parameters";
    }

    if (config_.resume && next_epoch_ == 0) {
        auto status = loadCheckpoint(checkpointPath());
        if (status.loaded) {
            log::info() << "🔁 Resuming from epoch " << next_epoch_ + 1 << " (best loss " << status.loss << ")";
        }
    }
    int epoch = next_epoch_;

    TrainingReport report;
    double train_loss = 0.0;
    double val_loss = 0.0;
    double epoch_lr = learningRate();

    stop_requested_ = false;
    phase_ = epoch < config_.num_epochs ? TrainingPhase::TRAIN_EPOCH : TrainingPhase::DONE;

    while (phase_ != TrainingPhase::DONE) {
        switch (phase_) {
            case TrainingPhase::TRAIN_EPOCH:
                log::info() << "📚 Epoch " << (epoch + 1) << "/" << config_.num_epochs;
                epoch_lr = learningRate();
                train_loss = trainEpoch(epoch);
                break;

            case TrainingPhase::VALIDATE:
                val_loss = validate();
                scheduler_->step(val_loss);
                break;

            case TrainingPhase::CHECKPOINT_DECISION: {
                bool improved = early_stopping_.update(val_loss, epoch);
                history_.push_back({epoch, train_loss, val_loss, epoch_lr, improved});
                log::info() << "📊 Epoch " << (epoch + 1) << " - train loss: " << train_loss
                            << ", val loss: " << val_loss << ", lr: " << epoch_lr;
                if (improved && !saveCheckpoint(checkpointPath(), epoch, val_loss)) {
                    log::warning() << "⚠️  Validation loss improved but the checkpoint could not be saved";
                }
                break;
            }

            case TrainingPhase::EARLY_STOP_CHECK:
                ++report.epochs_run;
                if (early_stopping_.shouldStop()) {
                    log::info() << "⏹️  Early stopping after epoch " << (epoch + 1)
                                << " (no improvement for " << early_stopping_.getPatience() << " epochs)";
                    report.stopped_early = true;
                    stop_requested_ = true;
                } else if (epoch + 1 >= config_.num_epochs) {
                    stop_requested_ = true;
                }
                ++epoch;
                break;

            case TrainingPhase::DONE:
                break;
        }
        advancePhase();
    }

    next_epoch_ = epoch;

    if (config_.write_history) {
        auto history_path = std::filesystem::path(config_.checkpoint_dir) / "training_history.csv";
        if (!writeHistory(history_path.string())) {
            log::warning() << "⚠️  Training history was not written";
        }
    }

    report.best_epoch = early_stopping_.bestEpoch();
    report.best_val_loss = early_stopping_.bestLoss();
    report.history = history_;

    log::info() << "✓ Training complete! Best val loss " << report.best_val_loss
                << " at epoch " << (report.best_epoch + 1);
    return report;
}

TrainingReport TrainingLoop::continueTraining(int additional_epochs) {
    if (additional_epochs <= 0) {
        throw std::invalid_argument("additional_epochs must be positive");
    }
    if (early_stopping_.shouldStop()) {
        // Keep the best loss, give the new epochs a fresh patience window
        early_stopping_.restore(early_stopping_.bestLoss(), early_stopping_.bestEpoch());
    }
    config_.num_epochs = next_epoch_ + additional_epochs;
    return train();
}

void TrainingLoop::advancePhase() {
    switch (phase_) {
        case TrainingPhase::TRAIN_EPOCH:
            phase_ = TrainingPhase::VALIDATE;
            break;
        case TrainingPhase::VALIDATE:
            phase_ = TrainingPhase::CHECKPOINT_DECISION;
            break;
        case TrainingPhase::CHECKPOINT_DECISION:
            phase_ = TrainingPhase::EARLY_STOP_CHECK;
            break;
        case TrainingPhase::EARLY_STOP_CHECK:
            phase_ = stop_requested_ ? TrainingPhase::DONE : TrainingPhase::TRAIN_EPOCH;
            break;
        case TrainingPhase::DONE:
            break;
    }
}

double TrainingLoop::trainEpoch(int epoch) {
    if (!data_loaded_) {
        loadTrainingData();
    }

    model_->train();
    carried_knowledge_ = torch::Tensor();

    const int64_t n = train_data_.size();
    std::vector<int64_t> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), shuffle_rng_);
    auto order_tensor = torch::from_blob(order.data(), {n}, torch::kLong).clone();

    const int num_batches = static_cast<int>((n + config_.batch_size - 1) / config_.batch_size);
    double total_loss = 0.0;

    for (int batch = 0; batch < num_batches; ++batch) {
        const int64_t start = static_cast<int64_t>(batch) * config_.batch_size;
        const int64_t end = std::min<int64_t>(start + config_.batch_size, n);

        double loss = runBatch(train_data_, order_tensor.slice(0, start, end), true);
        total_loss += loss;

        if (config_.log_interval > 0 && batch % config_.log_interval == 0) {
            printProgress(epoch, batch, num_batches, loss);
        }
    }

    return total_loss / num_batches;
}

double TrainingLoop::validate() {
    if (!data_loaded_) {
        loadTrainingData();
    }

    torch::NoGradGuard no_grad;
    model_->eval();
    carried_knowledge_ = torch::Tensor();

    const int64_t n = val_data_.size();
    const int num_batches = static_cast<int>((n + config_.batch_size - 1) / config_.batch_size);
    double total_loss = 0.0;

    for (int batch = 0; batch < num_batches; ++batch) {
        const int64_t start = static_cast<int64_t>(batch) * config_.batch_size;
        const int64_t end = std::min<int64_t>(start + config_.batch_size, n);
        total_loss += runBatch(val_data_, torch::arange(start, end, torch::kLong), false);
    }

    carried_knowledge_ = torch::Tensor();
    return total_loss / num_batches;
}

double TrainingLoop::runBatch(const SyntheticBatch& data, const torch::Tensor& indices, bool training) {
    auto images = data.images.index_select(0, indices).to(device_);
    auto sequences = data.sequences.index_select(0, indices).to(device_);
    auto targets = data.targets.index_select(0, indices).to(device_);
    const int64_t batch_size = images.size(0);

    auto state = model_->initialState(batch_size);
    auto knowledge = knowledgeForBatch(batch_size);

    if (training) {
        optimizer_->zero_grad();
    }

    auto result = model_->forward(images, sequences, state, knowledge);
    auto loss = computeLoss(result, targets);

    if (training) {
        loss.total.backward();
        torch::nn::utils::clip_grad_norm_(model_->parameters(), config_.grad_clip_norm);
        optimizer_->step();
        samples_seen_ += static_cast<uint64_t>(batch_size);
    }

    rememberKnowledge(result.knowledge);
    return loss.total.item<double>();
}

torch::Tensor TrainingLoop::knowledgeForBatch(int64_t batch_size) {
    if (model_->getConfig().persist_knowledge &&
        carried_knowledge_.defined() &&
        carried_knowledge_.size(0) == batch_size) {
        return carried_knowledge_;
    }
    return model_->initialKnowledge(batch_size);
}

void TrainingLoop::rememberKnowledge(const torch::Tensor& knowledge) {
    if (model_->getConfig().persist_knowledge) {
        carried_knowledge_ = knowledge.detach();
    }
}

LossBreakdown TrainingLoop::computeLoss(const ForwardResult& result, const torch::Tensor& targets) const {
    LossBreakdown loss;
    loss.task = torch::mse_loss(result.output, targets);
    loss.ethics = config_.ethics_weight * model_->ethicalValues().abs().mean();

    const auto& h_final = std::get<0>(result.recurrent_state);
    loss.hidden = config_.hidden_penalty_weight * torch::mse_loss(h_final, torch::zeros_like(h_final));

    loss.total = loss.task + loss.ethics + loss.hidden;
    return loss;
}

ForwardResult TrainingLoop::predict(const torch::Tensor& images, const torch::Tensor& sequences) {
    torch::NoGradGuard no_grad;
    model_->eval();

    auto device_images = images.to(device_);
    auto device_sequences = sequences.to(device_);
    const int64_t batch_size = device_images.size(0);

    return model_->forward(device_images,
                           device_sequences,
                           model_->initialState(batch_size),
                           model_->initialKnowledge(batch_size));
}

bool TrainingLoop::saveCheckpoint(const std::string& path, int64_t epoch, double loss) {
    persistence::ModelSnapshot snapshot;
    snapshot.epoch = epoch;
    snapshot.loss = loss;
    snapshot.best_loss = std::min(loss, early_stopping_.bestLoss());
    snapshot.learning_rate = learningRate();
    snapshot.samples_seen = samples_seen_;

    const auto& model_config = model_->getConfig();
    snapshot.config.hidden_size = model_config.hidden_size;
    snapshot.config.action_dim = model_config.action_dim;
    snapshot.config.seq_length = model_config.seq_length;
    snapshot.config.image_size = model_config.image_size;

    snapshot.tensors = model_->captureTensors();

    try {
        std::ostringstream blob;
        torch::serialize::OutputArchive archive;
        optimizer_->save(archive);
        archive.save_to(blob);
        const std::string bytes = blob.str();
        snapshot.optimizer_state.state_blob.assign(bytes.begin(), bytes.end());
    } catch (const std::exception& e) {
        log::error() << "❌ Failed to serialize optimizer state: " << e.what();
        return false;
    }

    snapshot.scheduler.best = scheduler_->getBest();
    snapshot.scheduler.bad_epochs = scheduler_->getBadEpochs();

    snapshot.rng_state.seeds = {generator_->getSeed(), config_.seed};
    std::ostringstream shuffle_state;
    shuffle_state << shuffle_rng_;
    snapshot.rng_state.shuffle_state = shuffle_state.str();

    snapshot.history.reserve(history_.size());
    for (const auto& metrics : history_) {
        persistence::EpochRecord record;
        record.epoch = metrics.epoch;
        record.train_loss = metrics.train_loss;
        record.val_loss = metrics.val_loss;
        record.learning_rate = metrics.learning_rate;
        record.improved = metrics.improved ? 1 : 0;
        snapshot.history.push_back(record);
    }

    persistence::CheckpointWriter writer(path);
    return writer.write(snapshot);
}

CheckpointStatus TrainingLoop::loadCheckpoint(const std::string& path) {
    CheckpointStatus status;

    if (!std::filesystem::exists(path)) {
        log::warning() << "⚠️  No checkpoint found at " << path << ", starting fresh";
        return status;
    }

    persistence::CheckpointReader reader(path);
    auto snapshot = reader.read();
    if (!snapshot) {
        throw std::runtime_error("corrupt or incompatible checkpoint: " + path);
    }

    const auto& model_config = model_->getConfig();
    if (snapshot->config.hidden_size != model_config.hidden_size ||
        snapshot->config.action_dim != model_config.action_dim ||
        snapshot->config.seq_length != model_config.seq_length ||
        snapshot->config.image_size != model_config.image_size) {
        throw std::runtime_error("checkpoint " + path + " was written for a different model configuration");
    }

    if (!model_->restoreTensors(snapshot->tensors)) {
        throw std::runtime_error("checkpoint " + path + " does not match the model parameters");
    }

    const auto& blob = snapshot->optimizer_state.state_blob;
    if (!blob.empty()) {
        std::istringstream stream(std::string(blob.begin(), blob.end()));
        torch::serialize::InputArchive archive;
        archive.load_from(stream, device_);
        optimizer_->load(archive);
    }

    if (!snapshot->rng_state.seeds.empty() && snapshot->rng_state.seeds.front() != generator_->getSeed()) {
        log::warning() << "⚠️  Checkpoint was trained on data seed " << snapshot->rng_state.seeds.front()
                       << ", current seed is " << generator_->getSeed();
    }

    if (!snapshot->rng_state.shuffle_state.empty()) {
        std::istringstream shuffle_state(snapshot->rng_state.shuffle_state);
        std::mt19937 restored;
        if (!(shuffle_state >> restored)) {
            throw std::runtime_error("checkpoint " + path + " holds an unreadable shuffle state");
        }
        shuffle_rng_ = restored;
    }

    if (snapshot->scheduler.bad_epochs < 0) {
        throw std::runtime_error("checkpoint " + path + " holds a negative plateau counter");
    }
    scheduler_->restore(snapshot->scheduler.best, snapshot->scheduler.bad_epochs);
    early_stopping_.restore(snapshot->best_loss, static_cast<int>(snapshot->epoch));
    next_epoch_ = static_cast<int>(snapshot->epoch) + 1;

    samples_seen_ = snapshot->samples_seen;
    history_.clear();
    for (const auto& record : snapshot->history) {
        history_.push_back({record.epoch, record.train_loss, record.val_loss,
                            record.learning_rate, record.improved != 0});
    }

    status.epoch = snapshot->epoch;
    status.loss = snapshot->loss;
    status.loaded = true;

    log::info() << "📂 Loaded checkpoint from " << path << " (epoch " << status.epoch + 1
                << ", loss " << status.loss << ")";
    return status;
}

bool TrainingLoop::writeHistory(const std::string& path) const {
    namespace fs = std::filesystem;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            log::error() << "❌ Failed to create history directory \"" << parent.string()
                         << "\": " << ec.message();
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        log::error() << "❌ Failed to open history file: " << path;
        return false;
    }

    file << "epoch,train_loss,val_loss,learning_rate,improved\n";
    for (const auto& metrics : history_) {
        file << (metrics.epoch + 1) << ','
             << metrics.train_loss << ','
             << metrics.val_loss << ','
             << metrics.learning_rate << ','
             << (metrics.improved ? 1 : 0) << '\n';
    }

    if (!file.good()) {
        log::error() << "❌ Error while writing history file: " << path;
        return false;
    }
    log::info() << "📝 Wrote training history to " << path;
    return true;
}

std::string TrainingLoop::checkpointPath() const {
    return (std::filesystem::path(config_.checkpoint_dir) / config_.checkpoint_name).string();
}

double TrainingLoop::learningRate() const {
    return scheduler_->currentLearningRate();
}

void TrainingLoop::printProgress(int epoch, int batch, int num_batches, double loss) const {
    log::info() << "  Epoch " << (epoch + 1) << " [" << (batch + 1) << "/" << num_batches
                << "] loss: " << loss;
}

} // namespace cogarch
