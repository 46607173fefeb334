#pragma once

#include <map>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "engine/ModelConfig.h"
#include "modules/ActionGenerationModule.h"
#include "modules/AdaptiveLearningModule.h"
#include "modules/CognitionModule.h"
#include "modules/EthicsModule.h"
#include "modules/MetaCognitionModule.h"
#include "modules/PerceptionModule.h"
#include "persistence/ModelSnapshot.h"

namespace cogarch {

/**
 * @brief Everything one forward pass of the architecture produces
 *
 * The ethics module runs twice per pass. `ethical_score` is the score of the
 * meta-cognition output and is the one the loss and callers use;
 * `intermediate_ethical_score` is the score of the cognition output, which
 * only feeds the meta-cognition input.
 */
struct ForwardResult {
    torch::Tensor output;                      // [N, action_dim]
    torch::Tensor ethical_score;               // [N, 1]
    torch::Tensor intermediate_ethical_score;  // [N, 1]
    torch::Tensor knowledge;                   // [N, hidden]
    RecurrentState recurrent_state;            // perception LSTM (h, c)
    torch::Tensor meta_state;                  // [1, N, hidden], unused downstream
    torch::Tensor q_values;                    // [N, action_dim]
    torch::Tensor action_values;               // [N, action_dim]
};

/**
 * @brief Composition of all cognitive modules into one trainable network
 *
 * Data flow: image + sequence -> perception -> cognition (+ knowledge) ->
 * {ethics, Q-values, action values} -> meta-cognition -> ethics score and
 * output projection.
 */
class CognitiveArchitectureImpl : public torch::nn::Module {
public:
    explicit CognitiveArchitectureImpl(const ModelConfig& config);

    ForwardResult forward(const torch::Tensor& images,
                          const torch::Tensor& sequences,
                          const RecurrentState& state,
                          const torch::Tensor& knowledge);

    RecurrentState initialState(int64_t batch_size) const;
    torch::Tensor initialKnowledge(int64_t batch_size) const;

    /**
     * @brief Device the parameters currently live on
     */
    torch::Device device() const;

    const ModelConfig& getConfig() const { return config_; }
    const torch::Tensor& ethicalValues() const { return ethics_->ethicalValues(); }

    PerceptionModule& perception() { return perception_; }
    CognitionModule& cognition() { return cognition_; }
    EthicsModule& ethics() { return ethics_; }
    AdaptiveLearningModule& adaptiveLearning() { return adaptive_learning_; }
    ActionGenerationModule& actionGeneration() { return action_generation_; }
    MetaCognitionModule& metaCognition() { return meta_cognition_; }

    /**
     * @brief Trainable parameter count per top-level module
     */
    std::map<std::string, int64_t> parameterCounts() const;
    int64_t totalParameterCount() const;

    /**
     * @brief Copy every named parameter and buffer to host memory
     */
    std::vector<persistence::TensorRecord> captureTensors() const;

    /**
     * @brief Restore named tensors captured by captureTensors()
     * @return false if a name is missing or a shape differs
     */
    bool restoreTensors(const std::vector<persistence::TensorRecord>& records);

private:
    ModelConfig config_;

    PerceptionModule perception_{nullptr};
    CognitionModule cognition_{nullptr};
    EthicsModule ethics_{nullptr};
    AdaptiveLearningModule adaptive_learning_{nullptr};
    ActionGenerationModule action_generation_{nullptr};
    MetaCognitionModule meta_cognition_{nullptr};
    torch::nn::Linear output_projection_{nullptr};
};
TORCH_MODULE(CognitiveArchitecture);

} // namespace cogarch
