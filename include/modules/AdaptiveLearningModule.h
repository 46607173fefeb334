#pragma once

#include <torch/torch.h>

#include "engine/ModelConfig.h"

namespace cogarch {

/**
 * @brief Two-layer Q-value head with a temporal-difference loss helper
 *
 * The training loop only uses forward(); qLearningLoss() is an optional
 * reinforcement-learning capability that nothing in the default loop calls.
 */
class AdaptiveLearningModuleImpl : public torch::nn::Module {
public:
    explicit AdaptiveLearningModuleImpl(const ModelConfig& config);

    // [N, hidden] -> [N, action_dim]
    torch::Tensor forward(const torch::Tensor& state);

    /**
     * @brief Squared TD error averaged over the batch
     *
     * loss = mean((Q(s, a) - (r + gamma * max_a' Q(s', a')))^2), with the
     * next-state term computed without gradient.
     *
     * @param state [N, hidden]
     * @param action [N] int64 action indices
     * @param reward [N]
     * @param next_state [N, hidden]
     * @param gamma discount factor
     * @throws std::out_of_range if an action index is outside [0, action_dim)
     */
    torch::Tensor qLearningLoss(const torch::Tensor& state,
                                const torch::Tensor& action,
                                const torch::Tensor& reward,
                                const torch::Tensor& next_state,
                                double gamma = 0.99);

    int getActionDim() const { return action_dim_; }

private:
    int action_dim_;
    torch::nn::Linear fc1_{nullptr};
    torch::nn::Linear fc2_{nullptr};
};
TORCH_MODULE(AdaptiveLearningModule);

} // namespace cogarch
