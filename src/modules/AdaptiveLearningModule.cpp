#include "modules/AdaptiveLearningModule.h"

#include <stdexcept>

namespace cogarch {

AdaptiveLearningModuleImpl::AdaptiveLearningModuleImpl(const ModelConfig& config)
    : action_dim_(config.action_dim) {
    fc1_ = register_module("fc1", torch::nn::Linear(config.hidden_size, config.hidden_size));
    fc2_ = register_module("fc2", torch::nn::Linear(config.hidden_size, config.action_dim));
}

torch::Tensor AdaptiveLearningModuleImpl::forward(const torch::Tensor& state) {
    return fc2_->forward(torch::relu(fc1_->forward(state)));
}

torch::Tensor AdaptiveLearningModuleImpl::qLearningLoss(const torch::Tensor& state,
                                                        const torch::Tensor& action,
                                                        const torch::Tensor& reward,
                                                        const torch::Tensor& next_state,
                                                        double gamma) {
    auto action_index = action.to(torch::kLong).reshape({-1});
    if (action_index.numel() != state.size(0)) {
        throw std::invalid_argument("one action index is required per state");
    }
    if (action_index.numel() > 0 &&
        (action_index.min().item<int64_t>() < 0 || action_index.max().item<int64_t>() >= action_dim_)) {
        throw std::out_of_range("action index outside [0, action_dim)");
    }

    auto q_values = forward(state);
    auto q_taken = q_values.gather(1, action_index.unsqueeze(1)).squeeze(1);

    torch::Tensor td_target;
    {
        torch::NoGradGuard no_grad;
        auto next_max = std::get<0>(forward(next_state).max(1));
        td_target = reward.reshape({-1}).to(q_taken.dtype()) + gamma * next_max;
    }

    return torch::mse_loss(q_taken, td_target);
}

} // namespace cogarch
