#include "modules/EthicsModule.h"

namespace cogarch {

EthicsModuleImpl::EthicsModuleImpl(const ModelConfig& config) {
    ethical_projection_ = register_module("ethical_projection",
        torch::nn::Linear(config.hidden_size, config.ethics_dim));
    score_head_ = register_module("score_head", torch::nn::Linear(config.ethics_dim, 1));
    ethical_values_ = register_parameter("ethical_values", torch::randn({config.ethics_dim}));
}

torch::Tensor EthicsModuleImpl::forward(const torch::Tensor& hidden) {
    auto projected = ethical_projection_->forward(hidden);
    return score_head_->forward(projected * ethical_values_);
}

} // namespace cogarch
