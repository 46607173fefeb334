#include "modules/ActionGenerationModule.h"

namespace cogarch {

ActionGenerationModuleImpl::ActionGenerationModuleImpl(const ModelConfig& config) {
    primary_ = register_module("primary", torch::nn::Linear(config.hidden_size, config.action_dim));
    secondary_ = register_module("secondary", torch::nn::Linear(config.hidden_size, config.action_dim));
}

torch::Tensor ActionGenerationModuleImpl::primaryHead(const torch::Tensor& hidden) {
    return primary_->forward(hidden);
}

torch::Tensor ActionGenerationModuleImpl::secondaryHead(const torch::Tensor& hidden) {
    return secondary_->forward(hidden);
}

torch::Tensor ActionGenerationModuleImpl::forward(const torch::Tensor& hidden,
                                                  double primary_weight,
                                                  double secondary_weight) {
    return primary_weight * primary_->forward(hidden) + secondary_weight * secondary_->forward(hidden);
}

} // namespace cogarch
