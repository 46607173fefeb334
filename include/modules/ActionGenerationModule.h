#pragma once

#include <torch/torch.h>

#include "engine/ModelConfig.h"

namespace cogarch {

/**
 * @brief Two independent linear action heads blended by fixed weights
 *
 * The blend weights are call-time constants, not learned parameters.
 */
class ActionGenerationModuleImpl : public torch::nn::Module {
public:
    explicit ActionGenerationModuleImpl(const ModelConfig& config);

    // [N, hidden] -> [N, action_dim]
    torch::Tensor forward(const torch::Tensor& hidden,
                          double primary_weight = 0.7,
                          double secondary_weight = 0.3);

    torch::Tensor primaryHead(const torch::Tensor& hidden);
    torch::Tensor secondaryHead(const torch::Tensor& hidden);

private:
    torch::nn::Linear primary_{nullptr};
    torch::nn::Linear secondary_{nullptr};
};
TORCH_MODULE(ActionGenerationModule);

} // namespace cogarch
