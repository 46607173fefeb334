#pragma once

#include <torch/torch.h>

#include "engine/ModelConfig.h"

namespace cogarch {

/**
 * @brief Scores a hidden representation against a trainable ethical-values vector
 *
 * score = Linear_E->1( Linear_H->E(hidden) * ethical_values )
 *
 * The ethical values are a single shared parameter registered as
 * "ethical_values"; they change only through gradient descent. The module is
 * stateless across calls and may be applied to several hidden tensors in one
 * forward pass.
 */
class EthicsModuleImpl : public torch::nn::Module {
public:
    explicit EthicsModuleImpl(const ModelConfig& config);

    // [N, hidden] -> [N, 1]
    torch::Tensor forward(const torch::Tensor& hidden);

    const torch::Tensor& ethicalValues() const { return ethical_values_; }

private:
    torch::nn::Linear ethical_projection_{nullptr};
    torch::nn::Linear score_head_{nullptr};
    torch::Tensor ethical_values_;
};
TORCH_MODULE(EthicsModule);

} // namespace cogarch
