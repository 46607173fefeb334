#pragma once

#include <tuple>

#include <torch/torch.h>

#include "engine/ModelConfig.h"

namespace cogarch {

/**
 * @brief Transformer reasoning stage with a residual knowledge update
 *
 * knowledge' = LayerNorm(knowledge + Linear(transformer(hidden)))
 */
class CognitionModuleImpl : public torch::nn::Module {
public:
    explicit CognitionModuleImpl(const ModelConfig& config);

    /**
     * @param hidden [N, hidden], treated as a length-1 sequence
     * @param knowledge [N, hidden] accumulated context
     * @return transformer output (pre-residual) and the updated knowledge
     */
    std::tuple<torch::Tensor, torch::Tensor> forward(const torch::Tensor& hidden,
                                                     const torch::Tensor& knowledge);

private:
    ModelConfig config_;

    torch::nn::TransformerEncoder encoder_{nullptr};
    torch::nn::Linear knowledge_projection_{nullptr};
    torch::nn::LayerNorm knowledge_norm_{nullptr};
};
TORCH_MODULE(CognitionModule);

} // namespace cogarch
