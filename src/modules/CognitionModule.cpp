#include "modules/CognitionModule.h"

#include <stdexcept>

namespace cogarch {

CognitionModuleImpl::CognitionModuleImpl(const ModelConfig& config)
    : config_(config) {

    auto layer_options = torch::nn::TransformerEncoderLayerOptions(config_.hidden_size, config_.num_heads)
        .dim_feedforward(config_.ff_dim)
        .dropout(config_.transformer_dropout);

    encoder_ = register_module("encoder", torch::nn::TransformerEncoder(
        torch::nn::TransformerEncoderOptions(layer_options, config_.num_transformer_layers)));

    knowledge_projection_ = register_module("knowledge_projection",
        torch::nn::Linear(config_.hidden_size, config_.hidden_size));
    knowledge_norm_ = register_module("knowledge_norm",
        torch::nn::LayerNorm(torch::nn::LayerNormOptions({config_.hidden_size})));
}

std::tuple<torch::Tensor, torch::Tensor> CognitionModuleImpl::forward(const torch::Tensor& hidden,
                                                                      const torch::Tensor& knowledge) {
    if (hidden.sizes() != knowledge.sizes()) {
        throw std::invalid_argument("knowledge must match the hidden batch shape");
    }

    // Encoder layers take [S, N, E]; the hidden vector is a length-1 sequence
    auto transformed = encoder_->forward(hidden.unsqueeze(0)).squeeze(0);

    auto updated_knowledge = knowledge_norm_->forward(knowledge + knowledge_projection_->forward(transformed));

    return std::make_tuple(transformed, updated_knowledge);
}

} // namespace cogarch
