#include "modules/MetaCognitionModule.h"

#include <stdexcept>
#include <string>

namespace cogarch {

EthicalAttentionImpl::EthicalAttentionImpl(int hidden_size, int num_heads) {
    attention_ = register_module("attention", torch::nn::MultiheadAttention(
        torch::nn::MultiheadAttentionOptions(hidden_size, num_heads)));
    ethical_gate_ = register_module("ethical_gate", torch::nn::Linear(hidden_size, hidden_size));
    ethical_output_ = register_module("ethical_output", torch::nn::Linear(hidden_size, hidden_size));
}

torch::Tensor EthicalAttentionImpl::forward(const torch::Tensor& x) {
    auto attended = std::get<0>(attention_->forward(x, x, x));
    auto ethical = ethical_output_->forward(torch::sigmoid(ethical_gate_->forward(attended)));
    return attended + ethical;
}

MetaCognitionModuleImpl::MetaCognitionModuleImpl(const ModelConfig& config)
    : input_size_(config.metaInputSize()) {
    gru_ = register_module("gru", torch::nn::GRU(
        torch::nn::GRUOptions(input_size_, config.hidden_size).num_layers(1)));
    attention_ = register_module("ethical_attention",
        EthicalAttention(config.hidden_size, config.num_heads));
}

std::tuple<torch::Tensor, torch::Tensor> MetaCognitionModuleImpl::forward(const torch::Tensor& meta_input,
                                                                          const torch::Tensor& state) {
    if (meta_input.dim() != 2 || meta_input.size(1) != input_size_) {
        throw std::invalid_argument("meta input must be [N, " + std::to_string(input_size_) + "]");
    }

    // GRU and attention both run on [L=1, N, E]
    auto sequence = meta_input.unsqueeze(0);
    auto gru_result = gru_->forward(sequence, state);
    auto gru_out = std::get<0>(gru_result);
    auto gru_state = std::get<1>(gru_result);

    auto combined = attention_->forward(gru_out).squeeze(0);
    return std::make_tuple(combined, gru_state);
}

} // namespace cogarch
