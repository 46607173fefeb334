#pragma once

#include <tuple>

#include <torch/torch.h>

#include "engine/ModelConfig.h"

namespace cogarch {

/**
 * @brief Self-attention followed by a sigmoid-gated ethical side path
 *
 * output = a + Linear_2(sigmoid(Linear_1(a))), where a = MHA(x, x, x)
 */
class EthicalAttentionImpl : public torch::nn::Module {
public:
    EthicalAttentionImpl(int hidden_size, int num_heads);

    // [L, N, hidden] -> [L, N, hidden]
    torch::Tensor forward(const torch::Tensor& x);

private:
    torch::nn::MultiheadAttention attention_{nullptr};
    torch::nn::Linear ethical_gate_{nullptr};
    torch::nn::Linear ethical_output_{nullptr};
};
TORCH_MODULE(EthicalAttention);

/**
 * @brief Meta-cognitive oversight over the concatenated module outputs
 *
 * Input is [cognition_out, ethics_score, q_values, action_values] per
 * sample, run through a single-layer GRU as a length-1 sequence and then
 * through EthicalAttention.
 */
class MetaCognitionModuleImpl : public torch::nn::Module {
public:
    explicit MetaCognitionModuleImpl(const ModelConfig& config);

    /**
     * @param meta_input [N, hidden + 1 + 2 * action_dim]
     * @param state optional GRU state [1, N, hidden]; zeros when undefined
     * @return combined vector [N, hidden] and the GRU state
     */
    std::tuple<torch::Tensor, torch::Tensor> forward(const torch::Tensor& meta_input,
                                                     const torch::Tensor& state = {});

private:
    int input_size_;
    torch::nn::GRU gru_{nullptr};
    EthicalAttention attention_{nullptr};
};
TORCH_MODULE(MetaCognitionModule);

} // namespace cogarch
