#pragma once

#include <tuple>

#include <torch/torch.h>

#include "engine/ModelConfig.h"

namespace cogarch {

// (short-term h, long-term c), each [1, N, hidden]
using RecurrentState = std::tuple<torch::Tensor, torch::Tensor>;

/**
 * @brief Image + sequence encoder fused into one hidden vector
 *
 * Image path: two conv/ReLU/pool/dropout stages, adaptive pooling to a fixed
 * grid, flatten, linear. Sequence path: single-layer LSTM whose per-step
 * outputs are flattened across time and projected. Both halves are
 * concatenated and fused.
 */
class PerceptionModuleImpl : public torch::nn::Module {
public:
    explicit PerceptionModuleImpl(const ModelConfig& config);

    /**
     * @param images [N, C, S, S]
     * @param sequences [N, T, 1] or [N, T]
     * @param state recurrent state to start from
     * @return fused hidden [N, hidden] and the updated recurrent state
     */
    std::tuple<torch::Tensor, RecurrentState> forward(const torch::Tensor& images,
                                                      const torch::Tensor& sequences,
                                                      const RecurrentState& state);

    torch::Tensor encodeImages(const torch::Tensor& images);

    /**
     * @brief Bring a sequence batch to [N, T, 1], rejecting unusable shapes
     */
    torch::Tensor normalizeSequenceShape(const torch::Tensor& sequences) const;

    RecurrentState initialState(int64_t batch_size, const torch::Device& device) const;

private:
    ModelConfig config_;

    torch::nn::Sequential conv_stack_{nullptr};
    torch::nn::Linear image_projection_{nullptr};
    torch::nn::LSTM sequence_encoder_{nullptr};
    torch::nn::Linear sequence_projection_{nullptr};
    torch::nn::Linear fusion_{nullptr};
    torch::nn::Dropout fusion_dropout_{nullptr};
};
TORCH_MODULE(PerceptionModule);

} // namespace cogarch
