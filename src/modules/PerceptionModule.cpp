#include "modules/PerceptionModule.h"

#include <stdexcept>
#include <string>

namespace cogarch {

PerceptionModuleImpl::PerceptionModuleImpl(const ModelConfig& config)
    : config_(config) {

    conv_stack_ = register_module("conv_stack", torch::nn::Sequential(
        torch::nn::Conv2d(torch::nn::Conv2dOptions(config_.image_channels, config_.conv1_channels, 3).padding(1)),
        torch::nn::ReLU(),
        torch::nn::MaxPool2d(torch::nn::MaxPool2dOptions(2)),
        torch::nn::Dropout(torch::nn::DropoutOptions(config_.conv_dropout)),
        torch::nn::Conv2d(torch::nn::Conv2dOptions(config_.conv1_channels, config_.conv2_channels, 3).padding(1)),
        torch::nn::ReLU(),
        torch::nn::MaxPool2d(torch::nn::MaxPool2dOptions(2)),
        torch::nn::Dropout(torch::nn::DropoutOptions(config_.conv_dropout)),
        torch::nn::AdaptiveAvgPool2d(torch::nn::AdaptiveAvgPool2dOptions(config_.pooled_size)),
        torch::nn::Flatten()));

    const int64_t flattened = static_cast<int64_t>(config_.conv2_channels) *
                              config_.pooled_size * config_.pooled_size;
    image_projection_ = register_module("image_projection",
        torch::nn::Linear(flattened, config_.hidden_size));

    sequence_encoder_ = register_module("sequence_encoder", torch::nn::LSTM(
        torch::nn::LSTMOptions(config_.sequence_features, config_.hidden_size)
            .num_layers(1)
            .batch_first(true)));

    sequence_projection_ = register_module("sequence_projection",
        torch::nn::Linear(static_cast<int64_t>(config_.seq_length) * config_.hidden_size,
                          config_.hidden_size));

    fusion_ = register_module("fusion", torch::nn::Linear(2 * config_.hidden_size, config_.hidden_size));
    fusion_dropout_ = register_module("fusion_dropout",
        torch::nn::Dropout(torch::nn::DropoutOptions(config_.fusion_dropout)));
}

torch::Tensor PerceptionModuleImpl::encodeImages(const torch::Tensor& images) {
    if (images.dim() != 4 || images.size(1) != config_.image_channels) {
        throw std::invalid_argument("expected images shaped [N, " +
                                    std::to_string(config_.image_channels) + ", H, W]");
    }
    return image_projection_->forward(conv_stack_->forward(images));
}

torch::Tensor PerceptionModuleImpl::normalizeSequenceShape(const torch::Tensor& sequences) const {
    torch::Tensor shaped = sequences;
    if (shaped.dim() == 2) {
        shaped = shaped.unsqueeze(-1);
    }

    if (shaped.dim() != 3 || shaped.size(2) != config_.sequence_features) {
        throw std::invalid_argument("expected sequences shaped [N, T, " +
                                    std::to_string(config_.sequence_features) + "] or [N, T]");
    }
    if (shaped.size(1) != config_.seq_length) {
        throw std::invalid_argument("sequence length " + std::to_string(shaped.size(1)) +
                                    " does not match configured seq_length " +
                                    std::to_string(config_.seq_length));
    }
    return shaped;
}

RecurrentState PerceptionModuleImpl::initialState(int64_t batch_size, const torch::Device& device) const {
    auto options = torch::TensorOptions().dtype(torch::kFloat32).device(device);
    return std::make_tuple(torch::zeros({1, batch_size, config_.hidden_size}, options),
                           torch::zeros({1, batch_size, config_.hidden_size}, options));
}

std::tuple<torch::Tensor, RecurrentState> PerceptionModuleImpl::forward(const torch::Tensor& images,
                                                                        const torch::Tensor& sequences,
                                                                        const RecurrentState& state) {
    auto image_hidden = encodeImages(images);

    auto shaped = normalizeSequenceShape(sequences);
    auto lstm_result = sequence_encoder_->forward(shaped, state);
    auto outputs = std::get<0>(lstm_result);          // [N, T, hidden]
    RecurrentState new_state = std::get<1>(lstm_result);

    auto sequence_hidden = sequence_projection_->forward(outputs.reshape({outputs.size(0), -1}));

    auto fused = torch::relu(fusion_->forward(torch::cat({image_hidden, sequence_hidden}, 1)));
    fused = fusion_dropout_->forward(fused);

    return std::make_tuple(fused, new_state);
}

} // namespace cogarch
