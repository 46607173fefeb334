#include "modules/CognitiveArchitecture.h"
#include "utils/Logger.h"

#include <stdexcept>
#include <unordered_map>

namespace cogarch {

CognitiveArchitectureImpl::CognitiveArchitectureImpl(const ModelConfig& config)
    : config_(config) {
    config_.validate();

    perception_ = register_module("perception", PerceptionModule(config_));
    cognition_ = register_module("cognition", CognitionModule(config_));
    ethics_ = register_module("ethics", EthicsModule(config_));
    adaptive_learning_ = register_module("adaptive_learning", AdaptiveLearningModule(config_));
    action_generation_ = register_module("action_generation", ActionGenerationModule(config_));
    meta_cognition_ = register_module("meta_cognition", MetaCognitionModule(config_));
    output_projection_ = register_module("output_projection",
        torch::nn::Linear(config_.hidden_size, config_.action_dim));
}

ForwardResult CognitiveArchitectureImpl::forward(const torch::Tensor& images,
                                                 const torch::Tensor& sequences,
                                                 const RecurrentState& state,
                                                 const torch::Tensor& knowledge) {
    if (images.dim() == 0 || images.size(0) != sequences.size(0)) {
        throw std::invalid_argument("images and sequences must share the batch dimension");
    }
    const int64_t batch_size = images.size(0);

    RecurrentState start_state = state;
    if (!std::get<0>(start_state).defined() || !std::get<1>(start_state).defined()) {
        start_state = initialState(batch_size);
    }
    torch::Tensor start_knowledge = knowledge.defined() ? knowledge : initialKnowledge(batch_size);

    ForwardResult result;

    auto [fused, recurrent_state] = perception_->forward(images, sequences, start_state);
    result.recurrent_state = recurrent_state;

    auto [transformed, updated_knowledge] = cognition_->forward(fused, start_knowledge);
    result.knowledge = updated_knowledge;

    // First ethics pass only feeds the meta-cognition input
    result.intermediate_ethical_score = ethics_->forward(transformed);
    result.q_values = adaptive_learning_->forward(transformed);
    result.action_values = action_generation_->forward(transformed,
                                                       config_.action_primary_weight,
                                                       config_.action_secondary_weight);

    auto meta_input = torch::cat({transformed,
                                  result.intermediate_ethical_score,
                                  result.q_values,
                                  result.action_values}, 1);

    auto [meta_output, meta_state] = meta_cognition_->forward(meta_input);
    result.meta_state = meta_state;

    result.ethical_score = ethics_->forward(meta_output);
    result.output = output_projection_->forward(meta_output);
    return result;
}

RecurrentState CognitiveArchitectureImpl::initialState(int64_t batch_size) const {
    return perception_->initialState(batch_size, device());
}

torch::Tensor CognitiveArchitectureImpl::initialKnowledge(int64_t batch_size) const {
    return torch::zeros({batch_size, config_.hidden_size},
                        torch::TensorOptions().dtype(torch::kFloat32).device(device()));
}

torch::Device CognitiveArchitectureImpl::device() const {
    auto params = parameters();
    if (params.empty()) {
        return torch::Device(torch::kCPU);
    }
    return params.front().device();
}

std::map<std::string, int64_t> CognitiveArchitectureImpl::parameterCounts() const {
    std::map<std::string, int64_t> counts;
    for (const auto& child : named_children()) {
        int64_t count = 0;
        for (const auto& parameter : child.value()->parameters()) {
            if (parameter.requires_grad()) {
                count += parameter.numel();
            }
        }
        counts[child.key()] = count;
    }
    return counts;
}

int64_t CognitiveArchitectureImpl::totalParameterCount() const {
    int64_t total = 0;
    for (const auto& [name, count] : parameterCounts()) {
        total += count;
    }
    return total;
}

std::vector<persistence::TensorRecord> CognitiveArchitectureImpl::captureTensors() const {
    std::vector<persistence::TensorRecord> records;

    auto capture = [&records](const std::string& name, const torch::Tensor& tensor) {
        auto host = tensor.detach().to(torch::kCPU, torch::kFloat32).contiguous();

        persistence::TensorRecord record;
        record.name = name;
        record.descriptor = persistence::describeTensor(host.sizes().vec());
        const float* data = host.data_ptr<float>();
        record.values.assign(data, data + host.numel());
        records.push_back(std::move(record));
    };

    for (const auto& item : named_parameters(true)) {
        capture(item.key(), item.value());
    }
    for (const auto& item : named_buffers(true)) {
        capture(item.key(), item.value());
    }
    return records;
}

bool CognitiveArchitectureImpl::restoreTensors(const std::vector<persistence::TensorRecord>& records) {
    std::unordered_map<std::string, const persistence::TensorRecord*> by_name;
    for (const auto& record : records) {
        by_name[record.name] = &record;
    }

    std::vector<std::pair<std::string, torch::Tensor>> targets;
    for (auto& item : named_parameters(true)) {
        targets.emplace_back(item.key(), item.value());
    }
    for (auto& item : named_buffers(true)) {
        targets.emplace_back(item.key(), item.value());
    }

    if (targets.size() != by_name.size()) {
        log::error() << "❌ Checkpoint holds " << by_name.size() << " tensors, model expects "
                     << targets.size();
        return false;
    }

    // Validate everything before touching any tensor
    for (const auto& [name, tensor] : targets) {
        auto it = by_name.find(name);
        if (it == by_name.end()) {
            log::error() << "❌ Checkpoint has no tensor named " << name;
            return false;
        }
        const auto& descriptor = it->second->descriptor;
        if (descriptor.rank != static_cast<uint32_t>(tensor.dim()) ||
            descriptor.element_count != static_cast<uint64_t>(tensor.numel()) ||
            it->second->values.size() != static_cast<size_t>(tensor.numel())) {
            log::error() << "❌ Shape mismatch for tensor " << name;
            return false;
        }
        for (int64_t d = 0; d < tensor.dim(); ++d) {
            if (descriptor.dimensions[static_cast<size_t>(d)] != static_cast<uint64_t>(tensor.size(d))) {
                log::error() << "❌ Shape mismatch for tensor " << name << " at dimension " << d;
                return false;
            }
        }
    }

    torch::NoGradGuard no_grad;
    for (auto& [name, tensor] : targets) {
        const auto* record = by_name.at(name);
        auto source = torch::tensor(at::ArrayRef<float>(record->values), torch::kFloat32);
        tensor.copy_(source.view(tensor.sizes()));
    }
    return true;
}

} // namespace cogarch
