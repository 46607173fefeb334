#pragma once

#include <torch/torch.h>

#include "utils/Logger.h"

namespace cogarch {

/**
 * @brief CUDA device 0 when libtorch sees an accelerator, otherwise the CPU
 */
inline torch::Device selectDevice() {
    if (torch::cuda::is_available()) {
        log::info() << "🎮 Using CUDA device (" << torch::cuda::device_count() << " visible)";
        return torch::Device(torch::kCUDA, 0);
    }
    log::info() << "💻 CUDA not available, using CPU";
    return torch::Device(torch::kCPU);
}

} // namespace cogarch
