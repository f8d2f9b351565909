#include "torch_utils/torch_utils.h"

#include <spdlog/spdlog.h>
#include <torch/torch.h>

#include <algorithm>

namespace clarion::utils {

void initialise_torch() {
    // Torch spins up a thread per core for every operation that might benefit from OMP. The
    // classifier batches are small, so start from a single thread and raise it explicitly.
    torch::set_num_threads(1);

    // We don't want empty tensors to be initialised with data since we always overwrite them.
    torch::globalContext().setDeterministicFillUninitializedMemory(false);
}

void make_torch_deterministic() { torch::globalContext().setDeterministicAlgorithms(true, false); }

void set_torch_num_threads(const int num_threads) {
    const int n = std::max(1, num_threads);
    spdlog::debug("Setting the number of Torch threads to {}.", n);
    torch::set_num_threads(n);
}

}  // namespace clarion::utils
