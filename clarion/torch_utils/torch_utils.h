#pragma once

namespace clarion::utils {

void initialise_torch();
void make_torch_deterministic();

/// Sets the number of intra-op threads used by the classifier.
void set_torch_num_threads(int num_threads);

}  // namespace clarion::utils
