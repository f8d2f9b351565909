#pragma once

#include <ATen/ATen.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace clarion::utils {

void print_tensor_shape(std::ostream& os, const at::Tensor& tensor, const std::string& delimiter);

std::string tensor_shape_as_string(const at::Tensor& tensor);

/**
 * \brief Returns true if the tensor has exactly the given shape.
 */
bool has_shape(const at::Tensor& tensor, const std::vector<int64_t>& shape);

}  // namespace clarion::utils
