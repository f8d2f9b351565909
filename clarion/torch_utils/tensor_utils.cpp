#include "torch_utils/tensor_utils.h"

#include <ostream>
#include <sstream>

namespace clarion::utils {

void print_tensor_shape(std::ostream& os, const at::Tensor& tensor, const std::string& delimiter) {
    for (size_t i = 0; i < std::size(tensor.sizes()); ++i) {
        if (i > 0) {
            os << delimiter;
        }
        os << tensor.size(i);
    }
}

std::string tensor_shape_as_string(const at::Tensor& tensor) {
    std::ostringstream oss;
    print_tensor_shape(oss, tensor, ", ");
    return oss.str();
}

bool has_shape(const at::Tensor& tensor, const std::vector<int64_t>& shape) {
    if (!tensor.defined() || (tensor.dim() != static_cast<int64_t>(std::size(shape)))) {
        return false;
    }
    for (size_t i = 0; i < std::size(shape); ++i) {
        if (tensor.size(i) != shape[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace clarion::utils
