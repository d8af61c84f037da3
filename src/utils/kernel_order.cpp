// C/C++
#include <vector>

// wrfdiag
#include "kernel_order.hpp"

namespace wrfdiag {
torch::Tensor kernel_order(torch::Tensor var, int ntime) {
  TORCH_CHECK(ntime >= 0 && ntime <= var.dim(), "kernel_order: ntime = ",
              ntime, " for a ", var.dim(), "-d variable");

  std::vector<int64_t> dims;
  for (int64_t i = 0; i < ntime; ++i) dims.push_back(i);
  for (int64_t i = var.dim() - 1; i >= ntime; --i) dims.push_back(i);

  return var.permute(dims).contiguous();
}
}  // namespace wrfdiag
