// wrfdiag
#include "destagger.hpp"

namespace wrfdiag {
torch::Tensor destagger(torch::Tensor var, int64_t dim) {
  TORCH_CHECK(var.dim() > 0, "destagger: scalar input");

  int64_t nlvl = var.size(dim);
  TORCH_CHECK(nlvl > 1, "destagger: dimension ", dim, " has ", nlvl,
              " interfaces");

  return (var.narrow(dim, 0, nlvl - 1) + var.narrow(dim, 1, nlvl - 1)) / 2.;
}
}  // namespace wrfdiag
