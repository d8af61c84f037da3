// C/C++
#include <iostream>
#include <limits>

// wrfdiag
#include <utils/kernel_order.hpp>

#include "vertical_interp.hpp"

namespace wrfdiag {

VerticalInterpImpl::VerticalInterpImpl(torch::Tensor pres_,
                                       torch::Tensor level_,
                                       VerticalInterpOptions const& options_)
    : pres(pres_), level(level_), options(options_) {
  reset();
}

VerticalInterpImpl::VerticalInterpImpl(torch::Tensor pres_, double level_,
                                       VerticalInterpOptions const& options_)
    : pres(pres_),
      level(torch::tensor(level_, torch::kFloat64)),
      options(options_) {
  reset();
}

VerticalInterpImpl::VerticalInterpImpl(torch::Tensor pres_,
                                       std::vector<double> const& levels_,
                                       VerticalInterpOptions const& options_)
    : pres(pres_),
      level(torch::tensor(levels_, torch::kFloat64)),
      options(options_) {
  reset();
}

void VerticalInterpImpl::reset() {
  TORCH_CHECK_TYPE(level.defined() && level.dim() <= 1,
                   "Unavailable level type: ", level.dim(),
                   "-d tensor, expected a scalar or a sequence");
  TORCH_CHECK_VALUE(level.numel() > 0, "VerticalInterp: no target levels");
  TORCH_CHECK_VALUE(pres.defined() && pres.dim() == 3,
                    "VerticalInterp: pressure must be (nz, ny, nx), got ",
                    pres.sizes());

  level_type = level.dim() == 0 ? kScalarLevel : kLevelSequence;
  kernels = options.kernels()(level_type);

  // (nz, ny, nx) -> (nx, ny, nz)
  pres_k = register_buffer("pres_k", kernel_order(pres));
  lev_idx = register_buffer("lev_idx", kernels.find_level(pres_k, level));

  if (options.verbose()) {
    auto nmiss = (lev_idx == kLevelNotFound).sum().item<int64_t>();
    std::cout << "VerticalInterp: "
              << (level_type == kScalarLevel ? "scalar level"
                                             : "level sequence")
              << ", " << nmiss << " of " << lev_idx.numel()
              << " points outside the column" << std::endl;
  }
}

void VerticalInterpImpl::pretty_print(std::ostream& out) const {
  out << "VerticalInterp(pres=" << pres.sizes() << ", nlev=" << level.numel()
      << ")";
}

std::vector<torch::Tensor> VerticalInterpImpl::interp(
    std::vector<torch::Tensor> const& vars) const {
  TORCH_CHECK(!vars.empty(), "VerticalInterp: no variables to interpolate");

  for (size_t i = 0; i < vars.size(); ++i) {
    TORCH_CHECK(vars[i].sizes() == pres.sizes(), "VerticalInterp: variable ",
                i, " has shape ", vars[i].sizes(), ", pressure has shape ",
                pres.sizes());
  }

  std::vector<torch::Tensor> out;
  for (auto const& var : vars) {
    out.push_back(interp_one_(var));
  }
  return out;
}

torch::Tensor VerticalInterpImpl::forward(torch::Tensor var) const {
  return interp({var})[0];
}

torch::Tensor VerticalInterpImpl::interp_one_(torch::Tensor var) const {
  auto var_k = kernel_order(var.to(pres_k.dtype()));
  auto result = kernels.interp(var_k, pres_k, level, lev_idx);

  // no bracketing layer, no value
  result.masked_fill_(lev_idx == kLevelNotFound,
                      std::numeric_limits<double>::quiet_NaN());

  if (level_type == kScalarLevel) {
    // (nx, ny) -> (ny, nx)
    return result.t().contiguous();
  }

  // (nx, ny, nlev) -> (ny, nx, nlev)
  return result.permute({1, 0, 2}).contiguous();
}

}  // namespace wrfdiag
