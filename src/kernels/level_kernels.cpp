// torch
#include <ATen/TensorIterator.h>

// wrfdiag
#include <index.h>

#include "kernel_dispatch.hpp"
#include "level_kernels.hpp"

namespace wrfdiag {

namespace {

torch::Tensor find_level_impl(torch::Tensor pres, torch::Tensor levels,
                              torch::Tensor out) {
  int nz = pres.size(IVT);

  auto pc = pres.contiguous();
  auto plev = levels.to(pres.dtype()).contiguous();

  auto iter = at::TensorIteratorConfig()
                  .resize_outputs(false)
                  .check_all_same_dtype(false)
                  .declare_static_shape(pres.sizes(), /*squash_dims=*/2)
                  .add_output(out)
                  .add_input(pc)
                  .build();

  if (pres.is_cpu()) {
    call_find_level_cpu(iter, plev, nz);
  } else {
    TORCH_CHECK(false, "Unsupported device");
  }

  return out;
}

torch::Tensor interp_impl(torch::Tensor var, torch::Tensor pres,
                          torch::Tensor levels, torch::Tensor idx,
                          torch::Tensor out) {
  TORCH_CHECK(var.sizes() == pres.sizes(),
              "interpz3d: var and pres have different shapes, ", var.sizes(),
              " vs ", pres.sizes());

  auto vc = var.to(pres.dtype()).contiguous();
  auto pc = pres.contiguous();
  auto ic = idx.contiguous();
  auto plev = levels.to(pres.dtype()).contiguous();

  auto iter = at::TensorIteratorConfig()
                  .resize_outputs(false)
                  .check_all_same_dtype(false)
                  .declare_static_shape(pres.sizes(), /*squash_dims=*/2)
                  .add_output(out)
                  .add_input(vc)
                  .add_input(pc)
                  .add_input(ic)
                  .build();

  if (pres.is_cpu()) {
    call_interp_level_cpu(iter, plev);
  } else {
    TORCH_CHECK(false, "Unsupported device");
  }

  return out;
}

}  // namespace

torch::Tensor find_level_1(torch::Tensor pres, torch::Tensor level) {
  TORCH_CHECK(pres.dim() == 3, "find_level_1: pres.dim() != 3");
  TORCH_CHECK(level.dim() == 0, "find_level_1: level.dim() != 0");

  auto out = torch::empty({pres.size(IWE), pres.size(ISN)},
                          pres.options().dtype(torch::kInt64));
  find_level_impl(pres, level.reshape({1}), out.unsqueeze(-1));
  return out;
}

torch::Tensor find_level_n(torch::Tensor pres, torch::Tensor levels) {
  TORCH_CHECK(pres.dim() == 3, "find_level_n: pres.dim() != 3");
  TORCH_CHECK(levels.dim() == 1, "find_level_n: levels.dim() != 1");

  auto out = torch::empty({pres.size(IWE), pres.size(ISN), levels.size(0)},
                          pres.options().dtype(torch::kInt64));
  return find_level_impl(pres, levels, out);
}

torch::Tensor interpz3d_1(torch::Tensor var, torch::Tensor pres,
                          torch::Tensor level, torch::Tensor idx) {
  TORCH_CHECK(pres.dim() == 3, "interpz3d_1: pres.dim() != 3");
  TORCH_CHECK(level.dim() == 0, "interpz3d_1: level.dim() != 0");
  TORCH_CHECK(idx.dim() == 2, "interpz3d_1: idx.dim() != 2");

  auto out = torch::empty({pres.size(IWE), pres.size(ISN)}, pres.options());
  interp_impl(var, pres, level.reshape({1}), idx.unsqueeze(-1),
              out.unsqueeze(-1));
  return out;
}

torch::Tensor interpz3d_n(torch::Tensor var, torch::Tensor pres,
                          torch::Tensor levels, torch::Tensor idx) {
  TORCH_CHECK(pres.dim() == 3, "interpz3d_n: pres.dim() != 3");
  TORCH_CHECK(levels.dim() == 1, "interpz3d_n: levels.dim() != 1");
  TORCH_CHECK(idx.dim() == 3 && idx.size(2) == levels.size(0),
              "interpz3d_n: idx does not match levels");

  auto out = torch::empty({pres.size(IWE), pres.size(ISN), levels.size(0)},
                          pres.options());
  return interp_impl(var, pres, levels, idx, out);
}

LevelKernels level_kernels(int level_type) {
  LevelKernels kernels;

  if (level_type == kScalarLevel) {
    kernels.find_level = find_level_1;
    kernels.interp = interpz3d_1;
  } else if (level_type == kLevelSequence) {
    kernels.find_level = find_level_n;
    kernels.interp = interpz3d_n;
  } else {
    TORCH_CHECK(false, "level_kernels: unknown level type ", level_type);
  }

  return kernels;
}

}  // namespace wrfdiag
