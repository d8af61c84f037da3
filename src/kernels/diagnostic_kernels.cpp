// torch
#include <ATen/TensorIterator.h>

// wrfdiag
#include <index.h>

#include "diagnostic_kernels.hpp"
#include "kernel_dispatch.hpp"

namespace wrfdiag {

namespace {

torch::Tensor tk_impl(torch::Tensor pres, torch::Tensor theta) {
  TORCH_CHECK(pres.sizes() == theta.sizes(),
              "calc_tk: pres and theta have different shapes, ", pres.sizes(),
              " vs ", theta.sizes());

  auto out = torch::empty(pres.sizes(), pres.options());

  auto iter = at::TensorIteratorConfig()
                  .check_all_same_dtype(true)
                  .add_output(out)
                  .add_input(pres)
                  .add_input(theta)
                  .build();

  if (pres.is_cpu()) {
    call_tk_cpu(iter);
  } else {
    TORCH_CHECK(false, "Unsupported device");
  }

  return out;
}

torch::Tensor seaprs_impl(torch::Tensor z, torch::Tensor t, torch::Tensor p,
                          torch::Tensor q) {
  TORCH_CHECK(z.sizes() == p.sizes() && t.sizes() == p.sizes() &&
                  q.sizes() == p.sizes(),
              "compute_seaprs: inputs have different shapes");

  int nz = p.size(-1);
  auto shape = p.sizes().vec();
  shape.pop_back();

  auto out = torch::empty(shape, p.options());
  auto out_column = out.unsqueeze(-1);

  // columns are contiguous along the last dimension
  auto zc = z.contiguous();
  auto tc = t.contiguous();
  auto pc = p.contiguous();
  auto qc = q.contiguous();

  auto iter = at::TensorIteratorConfig()
                  .resize_outputs(false)
                  .check_all_same_dtype(true)
                  .declare_static_shape(p.sizes(), /*squash_dims=*/p.dim() - 1)
                  .add_output(out_column)
                  .add_input(zc)
                  .add_input(tc)
                  .add_input(pc)
                  .add_input(qc)
                  .build();

  if (p.is_cpu()) {
    call_seaprs_cpu(iter, nz);
  } else {
    TORCH_CHECK(false, "Unsupported device");
  }

  return out;
}

}  // namespace

torch::Tensor calc_tk(torch::Tensor pres, torch::Tensor theta) {
  TORCH_CHECK(pres.dim() == 3, "calc_tk: pres.dim() != 3");
  return tk_impl(pres, theta);
}

torch::Tensor calc_tk_nd(torch::Tensor pres, torch::Tensor theta) {
  TORCH_CHECK(pres.dim() == 4, "calc_tk_nd: pres.dim() != 4");
  return tk_impl(pres, theta);
}

torch::Tensor compute_seaprs(torch::Tensor z, torch::Tensor t, torch::Tensor p,
                             torch::Tensor q) {
  TORCH_CHECK(p.dim() == 3, "compute_seaprs: p.dim() != 3");
  return seaprs_impl(z, t, p, q);
}

torch::Tensor compute_seaprs_nt(torch::Tensor z, torch::Tensor t,
                                torch::Tensor p, torch::Tensor q) {
  TORCH_CHECK(p.dim() == 4, "compute_seaprs_nt: p.dim() != 4");
  return seaprs_impl(z, t, p, q);
}

DiagnosticKernels diagnostic_kernels(int time_layout) {
  DiagnosticKernels kernels;

  if (time_layout == kSingleTime) {
    kernels.tk = calc_tk;
    kernels.slp = compute_seaprs;
  } else if (time_layout == kMultiTime) {
    kernels.tk = calc_tk_nd;
    kernels.slp = compute_seaprs_nt;
  } else {
    TORCH_CHECK(false, "diagnostic_kernels: unknown time layout ",
                time_layout);
  }

  return kernels;
}

}  // namespace wrfdiag
