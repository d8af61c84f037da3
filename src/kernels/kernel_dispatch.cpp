// torch
#include <ATen/Dispatch.h>
#include <ATen/TensorIterator.h>
#include <ATen/native/cpu/Loops.h>
#include <torch/torch.h>

// wrfdiag
#include "find_level.h"
#include "interp_level.h"
#include "kernel_dispatch.hpp"
#include "seaprs.h"
#include "tk.h"

namespace wrfdiag {

void call_tk_cpu(at::TensorIterator& iter) {
  AT_DISPATCH_FLOATING_TYPES(iter.dtype(), "tk_cpu", [&] {
    iter.for_each([&](char** data, const int64_t* strides, int64_t n) {
      for (int i = 0; i < n; i++) {
        auto out = reinterpret_cast<scalar_t*>(data[0] + i * strides[0]);
        auto pres = reinterpret_cast<scalar_t*>(data[1] + i * strides[1]);
        auto theta = reinterpret_cast<scalar_t*>(data[2] + i * strides[2]);
        tk_from_theta(out, pres, theta);
      }
    });
  });
}

void call_seaprs_cpu(at::TensorIterator& iter, int nz) {
  AT_DISPATCH_FLOATING_TYPES(iter.dtype(), "seaprs_cpu", [&] {
    iter.for_each([&](char** data, const int64_t* strides, int64_t n) {
      for (int i = 0; i < n; i++) {
        auto out = reinterpret_cast<scalar_t*>(data[0] + i * strides[0]);
        auto z = reinterpret_cast<scalar_t*>(data[1] + i * strides[1]);
        auto t = reinterpret_cast<scalar_t*>(data[2] + i * strides[2]);
        auto p = reinterpret_cast<scalar_t*>(data[3] + i * strides[3]);
        auto q = reinterpret_cast<scalar_t*>(data[4] + i * strides[4]);
        int status = seaprs(out, z, t, p, q, nz);
        TORCH_CHECK(status != INOLEVEL,
                    "seaprs: no level found ", Constants::PConst,
                    " Pa above the surface, surface pressure = ", p[0]);
        TORCH_CHECK(status != INOLAYER,
                    "seaprs: trapping levels are weird, nz = ", nz);
      }
    });
  });
}

void call_find_level_cpu(at::TensorIterator& iter, at::Tensor levels,
                         int nz) {
  int nlev = levels.numel();

  AT_DISPATCH_FLOATING_TYPES(iter.input_dtype(), "find_level_cpu", [&] {
    auto plev = levels.data_ptr<scalar_t>();
    iter.for_each([&](char** data, const int64_t* strides, int64_t n) {
      for (int i = 0; i < n; i++) {
        auto idx = reinterpret_cast<int64_t*>(data[0] + i * strides[0]);
        auto pres = reinterpret_cast<scalar_t*>(data[1] + i * strides[1]);
        find_levels(idx, pres, plev, nz, nlev);
      }
    });
  });
}

void call_interp_level_cpu(at::TensorIterator& iter, at::Tensor levels) {
  int nlev = levels.numel();

  AT_DISPATCH_FLOATING_TYPES(iter.dtype(), "interp_level_cpu", [&] {
    auto plev = levels.data_ptr<scalar_t>();
    iter.for_each([&](char** data, const int64_t* strides, int64_t n) {
      for (int i = 0; i < n; i++) {
        auto out = reinterpret_cast<scalar_t*>(data[0] + i * strides[0]);
        auto var = reinterpret_cast<scalar_t*>(data[1] + i * strides[1]);
        auto pres = reinterpret_cast<scalar_t*>(data[2] + i * strides[2]);
        auto idx = reinterpret_cast<int64_t*>(data[3] + i * strides[3]);
        interp_levels(out, var, pres, plev, idx, nlev);
      }
    });
  });
}

}  // namespace wrfdiag
