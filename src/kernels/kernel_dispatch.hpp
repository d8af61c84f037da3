#pragma once

// torch
#include <ATen/TensorIterator.h>

namespace wrfdiag {

void call_tk_cpu(at::TensorIterator& iter);

void call_seaprs_cpu(at::TensorIterator& iter, int nz);

void call_find_level_cpu(at::TensorIterator& iter, at::Tensor levels, int nz);

void call_interp_level_cpu(at::TensorIterator& iter, at::Tensor levels);

}  // namespace wrfdiag
