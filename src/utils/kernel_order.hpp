#pragma once

// torch
#include <torch/torch.h>

namespace wrfdiag {

//! Convert between the storage and the kernel axis order
/*!
 * Storage order is (time, vertical, south-north, west-east), kernels take
 * the spatial axes reversed so that a column is contiguous:
 * (time, west-east, south-north, vertical). Leading time axes stay in place.
 * The conversion is its own inverse.
 *
 * \param var variable in either order
 * \param ntime number of leading axes to keep in place
 * \return contiguous variable in the other order
 */
torch::Tensor kernel_order(torch::Tensor var, int ntime = 0);

}  // namespace wrfdiag
