#pragma once

// torch
#include <torch/torch.h>

namespace wrfdiag {

//! Move a staggered variable to the cell centers
/*!
 * The staggered variable is defined at the cell interfaces along `dim`,
 * the result at the cell centers, halfway between two interfaces.
 *
 * \param var staggered variable, shape (..., nlevel, ...)
 * \param dim staggered dimension, negative values count from the end
 * \return unstaggered variable, shape (..., nlayer = nlevel - 1, ...)
 */
torch::Tensor destagger(torch::Tensor var, int64_t dim);
}  // namespace wrfdiag
