#pragma once

// C/C++
#include <functional>

// torch
#include <torch/torch.h>

namespace wrfdiag {

//! \brief Bracketing layer of a single pressure level
/*!
 * \param pres pressure, (nx, ny, nz)
 * \param level target pressure, 0-dim
 * \return 1-based upper bracketing layer, 0 if not found, (nx, ny)
 */
torch::Tensor find_level_1(torch::Tensor pres, torch::Tensor level);

//! \brief Bracketing layers of a sequence of pressure levels
/*!
 * \param pres pressure, (nx, ny, nz)
 * \param levels target pressures, (nlev,)
 * \return 1-based upper bracketing layers, 0 if not found, (nx, ny, nlev)
 */
torch::Tensor find_level_n(torch::Tensor pres, torch::Tensor levels);

//! \brief Interpolate a variable onto a single pressure level
/*!
 * \param var variable, (nx, ny, nz)
 * \param pres pressure, (nx, ny, nz)
 * \param level target pressure, 0-dim
 * \param idx bracketing layers from find_level_1, (nx, ny)
 * \return interpolated variable, (nx, ny)
 */
torch::Tensor interpz3d_1(torch::Tensor var, torch::Tensor pres,
                          torch::Tensor level, torch::Tensor idx);

//! \brief Interpolate a variable onto a sequence of pressure levels
/*!
 * \param idx bracketing layers from find_level_n, (nx, ny, nlev)
 * \return interpolated variable, (nx, ny, nlev)
 */
torch::Tensor interpz3d_n(torch::Tensor var, torch::Tensor pres,
                          torch::Tensor levels, torch::Tensor idx);

//! Search and interpolation kernels of one level specification
struct LevelKernels {
  //! (pres, level) -> idx
  std::function<torch::Tensor(torch::Tensor, torch::Tensor)> find_level;

  //! (var, pres, level, idx) -> interpolated variable
  std::function<torch::Tensor(torch::Tensor, torch::Tensor, torch::Tensor,
                              torch::Tensor)>
      interp;
};

using LevelKernelFactory = std::function<LevelKernels(int)>;

//! \brief Select the kernel pair of a level specification
/*!
 * \param level_type kScalarLevel or kLevelSequence
 */
LevelKernels level_kernels(int level_type);

}  // namespace wrfdiag
