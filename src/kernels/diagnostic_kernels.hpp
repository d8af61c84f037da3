#pragma once

// C/C++
#include <functional>

// torch
#include <torch/torch.h>

namespace wrfdiag {

//! \brief Temperature from full pressure and potential temperature
/*!
 * \param pres full pressure [Pa], (nx, ny, nz)
 * \param theta full potential temperature [K], (nx, ny, nz)
 * \return temperature [K], (nx, ny, nz)
 */
torch::Tensor calc_tk(torch::Tensor pres, torch::Tensor theta);

//! \brief Multi-time variant of calc_tk, (nt, nx, ny, nz)
torch::Tensor calc_tk_nd(torch::Tensor pres, torch::Tensor theta);

//! \brief Sea level pressure
/*!
 * \param z geopotential height at half levels [m], (nx, ny, nz)
 * \param t temperature [K], (nx, ny, nz)
 * \param p full pressure [Pa], (nx, ny, nz)
 * \param q water vapor mixing ratio [kg/kg], (nx, ny, nz)
 * \return sea level pressure [hPa], (nx, ny)
 */
torch::Tensor compute_seaprs(torch::Tensor z, torch::Tensor t, torch::Tensor p,
                             torch::Tensor q);

//! \brief Multi-time variant of compute_seaprs, (nt, nx, ny, nz) -> (nt, nx, ny)
torch::Tensor compute_seaprs_nt(torch::Tensor z, torch::Tensor t,
                                torch::Tensor p, torch::Tensor q);

//! Kernels used by the diagnostic recipes of a VariableStore
struct DiagnosticKernels {
  //! (pres, theta) -> tk
  std::function<torch::Tensor(torch::Tensor, torch::Tensor)> tk;

  //! (z, tk, pres, qvapor) -> slp
  std::function<torch::Tensor(torch::Tensor, torch::Tensor, torch::Tensor,
                              torch::Tensor)>
      slp;
};

using DiagnosticKernelFactory = std::function<DiagnosticKernels(int)>;

//! \brief Select the kernel variants of a time layout
/*!
 * \param time_layout kSingleTime or kMultiTime
 */
DiagnosticKernels diagnostic_kernels(int time_layout);

}  // namespace wrfdiag
