#pragma once

// C/C++
#include <vector>

// torch
#include <torch/arg.h>
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// wrfdiag
#include <configure.h>
#include <index.h>

#include <kernels/level_kernels.hpp>

namespace YAML {
class Node;
}

namespace wrfdiag {

struct VerticalInterpOptions {
  VerticalInterpOptions() = default;

  //! Recognized keys: verbose
  static VerticalInterpOptions from_yaml(YAML::Node const& node);

  //! called once at construction with the level type
  TORCH_ARG(LevelKernelFactory, kernels) = level_kernels;

  TORCH_ARG(bool, verbose) = false;
};

//! \brief Parse pressure levels
/*!
 * A scalar gives a 0-dim tensor, a list gives a 1-d tensor.
 */
torch::Tensor parse_levels(YAML::Node const& node);

//! \brief Interpolation of 3-d variables onto pressure levels
/*!
 * The layers bracketing each target level are located once per column at
 * construction and shared by every subsequent interpolation.
 */
class VerticalInterpImpl : public torch::nn::Cloneable<VerticalInterpImpl> {
 public:
  //! pressure, (nz, ny, nx)
  torch::Tensor pres;

  //! target pressure levels, 0-dim or (nlev,)
  torch::Tensor level;

  //! kScalarLevel or kLevelSequence, fixed at construction
  int level_type = kScalarLevel;

  //! pressure in kernel order, (nx, ny, nz)
  torch::Tensor pres_k;

  //! 1-based upper bracketing layer, kLevelNotFound outside the column
  //! (nx, ny) or (nx, ny, nlev)
  torch::Tensor lev_idx;

  //! search and interpolation kernels of the level type
  LevelKernels kernels;

  //! options with which this `VerticalInterp` was constructed
  VerticalInterpOptions options;

  //! Constructor to locate the levels
  VerticalInterpImpl() = default;
  VerticalInterpImpl(torch::Tensor pres_, torch::Tensor level_,
                     VerticalInterpOptions const& options_ = {});
  VerticalInterpImpl(torch::Tensor pres_, double level_,
                     VerticalInterpOptions const& options_ = {});
  VerticalInterpImpl(torch::Tensor pres_, std::vector<double> const& levels_,
                     VerticalInterpOptions const& options_ = {});
  void reset() override;
  void pretty_print(std::ostream& out) const override;

  //! \brief Interpolate variables onto the target levels
  /*!
   * \param vars variables with the shape of `pres`, (nz, ny, nx)
   * \return interpolated variables in input order, (ny, nx) for a scalar
   *         level or (ny, nx, nlev) for a sequence; NaN where the level is
   *         outside the column
   */
  std::vector<torch::Tensor> interp(
      std::vector<torch::Tensor> const& vars) const;

  //! Interpolate a single variable
  torch::Tensor forward(torch::Tensor var) const;

 protected:
  torch::Tensor interp_one_(torch::Tensor var) const;
};
TORCH_MODULE(VerticalInterp);

}  // namespace wrfdiag
