#pragma once

// C/C++
#include <map>
#include <string>
#include <vector>

// torch
#include <torch/arg.h>
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// wrfdiag
#include <configure.h>
#include <index.h>

#include <dataset/dataset.hpp>
#include <kernels/diagnostic_kernels.hpp>

namespace YAML {
class Node;
}

namespace wrfdiag {

struct VariableStoreOptions {
  VariableStoreOptions() = default;

  //! \brief Read options from a YAML node
  /*!
   * Recognized keys: filename, timeidx, time_dim, verbose
   */
  static VariableStoreOptions from_yaml(YAML::Node const& node);

  //! wrfout file, not used if the store is given a dataset
  TORCH_ARG(std::string, filename) = "";

  //! time selector, an integer or a contiguous slice; None selects all
  TORCH_ARG(torch::indexing::TensorIndex, timeidx) = torch::indexing::Slice();

  //! name of the time dimension
  TORCH_ARG(std::string, time_dim) = "Time";

  //! called once at construction with the time layout
  TORCH_ARG(DiagnosticKernelFactory, kernels) = diagnostic_kernels;

  TORCH_ARG(bool, verbose) = false;
};

//! \brief Parse a time selector
/*!
 * Accepts an integer, a [start, stop] pair (stop may be null), "all" or an
 * undefined node (all times).
 */
torch::indexing::TensorIndex parse_timeidx(YAML::Node const& node);

//! \brief Named access to raw and diagnostic variables of a dataset
/*!
 * Every variable is read or computed at most once and cached by name.
 * Diagnostics fetch their inputs through get(), so intermediate variables
 * are cached as well.
 */
class VariableStoreImpl : public torch::nn::Cloneable<VariableStoreImpl> {
 public:
  //! cached variables
  std::map<std::string, torch::Tensor> variables;

  //! source of raw variables
  Dataset dataset;

  //! kSingleTime or kMultiTime, fixed at construction
  int time_layout = kSingleTime;

  //! kernels of the time layout
  DiagnosticKernels kernels;

  //! options with which this `VariableStore` was constructed
  VariableStoreOptions options;

  VariableStoreImpl() = default;

  //! Constructor to open the file named in the options
  explicit VariableStoreImpl(VariableStoreOptions const& options_);
  VariableStoreImpl(Dataset dataset_, VariableStoreOptions const& options_);
  void reset() override;
  void pretty_print(std::ostream& out) const override;

  //! \brief Copy with its own file handle
  /*!
   * Only a store that opened its file can be cloned, the clone reopens
   * the file. Cached arrays are shared.
   */
  std::shared_ptr<torch::nn::Module> clone(
      torch::optional<torch::Device> const& device =
          torch::nullopt) const override;

  //! names of the variables computed by recipes
  static std::vector<std::string> const& diagnostic_names();

  //! \brief Get a variable by name
  /*!
   * \param name a variable of the dataset or a diagnostic:
   *        "pres"  -- pressure [hPa]
   *        "tk"    -- temperature [K]
   *        "slp"   -- sea level pressure [hPa]
   *        "theta" -- potential temperature [K]
   *        "z"     -- geopotential height [m]
   * \return variable in storage order (time, vertical, south-north,
   *         west-east); raw variables keep the time dimension of a slice
   */
  torch::Tensor get(std::string const& name);

  //! whether a variable is cached
  bool has(std::string const& name) const {
    return variables.count(name) > 0;
  }

  void clear() { variables.clear(); }

  //! \brief Release resources
  /*!
   * \param ncfile close the dataset; cached variables remain available
   * \param clear_variables drop all cached variables
   */
  void close(bool ncfile = true, bool clear_variables = false);

 protected:
  torch::Tensor derive_(std::string const& name);

  torch::Tensor pres_();
  torch::Tensor theta_();
  torch::Tensor z_();
  torch::Tensor tk_();
  torch::Tensor slp_();

  //! drop the time dimension of a single time slice
  torch::Tensor squeeze_time_(torch::Tensor var) const;

  //! number of leading time axes passed to the kernels
  int kernel_time_dims_() const { return time_layout == kMultiTime ? 1 : 0; }

  //! the dataset was opened from `options.filename()`
  bool own_file_ = false;
};
TORCH_MODULE(VariableStore);

}  // namespace wrfdiag
