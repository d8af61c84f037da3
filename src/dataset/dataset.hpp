#pragma once

// C/C++
#include <memory>
#include <string>
#include <utility>
#include <vector>

// torch
#include <torch/torch.h>

namespace wrfdiag {

//! \brief Resolve a time selector against a time dimension
/*!
 * An integer selects one time (negative values count from the end), a slice
 * selects a contiguous range and None selects all times. Any other kind of
 * index throws c10::TypeError.
 *
 * \param timeidx time selector
 * \param ntime length of the time dimension
 * \return (start, count) of the selected range
 */
std::pair<int64_t, int64_t> time_range(
    torch::indexing::TensorIndex const& timeidx, int64_t ntime);

//! \brief Read-only source of named fields with a time dimension
class DatasetImpl {
 public:
  explicit DatasetImpl(std::string const& time_dim) : time_dim_(time_dim) {}
  virtual ~DatasetImpl() {}

  //! name of the time dimension
  std::string const& time_dim() const { return time_dim_; }

  //! length of a dimension
  virtual int64_t dimension_size(std::string const& name) const = 0;

  //! whether the variable is stored in the dataset
  virtual bool has_variable(std::string const& name) const = 0;

  //! names of all stored variables
  virtual std::vector<std::string> variables() const = 0;

  //! \brief Read a variable over the selected times
  /*!
   * The result keeps the stored axis order (time, vertical, south-north,
   * west-east). An integer selector drops the time dimension, a slice keeps
   * it even if it selects a single time.
   */
  virtual torch::Tensor read(std::string const& name,
                             torch::indexing::TensorIndex const& timeidx) = 0;

  virtual bool is_open() const = 0;
  virtual void close() = 0;

 protected:
  std::string time_dim_;
};

using Dataset = std::shared_ptr<DatasetImpl>;

}  // namespace wrfdiag
