#pragma once

// C/C++
#include <map>

// wrfdiag
#include "dataset.hpp"

namespace wrfdiag {

//! \brief Dataset held in memory
/*!
 * Every variable carries a leading time dimension of length `ntime`.
 */
class MemoryDatasetImpl : public DatasetImpl {
 public:
  //! stored variables
  std::map<std::string, torch::Tensor> fields;

  //! number of reads served
  int64_t nreads = 0;

  explicit MemoryDatasetImpl(int64_t ntime,
                             std::string const& time_dim = "Time");

  //! add or replace a variable, shape (ntime, ...)
  void add_variable(std::string const& name, torch::Tensor var);

  int64_t dimension_size(std::string const& name) const override;
  bool has_variable(std::string const& name) const override;
  std::vector<std::string> variables() const override;
  torch::Tensor read(std::string const& name,
                     torch::indexing::TensorIndex const& timeidx) override;

  bool is_open() const override { return open_; }
  void close() override { open_ = false; }

 protected:
  int64_t ntime_;
  bool open_ = true;
};

using MemoryDataset = std::shared_ptr<MemoryDatasetImpl>;

}  // namespace wrfdiag
