#pragma once

// wrfdiag
#include "dataset.hpp"

namespace wrfdiag {

//! \brief Dataset backed by a NetCDF file, e.g. a wrfout file
class NetcdfDatasetImpl : public DatasetImpl {
 public:
  explicit NetcdfDatasetImpl(std::string const& filename,
                             std::string const& time_dim = "Time");
  ~NetcdfDatasetImpl();

  NetcdfDatasetImpl(NetcdfDatasetImpl const&) = delete;
  NetcdfDatasetImpl& operator=(NetcdfDatasetImpl const&) = delete;

  std::string const& filename() const { return filename_; }

  int64_t dimension_size(std::string const& name) const override;
  bool has_variable(std::string const& name) const override;
  std::vector<std::string> variables() const override;

  //! values are converted to double by the NetCDF library
  torch::Tensor read(std::string const& name,
                     torch::indexing::TensorIndex const& timeidx) override;

  bool is_open() const override { return fileid_ >= 0; }
  void close() override;

 protected:
  std::string filename_;
  int fileid_ = -1;
};

}  // namespace wrfdiag
