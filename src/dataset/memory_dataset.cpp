// wrfdiag
#include "memory_dataset.hpp"

namespace wrfdiag {
MemoryDatasetImpl::MemoryDatasetImpl(int64_t ntime,
                                     std::string const& time_dim)
    : DatasetImpl(time_dim), ntime_(ntime) {
  TORCH_CHECK_VALUE(ntime > 0, "MemoryDataset: ntime = ", ntime);
}

void MemoryDatasetImpl::add_variable(std::string const& name,
                                     torch::Tensor var) {
  TORCH_CHECK(var.dim() > 0 && var.size(0) == ntime_, "MemoryDataset: ",
              name, " has shape ", var.sizes(), ", expected a leading ",
              time_dim_, " dimension of ", ntime_);
  fields[name] = var;
}

int64_t MemoryDatasetImpl::dimension_size(std::string const& name) const {
  TORCH_CHECK(name == time_dim_, "MemoryDataset: unknown dimension ", name);
  return ntime_;
}

bool MemoryDatasetImpl::has_variable(std::string const& name) const {
  TORCH_CHECK(open_, "MemoryDataset: dataset is closed");
  return fields.count(name) > 0;
}

std::vector<std::string> MemoryDatasetImpl::variables() const {
  std::vector<std::string> names;
  for (auto const& [name, _] : fields) names.push_back(name);
  return names;
}

torch::Tensor MemoryDatasetImpl::read(
    std::string const& name, torch::indexing::TensorIndex const& timeidx) {
  TORCH_CHECK(open_, "MemoryDataset: dataset is closed");
  TORCH_CHECK(fields.count(name) > 0, "MemoryDataset: no variable ", name);

  auto [start, count] = time_range(timeidx, ntime_);
  nreads++;

  auto var = fields.at(name).narrow(0, start, count);
  if (timeidx.is_integer()) {
    return var.select(0, 0).clone();
  }
  return var.clone();
}
}  // namespace wrfdiag
