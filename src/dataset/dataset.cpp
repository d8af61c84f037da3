// wrfdiag
#include "dataset.hpp"

namespace wrfdiag {
std::pair<int64_t, int64_t> time_range(
    torch::indexing::TensorIndex const& timeidx, int64_t ntime) {
  TORCH_CHECK_TYPE(
      timeidx.is_integer() || timeidx.is_slice() || timeidx.is_none(),
      "Unavailable timeidx type: ", timeidx);

  if (timeidx.is_none()) {
    TORCH_CHECK_VALUE(ntime > 0, "empty time dimension");
    return {0, ntime};
  }

  // let torch resolve negative indices and open slice bounds
  auto selected = torch::arange(ntime, torch::kInt64).index({timeidx});

  if (timeidx.is_integer()) {
    return {selected.item<int64_t>(), 1};
  }

  int64_t count = selected.numel();
  TORCH_CHECK_VALUE(count > 0, "empty time range ", timeidx, " of ", ntime,
                    " times");

  if (count > 1) {
    TORCH_CHECK_VALUE((selected[1] - selected[0]).item<int64_t>() == 1,
                      "time range ", timeidx, " is not contiguous");
  }

  return {selected[0].item<int64_t>(), count};
}
}  // namespace wrfdiag
