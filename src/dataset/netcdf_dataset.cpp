// base
#include <configure.h>

// wrfdiag
#include "netcdf_dataset.hpp"

// netcdf
#ifdef NETCDFOUTPUT
extern "C" {
#include <netcdf.h>
}
#endif

namespace wrfdiag {

NetcdfDatasetImpl::NetcdfDatasetImpl(std::string const& filename,
                                     std::string const& time_dim)
    : DatasetImpl(time_dim), filename_(filename) {
#ifdef NETCDFOUTPUT
  int err = nc_open(filename.c_str(), NC_NOWRITE, &fileid_);
  if (err != NC_NOERR) fileid_ = -1;
  TORCH_CHECK(err == NC_NOERR, filename, ": ", nc_strerror(err));
#else
  TORCH_CHECK(false, "NetCDF support is not enabled");
#endif
}

NetcdfDatasetImpl::~NetcdfDatasetImpl() {
#ifdef NETCDFOUTPUT
  if (fileid_ >= 0) nc_close(fileid_);
#endif
  fileid_ = -1;
}

void NetcdfDatasetImpl::close() {
#ifdef NETCDFOUTPUT
  if (fileid_ < 0) return;

  int err = nc_close(fileid_);
  fileid_ = -1;
  TORCH_CHECK(err == NC_NOERR, filename_, ": ", nc_strerror(err));
#endif
}

int64_t NetcdfDatasetImpl::dimension_size(std::string const& name) const {
  TORCH_CHECK(is_open(), filename_, " is closed");

#ifdef NETCDFOUTPUT
  int dimid, err;
  size_t len;

  err = nc_inq_dimid(fileid_, name.c_str(), &dimid);
  TORCH_CHECK(err == NC_NOERR, name, ": ", nc_strerror(err));

  err = nc_inq_dimlen(fileid_, dimid, &len);
  TORCH_CHECK(err == NC_NOERR, name, ": ", nc_strerror(err));

  return len;
#else
  return 0;
#endif
}

bool NetcdfDatasetImpl::has_variable(std::string const& name) const {
  TORCH_CHECK(is_open(), filename_, " is closed");

#ifdef NETCDFOUTPUT
  int varid;
  return nc_inq_varid(fileid_, name.c_str(), &varid) == NC_NOERR;
#else
  return false;
#endif
}

std::vector<std::string> NetcdfDatasetImpl::variables() const {
  TORCH_CHECK(is_open(), filename_, " is closed");
  std::vector<std::string> names;

#ifdef NETCDFOUTPUT
  int nvars, err;
  char name[NC_MAX_NAME + 1];

  err = nc_inq_nvars(fileid_, &nvars);
  TORCH_CHECK(err == NC_NOERR, nc_strerror(err));

  for (int varid = 0; varid < nvars; ++varid) {
    err = nc_inq_varname(fileid_, varid, name);
    TORCH_CHECK(err == NC_NOERR, nc_strerror(err));
    names.push_back(name);
  }
#endif

  return names;
}

torch::Tensor NetcdfDatasetImpl::read(
    std::string const& name, torch::indexing::TensorIndex const& timeidx) {
  TORCH_CHECK(is_open(), filename_, " is closed");

#ifdef NETCDFOUTPUT
  int varid, ndims, err;

  err = nc_inq_varid(fileid_, name.c_str(), &varid);
  TORCH_CHECK(err == NC_NOERR, name, ": ", nc_strerror(err));

  err = nc_inq_varndims(fileid_, varid, &ndims);
  TORCH_CHECK(err == NC_NOERR, name, ": ", nc_strerror(err));

  std::vector<int> dimids(ndims);
  err = nc_inq_vardimid(fileid_, varid, dimids.data());
  TORCH_CHECK(err == NC_NOERR, name, ": ", nc_strerror(err));

  std::vector<size_t> start(ndims, 0);
  std::vector<size_t> count(ndims);
  for (int i = 0; i < ndims; ++i) {
    err = nc_inq_dimlen(fileid_, dimids[i], &count[i]);
    TORCH_CHECK(err == NC_NOERR, name, ": ", nc_strerror(err));
  }

  // time is the record dimension, if present
  int time_dimid;
  if (nc_inq_dimid(fileid_, time_dim_.c_str(), &time_dimid) != NC_NOERR) {
    time_dimid = -1;
  }
  bool has_time = ndims > 0 && dimids[0] == time_dimid;

  if (has_time) {
    auto [first, len] = time_range(timeidx, count[0]);
    start[0] = first;
    count[0] = len;
  }

  std::vector<int64_t> shape(count.begin(), count.end());
  torch::Tensor out = torch::empty(shape, torch::kFloat64);

  err = nc_get_vara_double(fileid_, varid, start.data(), count.data(),
                           out.data_ptr<double>());
  TORCH_CHECK(err == NC_NOERR, name, ": ", nc_strerror(err));

  if (has_time && timeidx.is_integer()) {
    return out.select(0, 0);
  }
  return out;
#else
  TORCH_CHECK(false, "NetCDF support is not enabled");
#endif
}

}  // namespace wrfdiag
