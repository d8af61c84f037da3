// C/C++
#include <algorithm>
#include <iostream>

// wrfdiag
#include <constants.hpp>
#include <dataset/netcdf_dataset.hpp>
#include <utils/destagger.hpp>
#include <utils/kernel_order.hpp>

#include "variable_store.hpp"

namespace wrfdiag {

VariableStoreImpl::VariableStoreImpl(VariableStoreOptions const& options_)
    : options(options_) {
  reset();
}

VariableStoreImpl::VariableStoreImpl(Dataset dataset_,
                                     VariableStoreOptions const& options_)
    : dataset(dataset_), options(options_) {
  TORCH_CHECK(dataset != nullptr, "VariableStore: null dataset");
  reset();
}

void VariableStoreImpl::reset() {
  auto const& timeidx = options.timeidx();
  TORCH_CHECK_TYPE(
      timeidx.is_integer() || timeidx.is_slice() || timeidx.is_none(),
      "Unavailable timeidx type: ", timeidx);

  if (timeidx.is_none()) {
    options.timeidx(torch::indexing::Slice());
  }

  if (dataset == nullptr) {
    dataset = std::make_shared<NetcdfDatasetImpl>(options.filename(),
                                                  options.time_dim());
    own_file_ = true;
  }

  auto ntime = dataset->dimension_size(dataset->time_dim());
  auto [start, count] = time_range(options.timeidx(), ntime);

  time_layout = count == 1 ? kSingleTime : kMultiTime;
  kernels = options.kernels()(time_layout);

  if (options.verbose()) {
    std::cout << "VariableStore: " << count << " of " << ntime
              << " times starting at " << start << std::endl;
  }
}

void VariableStoreImpl::pretty_print(std::ostream& out) const {
  out << "VariableStore(timeidx=" << options.timeidx() << ", layout="
      << (time_layout == kSingleTime ? "single" : "multi") << ")";
  out << std::endl << "Cached: (";
  for (auto const& [name, _] : variables) {
    out << name << ", ";
  }
  out << ")";
}

std::shared_ptr<torch::nn::Module> VariableStoreImpl::clone(
    torch::optional<torch::Device> const& device) const {
  TORCH_CHECK(own_file_, "VariableStore: cannot clone a store whose dataset "
              "was given at construction");

  // the copy opens its own handle and shares the cached arrays
  auto copy = std::make_shared<VariableStoreImpl>(options);
  for (auto const& [name, var] : variables) {
    copy->variables[name] = device.has_value() ? var.to(*device) : var;
  }
  return copy;
}

std::vector<std::string> const& VariableStoreImpl::diagnostic_names() {
  static std::vector<std::string> names = {"pres", "theta", "z", "tk", "slp"};
  return names;
}

torch::Tensor VariableStoreImpl::get(std::string const& name) {
  TORCH_CHECK(dataset != nullptr, "VariableStore: no dataset");
  TORCH_CHECK_VALUE(!name.empty(), "VariableStore: empty variable name");

  auto it = variables.find(name);
  if (it != variables.end()) {
    if (options.verbose()) {
      std::cout << "VariableStore: cached " << name << std::endl;
    }
    return it->second;
  }

  auto const& diag = diagnostic_names();
  bool derivable = std::find(diag.begin(), diag.end(), name) != diag.end();

  torch::Tensor var;
  if (dataset->is_open() && dataset->has_variable(name)) {
    if (options.verbose()) {
      std::cout << "VariableStore: read " << name << std::endl;
    }
    var = dataset->read(name, options.timeidx());
  } else if (derivable) {
    if (options.verbose()) {
      std::cout << "VariableStore: derive " << name << std::endl;
    }
    var = derive_(name);
  } else {
    TORCH_CHECK(dataset->is_open(), "VariableStore: dataset is closed and ",
                name, " is not cached");
    TORCH_CHECK_VALUE(false, "Unavailable variable: ", name);
  }

  variables[name] = var;
  return var;
}

void VariableStoreImpl::close(bool ncfile, bool clear_variables) {
  if (ncfile) {
    TORCH_CHECK(dataset != nullptr, "VariableStore: no dataset");
    dataset->close();
  }

  if (clear_variables) {
    variables.clear();
  }
}

torch::Tensor VariableStoreImpl::derive_(std::string const& name) {
  if (name == "pres") {
    return pres_();
  } else if (name == "theta") {
    return theta_();
  } else if (name == "z") {
    return z_();
  } else if (name == "tk") {
    return tk_();
  } else if (name == "slp") {
    return slp_();
  }

  TORCH_CHECK_VALUE(false, "Unavailable variable: ", name);
}

torch::Tensor VariableStoreImpl::pres_() {
  return 0.01 * (get("P") + get("PB"));
}

torch::Tensor VariableStoreImpl::theta_() { return get("T") + Constants::T0; }

torch::Tensor VariableStoreImpl::z_() {
  return destagger((get("PH") + get("PHB")) / Constants::G, -3);
}

torch::Tensor VariableStoreImpl::tk_() {
  auto pres = squeeze_time_(get("P") + get("PB"));
  auto theta = squeeze_time_(get("T") + Constants::T0);

  int nt = kernel_time_dims_();
  auto tk = kernels.tk(kernel_order(pres, nt), kernel_order(theta, nt));
  return kernel_order(tk, nt);
}

torch::Tensor VariableStoreImpl::slp_() {
  auto pres = squeeze_time_(get("P") + get("PB"));

  // negative mixing ratios are not physical
  auto qvapor = squeeze_time_(get("QVAPOR").clamp_min(0.));

  // geopotential -> height at half levels
  auto ph = squeeze_time_(
      destagger((get("PH") + get("PHB")) / Constants::G, -3));

  auto tk = get("tk");

  int nt = kernel_time_dims_();
  auto slp = kernels.slp(kernel_order(ph, nt), kernel_order(tk, nt),
                         kernel_order(pres, nt), kernel_order(qvapor, nt));
  return kernel_order(slp, nt);
}

torch::Tensor VariableStoreImpl::squeeze_time_(torch::Tensor var) const {
  if (options.timeidx().is_slice() && time_layout == kSingleTime) {
    return var.squeeze(0);
  }
  return var;
}

}  // namespace wrfdiag
