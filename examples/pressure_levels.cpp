// C/C++
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

// external
#include <yaml-cpp/yaml.h>

// wrfdiag
#include <diagnostics/variable_store.hpp>
#include <interp/vertical_interp.hpp>

using namespace wrfdiag;

void print_summary(std::string const& name, torch::Tensor var) {
  auto valid = var.isfinite();
  auto nvalid = valid.sum().item<int64_t>();

  std::cout << name << ": shape = " << var.sizes() << ", valid = " << nvalid
            << "/" << var.numel();

  if (nvalid > 0) {
    auto values = var.masked_select(valid);
    std::cout << ", min = " << values.min().item<double>()
              << ", max = " << values.max().item<double>();
  }
  std::cout << std::endl;
}

// drop the time dimension of a single time slice
torch::Tensor single_time(torch::Tensor var) {
  return var.dim() == 4 && var.size(0) == 1 ? var.squeeze(0) : var;
}

void interp_levels(VariableStore store, YAML::Node const& config) {
  auto levels = parse_levels(config["levels"]);
  auto names = config["variables"].as<std::vector<std::string>>();

  auto pres = single_time(store->get("pres"));
  std::vector<torch::Tensor> fields;
  for (auto const& name : names) {
    fields.push_back(single_time(store->get(name)));
  }

  // one interpolator per time, (nt, nz, ny, nx) -> (nz, ny, nx)
  int64_t nt = pres.dim() == 4 ? pres.size(0) : 0;
  for (int64_t t = 0; t < std::max<int64_t>(nt, 1); ++t) {
    auto pres_t = nt > 0 ? pres[t] : pres;

    std::vector<torch::Tensor> vars;
    for (auto const& field : fields) {
      vars.push_back(nt > 0 ? field[t] : field);
    }

    VerticalInterp vinterp(pres_t, levels,
                           VerticalInterpOptions::from_yaml(config));
    auto result = vinterp->interp(vars);

    for (size_t i = 0; i < names.size(); ++i) {
      auto prefix = nt > 0 ? "[" + std::to_string(t) + "] " : std::string();
      if (levels.dim() == 0) {
        print_summary(prefix + names[i] + " @ " +
                          std::to_string(levels.item<double>()) + " hPa",
                      result[i]);
      } else {
        for (int n = 0; n < levels.size(0); ++n) {
          print_summary(prefix + names[i] + " @ " +
                            std::to_string(levels[n].item<double>()) + " hPa",
                        result[i].select(-1, n));
        }
      }
    }
  }
}

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = YAML::LoadFile(argv[1]);

    VariableStore store(VariableStoreOptions::from_yaml(config["dataset"]));

    if (config["diagnostics"]) {
      for (auto const& name :
           config["diagnostics"].as<std::vector<std::string>>()) {
        print_summary(name, store->get(name));
      }
    }

    if (config["interp"]) {
      interp_levels(store, config["interp"]);
    }

    store->close();
  } catch (c10::Error const& e) {
    std::cerr << e.what_without_backtrace() << std::endl;
    return 1;
  } catch (YAML::Exception const& e) {
    std::cerr << argv[1] << ": " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
