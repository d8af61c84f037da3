// external
#include <yaml-cpp/yaml.h>

// wrfdiag
#include "vertical_interp.hpp"

namespace wrfdiag {

torch::Tensor parse_levels(YAML::Node const& node) {
  TORCH_CHECK_VALUE(node.IsDefined() && !node.IsNull(),
                    "parse_levels: no levels");

  if (node.IsScalar()) {
    return torch::tensor(node.as<double>(), torch::kFloat64);
  }

  TORCH_CHECK_TYPE(node.IsSequence(),
                   "parse_levels: expected a scalar or a list");
  return torch::tensor(node.as<std::vector<double>>(), torch::kFloat64);
}

VerticalInterpOptions VerticalInterpOptions::from_yaml(YAML::Node const& node) {
  VerticalInterpOptions op;

  if (node["verbose"]) {
    op.verbose(node["verbose"].as<bool>());
  }

  return op;
}

}  // namespace wrfdiag
