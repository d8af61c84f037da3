// external
#include <yaml-cpp/yaml.h>

// wrfdiag
#include "variable_store.hpp"

namespace wrfdiag {

torch::indexing::TensorIndex parse_timeidx(YAML::Node const& node) {
  if (!node || node.IsNull()) {
    return torch::indexing::Slice();
  }

  if (node.IsScalar()) {
    if (node.as<std::string>() == "all") {
      return torch::indexing::Slice();
    }
    return node.as<int64_t>();
  }

  TORCH_CHECK_TYPE(node.IsSequence() && node.size() == 2,
                   "parse_timeidx: expected an integer, 'all' or "
                   "[start, stop]");

  auto start = node[0].as<int64_t>();
  if (node[1].IsNull()) {
    return torch::indexing::Slice(start, torch::indexing::None);
  }
  return torch::indexing::Slice(start, node[1].as<int64_t>());
}

VariableStoreOptions VariableStoreOptions::from_yaml(YAML::Node const& node) {
  VariableStoreOptions op;

  if (node["filename"]) {
    op.filename(node["filename"].as<std::string>());
  }

  op.timeidx(parse_timeidx(node["timeidx"]));

  if (node["time_dim"]) {
    op.time_dim(node["time_dim"].as<std::string>());
  }

  if (node["verbose"]) {
    op.verbose(node["verbose"].as<bool>());
  }

  return op;
}

}  // namespace wrfdiag
