// external
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

// wrfdiag
#include <diagnostics/variable_store.hpp>
#include <interp/vertical_interp.hpp>

using namespace wrfdiag;

// times selected out of five
torch::Tensor selected(torch::indexing::TensorIndex const& timeidx) {
  return torch::arange(5, torch::kInt64).index({timeidx});
}

TEST(TestConfig, store_options) {
  auto node = YAML::Load(R"(
filename: wrfout_d01_2018-09-14_00:00:00
timeidx: 2
time_dim: Times
verbose: true
)");

  auto op = VariableStoreOptions::from_yaml(node);
  EXPECT_EQ(op.filename(), "wrfout_d01_2018-09-14_00:00:00");
  EXPECT_EQ(op.time_dim(), "Times");
  EXPECT_TRUE(op.verbose());
  ASSERT_TRUE(op.timeidx().is_integer());
  EXPECT_EQ(selected(op.timeidx()).item<int64_t>(), 2);
};

TEST(TestConfig, store_defaults) {
  auto op = VariableStoreOptions::from_yaml(YAML::Load("{}"));
  EXPECT_EQ(op.filename(), "");
  EXPECT_EQ(op.time_dim(), "Time");
  EXPECT_FALSE(op.verbose());
  EXPECT_TRUE(op.timeidx().is_slice());
};

TEST(TestConfig, timeidx) {
  EXPECT_TRUE(parse_timeidx(YAML::Load("all")).is_slice());
  EXPECT_TRUE(parse_timeidx(YAML::Load("~")).is_slice());
  EXPECT_EQ(selected(parse_timeidx(YAML::Load("-1"))).item<int64_t>(), 4);

  auto range = parse_timeidx(YAML::Load("[1, 3]"));
  ASSERT_TRUE(range.is_slice());
  EXPECT_TRUE(torch::equal(selected(range), torch::arange(1, 3, torch::kInt64)));

  auto open = parse_timeidx(YAML::Load("[2, ~]"));
  ASSERT_TRUE(open.is_slice());
  EXPECT_TRUE(torch::equal(selected(open), torch::arange(2, 5, torch::kInt64)));

  EXPECT_THROW(parse_timeidx(YAML::Load("[1, 2, 3]")), c10::TypeError);
  EXPECT_THROW(parse_timeidx(YAML::Load("{start: 1}")), c10::TypeError);
};

TEST(TestConfig, levels) {
  auto level = parse_levels(YAML::Load("850."));
  EXPECT_EQ(level.dim(), 0);
  EXPECT_DOUBLE_EQ(level.item<double>(), 850.);

  auto levels = parse_levels(YAML::Load("[850., 700., 500.]"));
  EXPECT_EQ(levels.dim(), 1);
  EXPECT_EQ(levels.size(0), 3);
  EXPECT_EQ(levels.dtype(), torch::kFloat64);

  EXPECT_THROW(parse_levels(YAML::Load("~")), c10::ValueError);
  EXPECT_THROW(parse_levels(YAML::Load("{level: 850}")), c10::TypeError);

  auto op = VerticalInterpOptions::from_yaml(YAML::Load("verbose: true"));
  EXPECT_TRUE(op.verbose());
};

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
