// C/C++
#include <cmath>

// external
#include <gtest/gtest.h>

// wrfdiag
#include <constants.hpp>
#include <index.h>
#include <kernels/diagnostic_kernels.hpp>
#include <kernels/level_kernels.hpp>
#include <utils/destagger.hpp>
#include <utils/kernel_order.hpp>

using namespace wrfdiag;

// one column in kernel order, (1, 1, nz)
torch::Tensor column(std::vector<double> const& values) {
  return torch::tensor(values, torch::kFloat64).view({1, 1, -1});
}

TEST(TestKernels, tk) {
  auto pres = column({100000., 50000.});
  auto theta = column({290., 320.});

  auto tk = calc_tk(pres, theta);
  EXPECT_EQ(tk.sizes(), pres.sizes());
  EXPECT_NEAR(tk[0][0][0].item<double>(), 290., 1.e-10);

  double kappa = Constants::Rd / Constants::Cp;
  EXPECT_NEAR(tk[0][0][1].item<double>(), 320. * std::pow(0.5, kappa),
              1.e-10);

  EXPECT_THROW(calc_tk(pres, theta.squeeze(0)), c10::Error);
  EXPECT_THROW(calc_tk_nd(pres, theta), c10::Error);
};

TEST(TestKernels, tk_nd) {
  auto pres = torch::full({2, 3, 2, 4}, 100000., torch::kFloat64);
  auto theta = torch::rand({2, 3, 2, 4}, torch::kFloat64) * 20. + 280.;

  auto tk = calc_tk_nd(pres, theta);
  EXPECT_TRUE(torch::allclose(tk, theta));
};

TEST(TestKernels, seaprs) {
  auto z = column({750., 2250., 3750.});
  auto t = column({290., 280., 270.});
  auto p = column({100000., 85000., 70000.});
  auto q = column({0.01, 0.005, 0.001});

  auto slp = compute_seaprs(z, t, p, q);
  EXPECT_EQ(slp.sizes(), torch::IntArrayRef({1, 1}));

  auto value = slp[0][0].item<double>();
  EXPECT_GT(value, 1000.);
  EXPECT_LT(value, 1200.);

  // surface at sea level
  auto slp0 = compute_seaprs(z - 750., t, p, q);
  EXPECT_NEAR(slp0[0][0].item<double>(), 1000., 1.e-8);
};

TEST(TestKernels, seaprs_nt) {
  auto z = column({750., 2250., 3750.}).expand({2, 3, 2, 3}).contiguous();
  auto t = column({290., 280., 270.}).expand({2, 3, 2, 3}).contiguous();
  auto p = column({100000., 85000., 70000.}).expand({2, 3, 2, 3}).contiguous();
  auto q = torch::zeros({2, 3, 2, 3}, torch::kFloat64);

  auto slp = compute_seaprs_nt(z, t, p, q);
  EXPECT_EQ(slp.sizes(), torch::IntArrayRef({2, 3, 2}));
  EXPECT_TRUE(torch::allclose(slp, slp[0][0][0].expand_as(slp)));
};

TEST(TestKernels, seaprs_shallow_column) {
  auto z = column({100., 300., 500.});
  auto t = column({290., 288., 286.});
  auto p = column({100000., 95000., 92000.});
  auto q = column({0., 0., 0.});

  EXPECT_THROW(compute_seaprs(z, t, p, q), c10::Error);
};

TEST(TestKernels, find_level) {
  auto pres = column({1000., 900., 800.});

  auto idx = find_level_1(pres, torch::tensor(950., torch::kFloat64));
  EXPECT_EQ(idx.sizes(), torch::IntArrayRef({1, 1}));
  EXPECT_EQ(idx.dtype(), torch::kInt64);
  EXPECT_EQ(idx[0][0].item<int64_t>(), 2);

  auto levels = torch::tensor({1100., 1000., 850., 800., 700.}, torch::kFloat64);
  auto idxn = find_level_n(pres, levels);
  EXPECT_EQ(idxn.sizes(), torch::IntArrayRef({1, 1, 5}));

  auto expected = torch::tensor(
      std::vector<int64_t>{kLevelNotFound, 2, 3, 3, kLevelNotFound});
  EXPECT_TRUE(torch::equal(idxn.view({-1}), expected));

  // increasing pressure
  auto idxr = find_level_1(pres.flip(-1), torch::tensor(950., torch::kFloat64));
  EXPECT_EQ(idxr[0][0].item<int64_t>(), 3);
};

TEST(TestKernels, interp_level) {
  auto pres = column({1000., 900., 800.});
  auto var = column({1., 2., 3.});
  auto level = torch::tensor(950., torch::kFloat64);

  auto idx = find_level_1(pres, level);
  auto out = interpz3d_1(var, pres, level, idx);
  EXPECT_EQ(out.sizes(), torch::IntArrayRef({1, 1}));
  EXPECT_NEAR(out[0][0].item<double>(), 1.5, 1.e-12);

  auto levels = torch::tensor({950., 850., 800.}, torch::kFloat64);
  auto idxn = find_level_n(pres, levels);
  auto outn = interpz3d_n(var, pres, levels, idxn);
  EXPECT_TRUE(torch::allclose(
      outn.view({-1}), torch::tensor({1.5, 2.5, 3.}, torch::kFloat64)));

  EXPECT_THROW(interpz3d_1(var.squeeze(0), pres, level, idx), c10::Error);
};

TEST(TestKernels, kernel_factories) {
  auto single = diagnostic_kernels(kSingleTime);
  auto pres = column({100000.});
  EXPECT_NO_THROW(single.tk(pres, pres));

  auto multi = diagnostic_kernels(kMultiTime);
  EXPECT_THROW(multi.tk(pres, pres), c10::Error);

  EXPECT_THROW(diagnostic_kernels(7), c10::Error);
  EXPECT_THROW(level_kernels(7), c10::Error);
};

TEST(TestUtils, destagger) {
  auto ph = torch::tensor({0., 2., 4., 8.}, torch::kFloat64).view({1, 4, 1, 1});

  auto z = destagger(ph, -3);
  EXPECT_EQ(z.sizes(), torch::IntArrayRef({1, 3, 1, 1}));
  EXPECT_TRUE(torch::allclose(
      z.view({-1}), torch::tensor({1., 3., 6.}, torch::kFloat64)));

  EXPECT_THROW(destagger(ph, 0), c10::Error);
};

TEST(TestUtils, kernel_order) {
  auto var = torch::rand({2, 3, 4, 5});

  auto vk = kernel_order(var, 1);
  EXPECT_EQ(vk.sizes(), torch::IntArrayRef({2, 5, 4, 3}));
  EXPECT_TRUE(vk.is_contiguous());
  EXPECT_TRUE(torch::equal(vk[1][4][3][2], var[1][2][3][4]));
  EXPECT_TRUE(torch::equal(kernel_order(vk, 1), var));

  auto v3 = kernel_order(var[0]);
  EXPECT_EQ(v3.sizes(), torch::IntArrayRef({5, 4, 3}));

  EXPECT_THROW(kernel_order(var, 5), c10::Error);
};

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
