// C/C++
#include <cstdio>

// external
#include <gtest/gtest.h>

// base
#include <configure.h>

// wrfdiag
#include <dataset/memory_dataset.hpp>
#include <dataset/netcdf_dataset.hpp>

#ifdef NETCDFOUTPUT
extern "C" {
#include <netcdf.h>
}
#endif

using namespace wrfdiag;
using torch::indexing::None;
using torch::indexing::Slice;

TEST(TestTimeRange, integer) {
  auto [start, count] = time_range(2, 5);
  EXPECT_EQ(start, 2);
  EXPECT_EQ(count, 1);

  std::tie(start, count) = time_range(-1, 5);
  EXPECT_EQ(start, 4);
  EXPECT_EQ(count, 1);

  EXPECT_THROW(time_range(5, 5), c10::Error);
};

TEST(TestTimeRange, slice) {
  auto [start, count] = time_range(Slice(), 4);
  EXPECT_EQ(start, 0);
  EXPECT_EQ(count, 4);

  std::tie(start, count) = time_range(Slice(1, 3), 4);
  EXPECT_EQ(start, 1);
  EXPECT_EQ(count, 2);

  std::tie(start, count) = time_range(Slice(-1, None), 4);
  EXPECT_EQ(start, 3);
  EXPECT_EQ(count, 1);

  std::tie(start, count) = time_range(None, 4);
  EXPECT_EQ(start, 0);
  EXPECT_EQ(count, 4);
};

TEST(TestTimeRange, invalid) {
  EXPECT_THROW(time_range(Slice(0, None, 2), 4), c10::ValueError);
  EXPECT_THROW(time_range(Slice(3, 1), 4), c10::ValueError);
  EXPECT_THROW(time_range(true, 4), c10::TypeError);
  EXPECT_THROW(time_range(torch::indexing::Ellipsis, 4), c10::TypeError);
};

TEST(TestMemoryDataset, read) {
  auto ds = std::make_shared<MemoryDatasetImpl>(3);
  ds->add_variable("P", torch::arange(3 * 4 * 2 * 5, torch::kFloat64)
                            .reshape({3, 4, 2, 5}));

  EXPECT_TRUE(ds->has_variable("P"));
  EXPECT_FALSE(ds->has_variable("PB"));
  EXPECT_EQ(ds->dimension_size("Time"), 3);
  EXPECT_EQ(ds->variables(), std::vector<std::string>({"P"}));

  auto p1 = ds->read("P", 1);
  EXPECT_EQ(p1.sizes(), torch::IntArrayRef({4, 2, 5}));
  EXPECT_TRUE(torch::equal(p1, ds->fields["P"][1]));

  auto p2 = ds->read("P", Slice(1, 2));
  EXPECT_EQ(p2.sizes(), torch::IntArrayRef({1, 4, 2, 5}));

  auto p3 = ds->read("P", Slice());
  EXPECT_EQ(p3.sizes(), torch::IntArrayRef({3, 4, 2, 5}));
  EXPECT_EQ(ds->nreads, 3);

  // reads are copies
  p3.zero_();
  EXPECT_FALSE(torch::equal(p3, ds->fields["P"]));
};

TEST(TestMemoryDataset, errors) {
  auto ds = std::make_shared<MemoryDatasetImpl>(2);
  EXPECT_THROW(ds->add_variable("P", torch::zeros({3, 4})), c10::Error);

  ds->add_variable("P", torch::zeros({2, 4}));
  EXPECT_THROW(ds->read("PB", 0), c10::Error);

  ds->close();
  EXPECT_FALSE(ds->is_open());
  EXPECT_THROW(ds->read("P", 0), c10::Error);
};

#ifdef NETCDFOUTPUT
TEST(TestNetcdfDataset, read) {
  std::string fname = "test_dataset.nc";
  int ncid, dims[3], varid, err;

  err = nc_create(fname.c_str(), NC_CLOBBER, &ncid);
  ASSERT_EQ(err, NC_NOERR);
  nc_def_dim(ncid, "Time", NC_UNLIMITED, &dims[0]);
  nc_def_dim(ncid, "bottom_top", 2, &dims[1]);
  nc_def_dim(ncid, "west_east", 3, &dims[2]);
  nc_def_var(ncid, "T", NC_FLOAT, 3, dims, &varid);
  ASSERT_EQ(nc_enddef(ncid), NC_NOERR);

  std::vector<float> data(4 * 2 * 3);
  for (size_t i = 0; i < data.size(); ++i) data[i] = i;

  size_t start[3] = {0, 0, 0};
  size_t count[3] = {4, 2, 3};
  err = nc_put_vara_float(ncid, varid, start, count, data.data());
  ASSERT_EQ(err, NC_NOERR);
  ASSERT_EQ(nc_close(ncid), NC_NOERR);

  NetcdfDatasetImpl ds(fname);
  EXPECT_EQ(ds.dimension_size("Time"), 4);
  EXPECT_TRUE(ds.has_variable("T"));
  EXPECT_FALSE(ds.has_variable("P"));
  EXPECT_EQ(ds.variables(), std::vector<std::string>({"T"}));

  auto t2 = ds.read("T", 2);
  EXPECT_EQ(t2.sizes(), torch::IntArrayRef({2, 3}));
  EXPECT_EQ(t2.dtype(), torch::kFloat64);
  EXPECT_DOUBLE_EQ(t2[0][0].item<double>(), 12.);

  auto t13 = ds.read("T", Slice(1, 3));
  EXPECT_EQ(t13.sizes(), torch::IntArrayRef({2, 2, 3}));
  EXPECT_DOUBLE_EQ(t13[1][1][2].item<double>(), 17.);

  ds.close();
  EXPECT_FALSE(ds.is_open());
  EXPECT_THROW(ds.read("T", 0), c10::Error);

  std::remove(fname.c_str());
};
#endif

TEST(TestNetcdfDataset, missing_file) {
  EXPECT_THROW(NetcdfDatasetImpl("no_such_file.nc"), c10::Error);
};

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
