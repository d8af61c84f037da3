#pragma once

namespace wrfdiag {
enum index {
  // kernel axis order of a 3-D field
  IWE = 0,  //! west-east
  ISN = 1,  //! south-north
  IVT = 2,  //! vertical

  // kernel status codes
  IOK = 0,       //! success
  INOLEVEL = 1,  //! no level far enough above the surface
  INOLAYER = 2,  //! column too shallow to bracket that level
};

enum {
  // time layouts
  kSingleTime = 0,
  kMultiTime = 1,

  // level specifications
  kScalarLevel = 0,
  kLevelSequence = 1,

  // bracketing index sentinel
  kLevelNotFound = 0,
};
}  // namespace wrfdiag
