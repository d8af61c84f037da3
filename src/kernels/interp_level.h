#pragma once

// C/C++
#include <cstdint>

// base
#include <configure.h>  // DISPATCH_MACRO

// wrfdiag
#include <index.h>

namespace wrfdiag {

/*! Linear interpolation of one column onto a pressure level
 * \param var variable of the column, length nz
 * \param pres pressure of the column, length nz
 * \param level target pressure
 * \param idx upper bracketing layer from find_level (1-based)
 * \return interpolated value, 0 if idx is kLevelNotFound
 */
template <typename T>
DISPATCH_MACRO T interp_level(T const *var, T const *pres, T level,
                              int64_t idx) {
  if (idx < 2) return 0.;

  int64_t k1 = idx - 2;
  int64_t k2 = idx - 1;

  auto x1 = pres[k1];
  auto x2 = pres[k2];

  if (x2 != x1)
    return ((level - x1) * var[k2] + (x2 - level) * var[k1]) / (x2 - x1);
  else
    return (var[k1] + var[k2]) / 2.;
}

template <typename T>
DISPATCH_MACRO void interp_levels(T *out, T const *var, T const *pres,
                                  T const *levels, int64_t const *idx,
                                  int nlev) {
  for (int n = 0; n < nlev; ++n)
    out[n] = interp_level(var, pres, levels[n], idx[n]);
}

}  // namespace wrfdiag
