#pragma once

// C/C++
#include <cstdint>

// base
#include <configure.h>  // DISPATCH_MACRO

// wrfdiag
#include <index.h>

namespace wrfdiag {

/*! Locate the layer bracketing a pressure level in one column
 * \param pres pressure of the column, length nz, either ordering
 * \param level target pressure
 * \param nz number of layers
 * \return 1-based index of the upper bracketing layer, or kLevelNotFound.
 *         A bracket always spans layers (idx - 1, idx), so idx >= 2.
 */
template <typename T>
DISPATCH_MACRO int64_t find_level(T const *pres, T level, int nz) {
  for (int k = 1; k < nz; ++k) {
    if ((pres[k - 1] >= level && pres[k] <= level) ||
        (pres[k - 1] <= level && pres[k] >= level)) {
      return k + 1;
    }
  }
  return kLevelNotFound;
}

/*! Locate the bracketing layers of several pressure levels
 * \param idx output indices, length nlev
 * \param pres pressure of the column, length nz
 * \param levels target pressures, length nlev
 */
template <typename T>
DISPATCH_MACRO void find_levels(int64_t *idx, T const *pres, T const *levels,
                                int nz, int nlev) {
  for (int n = 0; n < nlev; ++n) idx[n] = find_level(pres, levels[n], nz);
}

}  // namespace wrfdiag
