#pragma once

// C/C++
#include <cmath>

// base
#include <configure.h>  // DISPATCH_MACRO

// wrfdiag
#include <constants.hpp>

namespace wrfdiag {

/*! Temperature from potential temperature
 * \param tk output temperature [K]
 * \param pres full pressure [Pa]
 * \param theta full potential temperature [K]
 */
template <typename T>
DISPATCH_MACRO void tk_from_theta(T *tk, T const *pres, T const *theta) {
  *tk = *theta * pow(*pres / Constants::P1000mb, Constants::Rd / Constants::Cp);
}

}  // namespace wrfdiag
