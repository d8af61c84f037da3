#pragma once

// C/C++
#include <cmath>

// base
#include <configure.h>  // DISPATCH_MACRO

// wrfdiag
#include <constants.hpp>
#include <index.h>

namespace wrfdiag {

/*! Sea level pressure of one column
 *
 * The temperature at PConst above the surface is extrapolated down to the
 * surface and to sea level with a standard lapse rate, then the hydrostatic
 * equation is integrated from the lowest half level to sea level.
 *
 * \param slp output sea level pressure [hPa]
 * \param z geopotential height at half levels [m], length nz
 * \param t temperature [K], length nz
 * \param p full pressure [Pa], length nz
 * \param q water vapor mixing ratio [kg/kg], length nz
 * \param nz number of vertical levels
 * \return IOK, INOLEVEL or INOLAYER
 */
template <typename T>
DISPATCH_MACRO int seaprs(T *slp, T const *z, T const *t, T const *p,
                          T const *q, int nz) {
  // least level that is PConst above the surface
  int level = -1;
  for (int k = 0; k < nz; ++k) {
    if (p[k] < p[0] - Constants::PConst) {
      level = k;
      break;
    }
  }
  if (level == -1) return INOLEVEL;

  int klo = level - 1 > 0 ? level - 1 : 0;
  int khi = klo + 1 < nz - 2 ? klo + 1 : nz - 2;
  if (klo >= khi) return INOLAYER;

  // virtual temperature
  T plo = p[klo];
  T phi = p[khi];
  T tlo = t[klo] * (1. + 0.608 * q[klo]);
  T thi = t[khi] * (1. + 0.608 * q[khi]);
  T zlo = z[klo];
  T zhi = z[khi];

  T p_at_pconst = p[0] - Constants::PConst;
  T frac = log(p_at_pconst / phi) / log(plo / phi);
  T t_at_pconst = thi - (thi - tlo) * frac;
  T z_at_pconst = zhi - (zhi - zlo) * frac;

  T t_surf = t_at_pconst * pow(p[0] / p_at_pconst,
                               Constants::Gamma * Constants::RdSlp /
                                   Constants::G);
  T t_sea_level = t_at_pconst + Constants::Gamma * z_at_pconst;

  // both the surface and sea level temperatures are too hot
  if (t_sea_level >= Constants::Tc) {
    if (t_surf <= Constants::Tc) {
      t_sea_level = Constants::Tc;
    } else {
      t_sea_level = Constants::Tc - 0.005 * (t_surf - Constants::Tc) *
                                        (t_surf - Constants::Tc);
    }
  }

  // Pa -> hPa
  *slp = 0.01 * p[0] *
         exp((2. * Constants::G * z[0]) /
             (Constants::RdSlp * (t_sea_level + t_surf)));
  return IOK;
}

}  // namespace wrfdiag
