#pragma once

namespace wrfdiag {
namespace Constants {
//! gas constant of dry air [J/(kg K)], as used for potential temperature
constexpr double Rd = 287.0;

//! specific heat of dry air at constant pressure [J/(kg K)]
constexpr double Cp = 3.5 * Rd;

//! reference pressure of potential temperature [Pa]
constexpr double P1000mb = 100000.;

//! base state potential temperature of the model [K]
constexpr double T0 = 300.;

//! gravitational acceleration [m/s^2]
constexpr double G = 9.81;

// sea level pressure reduction
constexpr double RdSlp = 287.04;
constexpr double Gamma = 0.0065;        //! standard lapse rate [K/m]
constexpr double Tc = 273.16 + 17.5;   //! hot surface threshold [K]
constexpr double PConst = 10000.;      //! depth of the surface layer [Pa]
}  // namespace Constants
}  // namespace wrfdiag
