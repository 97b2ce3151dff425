#pragma once

namespace orrery {

/// Newtonian gravitational constant (CODATA 2018), N m^2 kg^-2.
inline constexpr double G = 6.67430e-11;

/// Seconds per day.
inline constexpr double DAY = 24.0 * 60.0 * 60.0;

/// Astronomical unit in metres (IAU 2012).
inline constexpr double AU = 1.495978707e11;

} // namespace orrery
