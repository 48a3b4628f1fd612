#pragma once

#include <cstddef>
#include <cstdint>
#include <array>

namespace prb {

// ============================================================================
// Precision Types
// ============================================================================

#ifdef PERIBOND_REAL
using Real = PERIBOND_REAL;
#else
using Real = double;  // Default to double precision
#endif

// Integer types
using Index = std::size_t;
using Int = std::int32_t;

// ============================================================================
// Small Fixed-Size Vectors
// ============================================================================

template<typename T, std::size_t N>
using Array = std::array<T, N>;

using Vec3r = Array<Real, 3>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {

/// Particle coordinates carry either two or three components
inline constexpr Index min_dimension = 2;
inline constexpr Index max_dimension = 3;

} // namespace constants

} // namespace prb
