#pragma once

/**
 * @file pd_distance.hpp
 * @brief Euclidean distance between particles
 */

#include <peribond/peridynamics/pd_types.hpp>

#include <cmath>
#include <span>

namespace prb {
namespace pd {

/**
 * @brief Distance between particles i and j of a coordinate set
 *
 * Device-callable. Works for any number of components; the coordinate
 * views used by the library carry 2 or 3.
 */
template<typename CoordView>
KOKKOS_INLINE_FUNCTION
Real euclid(const CoordView& x, Index i, Index j) {
    Real r2 = 0.0;
    for (Index d = 0; d < static_cast<Index>(x.extent(1)); ++d) {
        Real dx = x(j, d) - x(i, d);
        r2 += dx * dx;
    }
    return std::sqrt(r2);
}

/**
 * @brief Distance between two points given as component lists
 * @throws DimensionMismatchError if the points differ in length
 */
inline Real euclid(std::span<const Real> a, std::span<const Real> b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError(a.size(), b.size());
    }

    Real r2 = 0.0;
    for (std::size_t d = 0; d < a.size(); ++d) {
        Real dx = b[d] - a[d];
        r2 += dx * dx;
    }
    return std::sqrt(r2);
}

} // namespace pd
} // namespace prb
