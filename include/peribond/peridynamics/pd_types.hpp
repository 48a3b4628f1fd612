#pragma once

/**
 * @file pd_types.hpp
 * @brief Core type definitions for the peridynamic bond structure
 *
 * Coordinates and bond rows live in Kokkos views so that every per-particle
 * kernel can run on the default execution space.
 */

#include <peribond/core/core.hpp>
#include <Kokkos_Core.hpp>

#include <string>

namespace prb {
namespace pd {

// ============================================================================
// Neighbour Search Options
// ============================================================================

/**
 * @brief Proximity search used by the family counter and the builder
 */
enum class SearchMethod {
    BruteForce,     ///< O(N^2) all-pairs scan on the device
    CellList        ///< Uniform cell binning (cell edge = horizon) on the host
};

/**
 * @brief What the builder does when a family is wider than the row capacity
 */
enum class OverflowPolicy {
    Throw,          ///< Raise CapacityExceededError, keep the previous structure
    Warn,           ///< Keep the first neighbours in index order, log a warning
    Truncate        ///< Keep the first neighbours in index order silently
};

inline const char* to_string(SearchMethod method) {
    switch (method) {
        case SearchMethod::BruteForce: return "brute_force";
        case SearchMethod::CellList:   return "cell_list";
        default:                       return "unknown";
    }
}

inline const char* to_string(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::Throw:    return "throw";
        case OverflowPolicy::Warn:     return "warn";
        case OverflowPolicy::Truncate: return "truncate";
        default:                       return "unknown";
    }
}

inline SearchMethod parse_search_method(const std::string& name) {
    if (name == "brute_force") return SearchMethod::BruteForce;
    if (name == "cell_list") return SearchMethod::CellList;
    throw InvalidArgumentError("Unknown neighbour search method: '" + name + "'");
}

inline OverflowPolicy parse_overflow_policy(const std::string& name) {
    if (name == "throw") return OverflowPolicy::Throw;
    if (name == "warn") return OverflowPolicy::Warn;
    if (name == "truncate") return OverflowPolicy::Truncate;
    throw InvalidArgumentError("Unknown capacity overflow policy: '" + name + "'");
}

// ============================================================================
// Kokkos View Types
// ============================================================================

// Coordinate set: [num_particles][dim], dim is 2 or 3
using PDCoordView = Kokkos::View<Real**, Kokkos::LayoutRight>;

// Fixed-width bond rows: [num_particles][capacity], one contiguous row per particle
using PDBondListView = Kokkos::View<Index**, Kokkos::LayoutRight>;

using PDCountView = Kokkos::View<Index*>;
using PDScalarView = Kokkos::View<Real*>;

// Host mirrors
using PDCoordHostView = PDCoordView::HostMirror;
using PDBondListHostView = PDBondListView::HostMirror;
using PDCountHostView = PDCountView::HostMirror;
using PDScalarHostView = PDScalarView::HostMirror;

/**
 * @brief Validate the shape of a coordinate set
 */
inline void require_coordinates(const PDCoordView& x) {
    PRB_REQUIRE(x.extent(1) >= constants::min_dimension &&
                x.extent(1) <= constants::max_dimension,
                "particle coordinates must have 2 or 3 components, got " +
                std::to_string(x.extent(1)));
}

} // namespace pd
} // namespace prb
