#pragma once

/**
 * @file pd_family.hpp
 * @brief Family sizes (neighbours within the horizon) per particle
 *
 * The family counter is used to size the bond list before it exists;
 * it knows nothing about the row capacity itself.
 */

#include <peribond/peridynamics/pd_types.hpp>
#include <peribond/peridynamics/pd_distance.hpp>
#include <peribond/peridynamics/pd_cell_grid.hpp>

#include <algorithm>

namespace prb {
namespace pd {

/**
 * @brief Count, for every particle i, the particles j != i with |x_j - x_i| < horizon
 *
 * A non-positive horizon yields all zeros.
 */
inline PDCountView family(const PDCoordView& x, Real horizon,
                          SearchMethod method = SearchMethod::BruteForce) {
    require_coordinates(x);
    const Index num_particles = x.extent(0);

    PDCountView counts("family", num_particles);
    if (horizon <= 0.0 || num_particles == 0) {
        return counts;
    }

    if (method == SearchMethod::CellList) {
        auto x_host = Kokkos::create_mirror_view(x);
        Kokkos::deep_copy(x_host, x);

        CellGrid grid(horizon);
        grid.build(x_host);

        auto counts_host = Kokkos::create_mirror_view(counts);
        for (Index i = 0; i < num_particles; ++i) {
            counts_host(i) = grid.count_particle_neighbors(i, x_host, horizon);
        }
        Kokkos::deep_copy(counts, counts_host);
        return counts;
    }

    Kokkos::parallel_for("family", num_particles,
        KOKKOS_LAMBDA(const Index i) {
            Index count = 0;
            for (Index j = 0; j < num_particles; ++j) {
                if (j != i && euclid(x, i, j) < horizon) {
                    ++count;
                }
            }
            counts(i) = count;
        });
    Kokkos::fence("family");

    return counts;
}

/**
 * @brief Largest family size
 */
inline Index max_family(const PDCountView& family_size) {
    Index result = 0;
    Kokkos::parallel_reduce("max_family", family_size.extent(0),
        KOKKOS_LAMBDA(const Index i, Index& current) {
            if (family_size(i) > current) current = family_size(i);
        }, Kokkos::Max<Index>(result));
    return result;
}

/**
 * @brief Row capacity that holds every family plus a safety margin
 *
 * Never less than one, since the bond list needs a positive width.
 */
inline Index required_capacity(const PDCountView& family_size, Index safety_margin = 0) {
    return std::max<Index>(max_family(family_size) + safety_margin, 1);
}

} // namespace pd
} // namespace prb
