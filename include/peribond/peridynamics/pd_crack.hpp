#pragma once

/**
 * @file pd_crack.hpp
 * @brief Straight pre-crack in the x-y plane
 *
 * A bond is cut when the segment between its two particles properly crosses
 * the crack segment. Only the x and y components are used, so in 3-D the
 * crack runs through the whole thickness.
 */

#include <peribond/peridynamics/pd_types.hpp>
#include <peribond/peridynamics/pd_neighbor.hpp>
#include <peribond/io/config_reader.hpp>

#include <array>

namespace prb {
namespace pd {

struct CrackSegment {
    std::array<Real, 2> start = {0.0, 0.0};
    std::array<Real, 2> end = {0.0, 0.0};

    /**
     * @brief True if the bond between particles i and j crosses the crack
     *
     * Touching the crack line at an end point does not count as crossing.
     */
    bool cuts(const PDCoordHostView& x, Index i, Index j) const {
        const std::array<Real, 2> p = {x(i, 0), x(i, 1)};
        const std::array<Real, 2> q = {x(j, 0), x(j, 1)};

        const Real o1 = orientation(start, end, p);
        const Real o2 = orientation(start, end, q);
        const Real o3 = orientation(p, q, start);
        const Real o4 = orientation(p, q, end);

        return ((o1 > 0.0 && o2 < 0.0) || (o1 < 0.0 && o2 > 0.0)) &&
               ((o3 > 0.0 && o4 < 0.0) || (o3 < 0.0 && o4 > 0.0));
    }

    /**
     * @brief Read `start: [x, y]` and `end: [x, y]` from a section
     */
    static CrackSegment from_config(const io::ConfigSection& section) {
        auto a = section.get_real_array("start");
        auto b = section.get_real_array("end");
        PRB_REQUIRE(a.size() == 2 && b.size() == 2,
                    "section '" + section.name() + "' needs 2-component start and end points");

        CrackSegment crack;
        crack.start = {a[0], a[1]};
        crack.end = {b[0], b[1]};
        return crack;
    }

private:
    // Twice the signed area of triangle (a, b, c)
    static Real orientation(const std::array<Real, 2>& a, const std::array<Real, 2>& b,
                            const std::array<Real, 2>& c) {
        return (b[0] - a[0]) * (c[1] - a[1]) - (b[1] - a[1]) * (c[0] - a[0]);
    }
};

/**
 * @brief Remove every bond of @p bonds that crosses @p crack
 *
 * @param x Reference coordinates the list was built from
 * @return Number of row entries removed
 */
inline Index apply_crack(BondList& bonds, const PDCoordView& x, const CrackSegment& crack) {
    PRB_REQUIRE(x.extent(0) == bonds.num_particles(),
                "coordinate set does not match the bond list");
    auto x_host = Kokkos::create_mirror_view(x);
    Kokkos::deep_copy(x_host, x);
    return bonds.exclude_bonds([&](Index i, Index j) { return crack.cuts(x_host, i, j); });
}

} // namespace pd
} // namespace prb
