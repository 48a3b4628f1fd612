#pragma once

/**
 * @file pd_coordinates.hpp
 * @brief Construction of coordinate sets
 */

#include <peribond/peridynamics/pd_types.hpp>

#include <string>
#include <vector>

namespace prb {
namespace pd {

/**
 * @brief Coordinate set from a list of points
 * @throws DimensionMismatchError if the points do not all have the same length
 */
inline PDCoordView make_coordinates(const std::vector<std::vector<Real>>& points,
                                    const std::string& label = "x") {
    const Index num_particles = points.size();
    const Index dim = points.empty() ? constants::max_dimension : points.front().size();

    for (const auto& p : points) {
        if (p.size() != dim) {
            throw DimensionMismatchError(dim, p.size());
        }
    }

    PDCoordView x(label, num_particles, dim);
    require_coordinates(x);

    auto x_host = Kokkos::create_mirror_view(x);
    for (Index i = 0; i < num_particles; ++i) {
        for (Index d = 0; d < dim; ++d) {
            x_host(i, d) = points[i][d];
        }
    }
    Kokkos::deep_copy(x, x_host);
    return x;
}

/**
 * @brief Regular lattice of nx * ny (* nz) particles
 *
 * Particles are numbered x-fastest. For dim == 2 the nz argument is ignored.
 */
inline PDCoordView make_lattice(Index nx, Index ny, Index nz, Real spacing,
                                Index dim = 3, const Vec3r& origin = {0.0, 0.0, 0.0}) {
    PRB_REQUIRE(spacing > 0.0, "lattice spacing must be positive");
    if (dim == 2) nz = 1;

    PDCoordView x("x", nx * ny * nz, dim);
    require_coordinates(x);

    auto x_host = Kokkos::create_mirror_view(x);
    Index idx = 0;
    for (Index iz = 0; iz < nz; ++iz)
        for (Index iy = 0; iy < ny; ++iy)
            for (Index ix = 0; ix < nx; ++ix) {
                x_host(idx, 0) = origin[0] + ix * spacing;
                x_host(idx, 1) = origin[1] + iy * spacing;
                if (dim == 3) {
                    x_host(idx, 2) = origin[2] + iz * spacing;
                }
                idx++;
            }

    Kokkos::deep_copy(x, x_host);
    return x;
}

/**
 * @brief Host copy of a one-dimensional view
 */
template<typename ViewType>
std::vector<typename ViewType::non_const_value_type> to_host_vector(const ViewType& view) {
    auto host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), view);
    std::vector<typename ViewType::non_const_value_type> result(host.extent(0));
    for (std::size_t i = 0; i < result.size(); ++i) {
        result[i] = host(i);
    }
    return result;
}

} // namespace pd
} // namespace prb
