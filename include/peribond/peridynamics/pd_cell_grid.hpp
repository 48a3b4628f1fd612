#pragma once

/**
 * @file pd_cell_grid.hpp
 * @brief Cell-linked list for horizon-limited neighbour search
 *
 * Algorithm:
 * 1. Bin particles into cells of edge h (the horizon)
 * 2. For each particle, check only the cells overlapped by the box of
 *    half-width h around it (normally 3x3 in 2-D, 3x3x3 in 3-D). The box is
 *    padded by a few ulps so that a pair whose computed distance is below h
 *    is never binned outside it
 * 3. Candidates closer than h are returned in ascending particle index,
 *    so results match an all-pairs scan entry for entry
 *
 * The grid is a host-side structure built from a host mirror of the
 * coordinate set.
 */

#include <peribond/peridynamics/pd_types.hpp>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace prb {
namespace pd {

// ============================================================================
// Cell Index
// ============================================================================

struct CellIndex {
    std::int64_t i = 0;
    std::int64_t j = 0;
    std::int64_t k = 0;

    bool operator==(const CellIndex& other) const {
        return i == other.i && j == other.j && k == other.k;
    }
};

struct CellHash {
    std::size_t operator()(const CellIndex& cell) const {
        // Large primes for good distribution
        constexpr std::uint64_t p1 = 73856093;
        constexpr std::uint64_t p2 = 19349663;
        constexpr std::uint64_t p3 = 83492791;
        return static_cast<std::size_t>(
            (static_cast<std::uint64_t>(cell.i) * p1) ^
            (static_cast<std::uint64_t>(cell.j) * p2) ^
            (static_cast<std::uint64_t>(cell.k) * p3));
    }
};

// ============================================================================
// Cell Grid
// ============================================================================

class CellGrid {
public:
    /**
     * @param cell_size Cell edge length, must be positive (normally the horizon)
     */
    explicit CellGrid(Real cell_size);

    /**
     * @brief Bin all particles of a coordinate set
     */
    void build(const PDCoordHostView& x);

    /**
     * @brief Collect the particles strictly closer than @p radius to particle p
     *
     * Particle p itself is excluded. The result is sorted by ascending index.
     * @p radius must not exceed the cell size.
     */
    void find_particle_neighbors(Index p, const PDCoordHostView& x, Real radius,
                                 std::vector<Index>& neighbors) const;

    /**
     * @brief Number of particles strictly closer than @p radius to particle p
     */
    Index count_particle_neighbors(Index p, const PDCoordHostView& x, Real radius) const;

    std::size_t num_cells() const { return cell_map_.size(); }
    Index num_particles() const { return num_particles_; }
    Real cell_size() const { return cell_size_; }

private:
    std::int64_t cell_coordinate(Real v) const;
    CellIndex get_cell(const PDCoordHostView& x, Index p) const;

    template<typename Visitor>
    void for_each_candidate(Index p, const PDCoordHostView& x, Real radius, Visitor&& visit) const;

    Real cell_size_;
    Real inv_cell_size_;
    Index num_particles_ = 0;
    Index dim_ = 3;

    std::unordered_map<CellIndex, std::size_t, CellHash> cell_map_;

    std::vector<std::size_t> cell_start_;    // Start index in particle_order_
    std::vector<std::size_t> cell_count_;    // Number of particles in cell
    std::vector<Index> particle_order_;      // Particle indices grouped by cell
    std::vector<CellIndex> particle_cells_;  // Cell of each particle
};

} // namespace pd
} // namespace prb
