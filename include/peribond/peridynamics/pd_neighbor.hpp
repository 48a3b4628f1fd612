#pragma once

/**
 * @file pd_neighbor.hpp
 * @brief Fixed-capacity peridynamic bond list
 *
 * Row i of the bond list holds the particles currently bonded to particle i.
 * Only the first valid_count(i) entries of a row are meaningful; slots past
 * that count hold stale values and must never be read as bonds. The list is
 * built once from the reference coordinates and afterwards only shrinks:
 * break_bonds() removes bonds in place by swapping the last valid entry into
 * the freed slot.
 */

#include <peribond/peridynamics/pd_types.hpp>
#include <peribond/peridynamics/pd_distance.hpp>
#include <peribond/peridynamics/pd_cell_grid.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace prb {
namespace pd {

struct BuildOptions {
    SearchMethod search = SearchMethod::BruteForce;
    OverflowPolicy overflow = OverflowPolicy::Throw;
};

/**
 * @brief Summary of a bond list construction
 */
struct BuildReport {
    Index num_particles = 0;
    Index capacity = 0;
    Index total_bonds = 0;       ///< Sum of valid counts after construction
    Index max_family = 0;        ///< Largest family before truncation
    Index truncated_rows = 0;    ///< Rows whose family did not fit into the capacity

    bool truncated() const { return truncated_rows > 0; }
};

namespace detail {

/**
 * @brief Fill every row with its neighbours by an all-pairs scan
 *
 * Neighbours are appended in ascending index order until the row is full;
 * family(i) receives the untruncated count.
 */
inline void fill_rows_brute_force(const PDCoordView& x, Real horizon,
                                  const PDBondListView& bonds,
                                  const PDCountView& valid,
                                  const PDCountView& family_size) {
    const Index num_particles = x.extent(0);
    const Index capacity = bonds.extent(1);

    Kokkos::parallel_for("build_bond_list", num_particles,
        KOKKOS_LAMBDA(const Index i) {
            Index count = 0;
            Index found = 0;
            for (Index j = 0; j < num_particles; ++j) {
                if (j == i) continue;
                if (euclid(x, i, j) < horizon) {
                    if (count < capacity) {
                        bonds(i, count) = j;
                        ++count;
                    }
                    ++found;
                }
            }
            valid(i) = count;
            family_size(i) = found;
        });
    Kokkos::fence("build_bond_list");
}

/**
 * @brief Same result as fill_rows_brute_force, using a host cell grid
 */
inline void fill_rows_cell_list(const PDCoordView& x, Real horizon,
                                const PDBondListView& bonds,
                                const PDCountView& valid,
                                const PDCountView& family_size) {
    const Index num_particles = x.extent(0);
    const Index capacity = bonds.extent(1);

    auto x_host = Kokkos::create_mirror_view(x);
    Kokkos::deep_copy(x_host, x);
    auto bonds_host = Kokkos::create_mirror_view(bonds);
    Kokkos::deep_copy(bonds_host, bonds);
    auto valid_host = Kokkos::create_mirror_view(valid);
    auto family_host = Kokkos::create_mirror_view(family_size);

    CellGrid grid(horizon);
    grid.build(x_host);

    std::vector<Index> neighbors;
    for (Index i = 0; i < num_particles; ++i) {
        grid.find_particle_neighbors(i, x_host, horizon, neighbors);

        const Index count = std::min<Index>(neighbors.size(), capacity);
        for (Index k = 0; k < count; ++k) {
            bonds_host(i, k) = neighbors[k];
        }
        valid_host(i) = count;
        family_host(i) = neighbors.size();
    }

    Kokkos::deep_copy(bonds, bonds_host);
    Kokkos::deep_copy(valid, valid_host);
    Kokkos::deep_copy(family_size, family_host);
}

/**
 * @brief Remove every bond of every row whose current length is >= horizon
 *
 * Per row: a broken bond at slot k is overwritten by the last valid entry
 * and the count shrinks; slot k is then examined again. Slots at or past
 * the new count keep whatever they held. Rows are independent.
 *
 * @return Number of bonds removed
 */
inline Index break_rows(const PDCoordView& x, Real horizon,
                        const PDBondListView& bonds,
                        const PDCountView& valid) {
    Index broken = 0;

    Kokkos::parallel_reduce("break_bonds", valid.extent(0),
        KOKKOS_LAMBDA(const Index i, Index& num_broken) {
            Index count = valid(i);
            Index k = 0;
            while (k < count) {
                const Index j = bonds(i, k);
                if (euclid(x, i, j) >= horizon) {
                    bonds(i, k) = bonds(i, count - 1);
                    --count;
                    ++num_broken;
                } else {
                    ++k;
                }
            }
            valid(i) = count;
        }, broken);

    return broken;
}

} // namespace detail

/**
 * @brief Peridynamic bond list with per-particle valid-neighbour counts
 */
class BondList {
public:
    BondList() = default;

    /**
     * @brief Build the bond list from reference coordinates
     *
     * For each particle i, particles j != i with |x_j - x_i| < horizon are
     * stored in ascending index order. Unused slots are zero. When a family
     * is wider than @p capacity the first @p capacity neighbours are kept and
     * options.overflow decides whether that is an error.
     *
     * @param x Coordinate set [num_particles][2 or 3]
     * @param horizon Bond cut-off (non-positive: no bonds)
     * @param capacity Row width, must be positive
     * @throws CapacityExceededError under OverflowPolicy::Throw, in which case
     *         the previous state of the list is kept
     */
    BuildReport build(const PDCoordView& x, Real horizon, Index capacity,
                      const BuildOptions& options = BuildOptions{}) {
        require_coordinates(x);
        PRB_REQUIRE(capacity > 0, "bond list capacity must be positive");
        PRB_SCOPED_TIMER("BondList::build");

        const Index num_particles = x.extent(0);

        PDBondListView bonds("bond_list", num_particles, capacity);
        PDCountView valid("valid_count", num_particles);
        PDCountView family_size("family", num_particles);

        if (horizon > 0.0 && num_particles > 0) {
            if (options.search == SearchMethod::CellList) {
                detail::fill_rows_cell_list(x, horizon, bonds, valid, family_size);
            } else {
                detail::fill_rows_brute_force(x, horizon, bonds, valid, family_size);
            }
        }

        BuildReport report;
        report.num_particles = num_particles;
        report.capacity = capacity;

        auto valid_host = Kokkos::create_mirror_view(valid);
        Kokkos::deep_copy(valid_host, valid);
        auto family_host = Kokkos::create_mirror_view(family_size);
        Kokkos::deep_copy(family_host, family_size);

        for (Index i = 0; i < num_particles; ++i) {
            report.total_bonds += valid_host(i);
            report.max_family = std::max(report.max_family, family_host(i));
            if (family_host(i) > capacity) {
                report.truncated_rows++;
            }
        }

        if (report.truncated()) {
            switch (options.overflow) {
                case OverflowPolicy::Throw:
                    throw CapacityExceededError(report.truncated_rows, report.max_family, capacity);
                case OverflowPolicy::Warn:
                    PRB_LOG_WARN("BondList: {} particle(s) have more than {} neighbours "
                                 "(largest family {}), excess bonds dropped",
                                 report.truncated_rows, capacity, report.max_family);
                    break;
                case OverflowPolicy::Truncate:
                    break;
            }
        }

        bond_list_ = bonds;
        valid_count_ = valid;
        initial_count_ = PDCountView("initial_count", num_particles);
        Kokkos::deep_copy(initial_count_, valid_count_);
        num_particles_ = num_particles;
        dimension_ = x.extent(1);
        capacity_ = capacity;
        built_ = true;

        Real avg_neighbors = num_particles > 0
            ? static_cast<Real>(report.total_bonds) / static_cast<Real>(num_particles)
            : 0.0;
        PRB_LOG_INFO("BondList: {} particles, {} bonds, avg neighbours: {:.1f}, "
                     "max family: {}, capacity: {}, search: {}",
                     num_particles, report.total_bonds, avg_neighbors,
                     report.max_family, capacity, to_string(options.search));

        return report;
    }

    /**
     * @brief Drop bonds whose current length reached the horizon
     *
     * @param x Updated coordinate set, same particles and dimension as at build
     * @param horizon Bond cut-off
     * @return Number of bonds broken by this call
     */
    Index break_bonds(const PDCoordView& x, Real horizon) {
        PRB_REQUIRE(built(), "break_bonds called before build");
        PRB_REQUIRE(x.extent(0) == num_particles_,
                    "expected " + std::to_string(num_particles_) + " particles, got " +
                    std::to_string(x.extent(0)));
        PRB_REQUIRE(x.extent(1) == dimension_,
                    "expected " + std::to_string(dimension_) + " coordinate components, got " +
                    std::to_string(x.extent(1)));

        Index broken = detail::break_rows(x, horizon, bond_list_, valid_count_);

        PRB_LOG_DEBUG("BondList: {} bond(s) broken", broken);
        return broken;
    }

    /**
     * @brief Remove bonds selected by a host predicate, as if never built
     *
     * Used to pre-crack a body right after build(). Rows stay in ascending
     * order with zeroed tails, and the remaining counts become the new
     * reference for damage().
     *
     * @param excluded Callable bool(Index i, Index j), evaluated on the host
     * @return Number of row entries removed (each bond appears in two rows)
     */
    template<typename Predicate>
    Index exclude_bonds(Predicate&& excluded) {
        PRB_REQUIRE(built(), "exclude_bonds called before build");
        PRB_REQUIRE(broken_bonds() == 0, "bonds can only be excluded before any bond breaks");

        auto rows = bond_list_host();
        auto valid = valid_count_host();

        Index removed = 0;
        for (Index i = 0; i < num_particles_; ++i) {
            Index kept = 0;
            for (Index k = 0; k < valid(i); ++k) {
                const Index j = rows(i, k);
                if (excluded(i, j)) {
                    ++removed;
                    continue;
                }
                rows(i, kept++) = j;
            }
            for (Index k = kept; k < capacity_; ++k) {
                rows(i, k) = 0;
            }
            valid(i) = kept;
        }

        Kokkos::deep_copy(bond_list_, rows);
        Kokkos::deep_copy(valid_count_, valid);
        Kokkos::deep_copy(initial_count_, valid_count_);

        PRB_LOG_INFO("BondList: {} bond entries excluded", removed);
        return removed;
    }

    /**
     * @brief Fraction of each particle's initial bonds that are broken
     *
     * Particles that started without bonds report zero.
     */
    PDScalarView damage() const {
        PRB_REQUIRE(built(), "damage requested before build");

        PDScalarView result("damage", num_particles_);
        auto valid = valid_count_;
        auto initial = initial_count_;

        Kokkos::parallel_for("bond_damage", num_particles_,
            KOKKOS_LAMBDA(const Index i) {
                if (initial(i) == 0) {
                    result(i) = 0.0;
                } else {
                    result(i) = 1.0 - static_cast<Real>(valid(i)) / static_cast<Real>(initial(i));
                }
            });
        Kokkos::fence("bond_damage");

        return result;
    }

    /**
     * @brief Number of intact bonds (sum of valid counts)
     */
    Index total_bonds() const {
        Index total = 0;
        auto valid = valid_count_;
        Kokkos::parallel_reduce("total_bonds", valid.extent(0),
            KOKKOS_LAMBDA(const Index i, Index& sum) {
                sum += valid(i);
            }, total);
        return total;
    }

    /**
     * @brief Number of bonds broken since construction
     */
    Index broken_bonds() const {
        Index broken = 0;
        auto valid = valid_count_;
        auto initial = initial_count_;
        Kokkos::parallel_reduce("broken_bonds", valid.extent(0),
            KOKKOS_LAMBDA(const Index i, Index& sum) {
                sum += initial(i) - valid(i);
            }, broken);
        return broken;
    }

    /**
     * @brief Host copy of the meaningful prefix of row i
     */
    std::vector<Index> neighbors(Index i) const {
        PRB_CHECK_RANGE(i, num_particles_);

        auto row = Kokkos::subview(bond_list_, i, Kokkos::ALL);
        auto row_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), row);
        auto count = Kokkos::subview(valid_count_, i);
        auto count_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), count);

        std::vector<Index> result(count_host());
        for (Index k = 0; k < result.size(); ++k) {
            result[k] = row_host(k);
        }
        return result;
    }

    // Host snapshots (always a fresh allocation)
    PDBondListHostView bond_list_host() const {
        auto host = Kokkos::create_mirror(bond_list_);
        Kokkos::deep_copy(host, bond_list_);
        return host;
    }

    PDCountHostView valid_count_host() const {
        auto host = Kokkos::create_mirror(valid_count_);
        Kokkos::deep_copy(host, valid_count_);
        return host;
    }

    // Accessors
    bool built() const { return built_; }
    Index num_particles() const { return num_particles_; }
    Index dimension() const { return dimension_; }
    Index capacity() const { return capacity_; }

    const PDBondListView& bond_list() const { return bond_list_; }
    const PDCountView& valid_count() const { return valid_count_; }
    const PDCountView& initial_count() const { return initial_count_; }

private:
    Index num_particles_ = 0;
    Index dimension_ = 0;
    Index capacity_ = 0;
    bool built_ = false;

    PDBondListView bond_list_;      ///< Bonded particle indices [num_particles][capacity]
    PDCountView valid_count_;       ///< Meaningful entries per row [num_particles]
    PDCountView initial_count_;     ///< valid_count_ right after build [num_particles]
};

} // namespace pd
} // namespace prb
