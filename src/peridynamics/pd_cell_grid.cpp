/**
 * @file pd_cell_grid.cpp
 * @brief Cell-linked list implementation
 */

#include <peribond/peridynamics/pd_cell_grid.hpp>
#include <peribond/peridynamics/pd_distance.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace prb {
namespace pd {

namespace {

// Bound on |cell coordinate| so the int64 cast and the +-1 cell walk stay defined
constexpr Real kMaxCellCoordinate = 4.0e18;

// Relative widening of the search box, in units of machine epsilon
constexpr Real kReachPadding = 16.0;

} // namespace

CellGrid::CellGrid(Real cell_size)
    : cell_size_(cell_size)
    , inv_cell_size_(0.0)
{
    PRB_REQUIRE(cell_size > 0.0, "cell size must be positive, got " + std::to_string(cell_size));
    inv_cell_size_ = 1.0 / cell_size;
}

void CellGrid::build(const PDCoordHostView& x) {
    num_particles_ = x.extent(0);
    dim_ = x.extent(1);
    PRB_REQUIRE(dim_ >= constants::min_dimension && dim_ <= constants::max_dimension,
                "particle coordinates must have 2 or 3 components");

    cell_map_.clear();
    cell_start_.clear();
    cell_count_.clear();
    particle_order_.resize(num_particles_);
    particle_cells_.resize(num_particles_);

    // Count particles per cell
    for (Index p = 0; p < num_particles_; ++p) {
        CellIndex cell = get_cell(x, p);
        particle_cells_[p] = cell;

        auto [it, inserted] = cell_map_.try_emplace(cell, cell_count_.size());
        if (inserted) {
            cell_start_.push_back(0);
            cell_count_.push_back(0);
        }
        cell_count_[it->second]++;
    }

    // Prefix sum
    std::size_t offset = 0;
    for (std::size_t c = 0; c < cell_count_.size(); ++c) {
        cell_start_[c] = offset;
        offset += cell_count_[c];
        cell_count_[c] = 0;
    }
    PRB_ASSERT(offset == num_particles_, "cell counts do not cover every particle");

    // Insert in ascending particle order, so each cell is sorted
    for (Index p = 0; p < num_particles_; ++p) {
        std::size_t cell_id = cell_map_.at(particle_cells_[p]);
        particle_order_[cell_start_[cell_id] + cell_count_[cell_id]] = p;
        cell_count_[cell_id]++;
    }

    PRB_LOG_DEBUG("CellGrid: {} particles in {} cells (edge {})",
                  num_particles_, cell_map_.size(), cell_size_);
}

template<typename Visitor>
void CellGrid::for_each_candidate(Index p, const PDCoordHostView& x, Real radius,
                                  Visitor&& visit) const {
    PRB_CHECK_RANGE(p, num_particles_);
    PRB_REQUIRE(x.extent(0) == num_particles_ && x.extent(1) == dim_,
                "coordinate set does not match the binned particles");

    // Computed distances carry a few ulps of rounding; widen the box so every
    // particle whose computed distance is below radius falls inside it
    const Real reach = radius * (1.0 + kReachPadding * std::numeric_limits<Real>::epsilon());

    std::int64_t lo[3] = {0, 0, 0};
    std::int64_t hi[3] = {0, 0, 0};
    for (Index d = 0; d < dim_; ++d) {
        lo[d] = cell_coordinate(x(p, d) - reach);
        hi[d] = cell_coordinate(x(p, d) + reach);
    }

    for (std::int64_t ci = lo[0]; ci <= hi[0]; ++ci) {
        for (std::int64_t cj = lo[1]; cj <= hi[1]; ++cj) {
            for (std::int64_t ck = lo[2]; ck <= hi[2]; ++ck) {
                auto it = cell_map_.find(CellIndex{ci, cj, ck});
                if (it == cell_map_.end()) continue;

                std::size_t start = cell_start_[it->second];
                std::size_t count = cell_count_[it->second];
                for (std::size_t idx = start; idx < start + count; ++idx) {
                    Index q = particle_order_[idx];
                    if (q == p) continue;
                    visit(q, euclid(x, p, q));
                }
            }
        }
    }
}

void CellGrid::find_particle_neighbors(Index p, const PDCoordHostView& x, Real radius,
                                       std::vector<Index>& neighbors) const {
    PRB_REQUIRE(radius <= cell_size_, "search radius exceeds the cell size");
    neighbors.clear();
    for_each_candidate(p, x, radius, [&](Index q, Real r) {
        if (r < radius) {
            neighbors.push_back(q);
        }
    });
    std::sort(neighbors.begin(), neighbors.end());
}

Index CellGrid::count_particle_neighbors(Index p, const PDCoordHostView& x, Real radius) const {
    PRB_REQUIRE(radius <= cell_size_, "search radius exceeds the cell size");
    Index count = 0;
    for_each_candidate(p, x, radius, [&](Index, Real r) {
        if (r < radius) {
            ++count;
        }
    });
    return count;
}

std::int64_t CellGrid::cell_coordinate(Real v) const {
    const Real c = std::floor(v * inv_cell_size_);
    PRB_REQUIRE(std::isfinite(c) && std::abs(c) <= kMaxCellCoordinate,
                "particle coordinate " + std::to_string(v) +
                " is not finite or too far out for cell size " + std::to_string(cell_size_));
    return static_cast<std::int64_t>(c);
}

CellIndex CellGrid::get_cell(const PDCoordHostView& x, Index p) const {
    CellIndex cell;
    cell.i = cell_coordinate(x(p, 0));
    cell.j = cell_coordinate(x(p, 1));
    if (dim_ == 3) {
        cell.k = cell_coordinate(x(p, 2));
    }
    return cell;
}

} // namespace pd
} // namespace prb
