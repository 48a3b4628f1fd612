#pragma once

/**
 * @file peridynamics.hpp
 * @brief Main include file for the PeriBond peridynamics module
 *
 * - pd_types.hpp: view types, search and overflow options
 * - pd_distance.hpp: Euclidean distance kernel
 * - pd_cell_grid.hpp: cell-linked list for horizon searches
 * - pd_family.hpp: family counter and capacity sizing
 * - pd_neighbor.hpp: fixed-capacity bond list, construction and bond breaking
 * - pd_coordinates.hpp: coordinate sets from points or lattices
 * - pd_crack.hpp: straight pre-crack that cuts bonds after construction
 * - pd_config.hpp: configuration section for the bond list
 *
 * Usage:
 *   prb::Context context;
 *
 *   auto x = prb::pd::make_lattice(20, 20, 1, 0.01, 2);
 *   prb::Real horizon = 0.0301;
 *   auto capacity = prb::pd::required_capacity(prb::pd::family(x, horizon));
 *
 *   prb::pd::BondList bonds;
 *   bonds.build(x, horizon, capacity);
 *
 *   // every step, after moving the particles:
 *   bonds.break_bonds(x, horizon);
 */

#include <peribond/peridynamics/pd_types.hpp>
#include <peribond/peridynamics/pd_distance.hpp>
#include <peribond/peridynamics/pd_cell_grid.hpp>
#include <peribond/peridynamics/pd_family.hpp>
#include <peribond/peridynamics/pd_neighbor.hpp>
#include <peribond/peridynamics/pd_coordinates.hpp>
#include <peribond/peridynamics/pd_crack.hpp>
#include <peribond/peridynamics/pd_config.hpp>

namespace prb {

namespace peridynamics = pd;

} // namespace prb
