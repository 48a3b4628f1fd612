#pragma once

/**
 * @file pd_config.hpp
 * @brief Bond list set-up parameters and their configuration section
 */

#include <peribond/peridynamics/pd_types.hpp>
#include <peribond/peridynamics/pd_family.hpp>
#include <peribond/peridynamics/pd_neighbor.hpp>
#include <peribond/io/config_reader.hpp>

#include <cmath>
#include <string>

namespace prb {
namespace pd {

/**
 * @brief Parameters of a bond list construction
 *
 * Read from the `neighbor_list` section:
 * ```
 * neighbor_list:
 *   horizon: 0.1
 *   capacity: 0          # 0 = size from the family counter
 *   capacity_margin: 2
 *   search: cell_list    # brute_force | cell_list
 *   overflow: throw      # throw | warn | truncate
 * ```
 */
struct NeighborListConfig {
    Real horizon = 0.0;
    Index capacity = 0;             ///< 0 = max family + capacity_margin
    Index capacity_margin = 0;
    BuildOptions options;

    static NeighborListConfig from_config(const io::ConfigSection& section) {
        PRB_REQUIRE(section.has("horizon"),
                    "section '" + section.name() + "' must define a horizon");

        NeighborListConfig config;
        config.horizon = section.get_real("horizon");
        PRB_REQUIRE(std::isfinite(config.horizon), "horizon must be a finite number");

        Int capacity = section.get_int("capacity", 0);
        Int margin = section.get_int("capacity_margin", 0);
        PRB_REQUIRE(capacity >= 0, "capacity must not be negative");
        PRB_REQUIRE(margin >= 0, "capacity_margin must not be negative");
        config.capacity = static_cast<Index>(capacity);
        config.capacity_margin = static_cast<Index>(margin);

        config.options.search = parse_search_method(
            section.get_string("search", to_string(SearchMethod::BruteForce)));
        config.options.overflow = parse_overflow_policy(
            section.get_string("overflow", to_string(OverflowPolicy::Throw)));

        return config;
    }

    /**
     * @brief Row width for a coordinate set, sized from its families when not fixed
     */
    Index resolve_capacity(const PDCoordView& x) const {
        if (capacity > 0) {
            return capacity;
        }
        return required_capacity(family(x, horizon, options.search), capacity_margin);
    }
};

/**
 * @brief Build a bond list as described by a configuration
 */
inline BuildReport build_bond_list(BondList& bonds, const PDCoordView& x,
                                   const NeighborListConfig& config) {
    Index capacity = config.resolve_capacity(x);
    PRB_LOG_DEBUG("Bond list capacity resolved to {}", capacity);
    return bonds.build(x, config.horizon, capacity, config.options);
}

} // namespace pd
} // namespace prb
