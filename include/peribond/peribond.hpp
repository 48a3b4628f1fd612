#pragma once

/**
 * @file peribond.hpp
 * @brief Main header for the PeriBond library
 *
 * Include this single header to get access to all PeriBond functionality.
 */

#include <peribond/core/core.hpp>
#include <peribond/io/config_reader.hpp>
#include <peribond/peridynamics/peridynamics.hpp>

namespace prb {

inline const char* version_string() {
    return version::string;
}

inline void print_features() {
    PRB_LOG_INFO("PeriBond Features:");
    PRB_LOG_INFO("  Kokkos memory space: {}", memory_space_name());
    PRB_LOG_INFO("  GPU default space: {}", is_gpu_default() ? "yes" : "no");
    PRB_LOG_INFO("  Precision: {} bytes", sizeof(Real));
}

} // namespace prb
