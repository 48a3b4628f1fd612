#pragma once

// Core infrastructure headers
#include <peribond/core/types.hpp>
#include <peribond/core/exception.hpp>
#include <peribond/core/logger.hpp>
#include <peribond/core/gpu.hpp>

#include <string>

namespace prb {

// ============================================================================
// Version Information
// ============================================================================

namespace version {

inline constexpr int major = 0;
inline constexpr int minor = 1;
inline constexpr int patch = 0;

inline constexpr const char* string = "0.1.0";
inline constexpr const char* build_date = __DATE__;
inline constexpr const char* build_time = __TIME__;

} // namespace version

// ============================================================================
// Initialization and Finalization
// ============================================================================

struct InitOptions {
    Logger::Level log_level = Logger::Level::Info;
    bool log_to_console = true;
    bool log_to_file = false;
    std::string log_file = "peribond.log";
    int num_threads = -1;  // -1 means auto-detect
    int device_id = 0;
};

// Initialize PeriBond: logger first, then the Kokkos runtime
inline void initialize(const InitOptions& options = InitOptions{}) {
    if (options.log_to_console && options.log_to_file) {
        Logger::instance().init_combined(options.log_file, options.log_level);
    } else if (options.log_to_file) {
        Logger::instance().init_file(options.log_file, options.log_level);
    } else {
        Logger::instance().init_console(options.log_level);
    }

    PRB_LOG_INFO("PeriBond v{} initializing (built {} {})",
                 version::string, version::build_date, version::build_time);

    KokkosConfig kconfig;
    kconfig.num_threads = options.num_threads;
    kconfig.device_id = options.device_id;
    KokkosManager::instance().initialize(kconfig);
}

inline void finalize() {
    PRB_LOG_INFO("PeriBond shutting down...");
    KokkosManager::instance().finalize();
    Logger::instance().flush();
}

// ============================================================================
// RAII Wrapper for Initialization/Finalization
// ============================================================================

class Context {
public:
    explicit Context(const InitOptions& options = InitOptions{}) {
        initialize(options);
    }

    ~Context() {
        finalize();
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = delete;
    Context& operator=(Context&&) = delete;
};

} // namespace prb
