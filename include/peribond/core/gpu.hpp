#pragma once

#include <peribond/core/types.hpp>
#include <peribond/core/exception.hpp>
#include <peribond/core/logger.hpp>

#include <Kokkos_Core.hpp>

#include <string>
#include <type_traits>

namespace prb {

// ============================================================================
// Execution Space and Memory Space Aliases
// ============================================================================

using DefaultExecSpace = Kokkos::DefaultExecutionSpace;
using DefaultMemSpace = Kokkos::DefaultExecutionSpace::memory_space;
using HostMemSpace = Kokkos::HostSpace;

// Determine if default execution space is GPU
inline constexpr bool is_gpu_default() {
#if defined(KOKKOS_ENABLE_CUDA)
    return std::is_same_v<DefaultExecSpace, Kokkos::Cuda>;
#elif defined(KOKKOS_ENABLE_HIP)
    return std::is_same_v<DefaultExecSpace, Kokkos::HIP>;
#else
    return false;
#endif
}

// ============================================================================
// Kokkos Initialization and Finalization
// ============================================================================

struct KokkosConfig {
    int num_threads = -1;           // -1 = auto
    int device_id = 0;              // GPU device ID
    bool disable_warnings = false;
};

class KokkosManager {
public:
    static KokkosManager& instance() {
        static KokkosManager manager;
        return manager;
    }

    void initialize(const KokkosConfig& config = KokkosConfig{}) {
        if (Kokkos::is_initialized()) {
            PRB_LOG_WARN("Kokkos already initialized");
            return;
        }

        Kokkos::InitializationSettings args;

        if (config.num_threads > 0) {
            args.set_num_threads(config.num_threads);
        }

        if (config.device_id >= 0) {
            args.set_device_id(config.device_id);
        }

        args.set_disable_warnings(config.disable_warnings);

        Kokkos::initialize(args);
        owns_runtime_ = true;

        print_configuration();
    }

    void finalize() {
        if (!owns_runtime_) {
            return;
        }

        Kokkos::finalize();
        owns_runtime_ = false;
        PRB_LOG_INFO("Kokkos finalized");
    }

    bool is_initialized() const { return owns_runtime_; }

    void print_configuration() const {
        PRB_LOG_INFO("Kokkos Configuration:");
        PRB_LOG_INFO("  Version: {}.{}.{}",
                     KOKKOS_VERSION / 10000,
                     (KOKKOS_VERSION / 100) % 100,
                     KOKKOS_VERSION % 100);
        PRB_LOG_INFO("  Default Execution Space: {}", DefaultExecSpace::name());
        PRB_LOG_INFO("  Default Memory Space: {}", DefaultMemSpace::name());
        PRB_LOG_INFO("  Concurrency: {}", DefaultExecSpace().concurrency());
    }

private:
    KokkosManager() = default;
    ~KokkosManager() = default;

    KokkosManager(const KokkosManager&) = delete;
    KokkosManager& operator=(const KokkosManager&) = delete;

    bool owns_runtime_ = false;
};

inline std::string memory_space_name() {
    return DefaultMemSpace::name();
}

} // namespace prb
