/**
 * @file resource_limiter.hpp
 * @brief CPU-time and address-space ceilings for sandboxed children
 *
 * Limits are applied with setrlimit() at the very start of the child, before
 * any user code runs. The memory ceiling is clamped against the ambient
 * container (cgroup) limit and the current hard limit so it is never raised.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/execution_types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace warden {
namespace core {

/**
 * @struct AppliedLimits
 * @brief Values actually installed by ResourceLimiter::Apply
 */
struct AppliedLimits {
    std::uint64_t cpu_soft_seconds{0};
    std::uint64_t cpu_hard_seconds{0};
    std::optional<std::uint64_t> memory_bytes;  ///< Unset when the ceiling is not supported
};

/**
 * @class ResourceLimiter
 * @brief setrlimit wrapper with cgroup-aware clamping
 *
 * **Usage Example**:
 * @code
 * // inside the child, before dispatch
 * auto applied = ResourceLimiter::Apply(request.limits);
 * spdlog::info("cpu={}s memory={}", applied.cpu_soft_seconds, *applied.memory_bytes);
 * @endcode
 */
class ResourceLimiter {
public:
    /**
     * @brief Install CPU and memory ceilings on the calling process
     *
     * CPU: soft limit = min(requested, hard); the hard limit is lowered to
     * soft + 1 when that is lower. Memory: RLIMIT_AS = min(requested,
     * ambient, hard). The memory ceiling is skipped where unsupported.
     *
     * @throws std::runtime_error if setrlimit fails
     */
    static AppliedLimits Apply(const ResourceLimits& limits);

    /**
     * @brief Effective memory ceiling
     *
     * @param requested Requested bytes
     * @param ambient Ambient cgroup ceiling, if any
     * @param hard Current hard RLIMIT_AS, if finite
     * @return min of all present values
     */
    static std::uint64_t ClampMemory(std::uint64_t requested,
                                     std::optional<std::uint64_t> ambient,
                                     std::optional<std::uint64_t> hard);

    /**
     * @brief Read the container memory ceiling from cgroup files
     *
     * Unified hierarchy first (memory.max), then the legacy paths. "max" and
     * values at or above 2^62 mean no ceiling.
     */
    static std::optional<std::uint64_t> AmbientMemoryCeiling();

    /// Same lookup against an explicit list of candidate files
    static std::optional<std::uint64_t> AmbientMemoryCeiling(
        const std::vector<std::filesystem::path>& candidates);

    /// Current hard RLIMIT_AS, unset when unlimited
    static std::optional<std::uint64_t> HardMemoryLimit();

    /// Current hard RLIMIT_CPU, unset when unlimited
    static std::optional<std::uint64_t> HardCpuLimit();

    /**
     * @brief Host-side check run before a child is spawned
     * @throws ResourceLimitExceeded when no CPU or memory headroom remains
     */
    static void CheckHeadroom(const ResourceLimits& limits);

    /// False on macOS, where RLIMIT_AS breaks normal runtime start-up
    static bool MemoryCeilingSupported();
};

} // namespace core
} // namespace warden
