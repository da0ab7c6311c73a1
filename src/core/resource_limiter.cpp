/**
 * @file resource_limiter.cpp
 * @brief Implementation of setrlimit-based ceilings
 *
 * @date 2025
 */

#include "warden/core/resource_limiter.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

#include <sys/resource.h>

namespace warden {
namespace core {

namespace {

constexpr std::uint64_t kUnlimitedThreshold = 1ULL << 62;

const std::vector<std::filesystem::path>& DefaultCgroupFiles() {
    static const std::vector<std::filesystem::path> files = {
        "/sys/fs/cgroup/memory.max",
        "/sys/fs/cgroup/memory/memory.limit_in_bytes",
        "/sys/fs/cgroup/memory.limit_in_bytes",
    };
    return files;
}

std::optional<std::uint64_t> HardLimit(int resource) {
    struct rlimit current {};
    if (::getrlimit(resource, &current) != 0 || current.rlim_max == RLIM_INFINITY) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(current.rlim_max);
}

} // anonymous namespace

bool ResourceLimiter::MemoryCeilingSupported() {
#ifdef __APPLE__
    return false;
#else
    return true;
#endif
}

std::uint64_t ResourceLimiter::ClampMemory(std::uint64_t requested,
                                           std::optional<std::uint64_t> ambient,
                                           std::optional<std::uint64_t> hard) {
    std::uint64_t effective = requested;
    if (ambient) {
        effective = std::min(effective, *ambient);
    }
    if (hard) {
        effective = std::min(effective, *hard);
    }
    return effective;
}

std::optional<std::uint64_t> ResourceLimiter::AmbientMemoryCeiling() {
    return AmbientMemoryCeiling(DefaultCgroupFiles());
}

std::optional<std::uint64_t> ResourceLimiter::AmbientMemoryCeiling(
    const std::vector<std::filesystem::path>& candidates) {
    for (const auto& file : candidates) {
        std::ifstream in(file);
        if (!in) {
            continue;
        }
        std::string raw;
        std::getline(in, raw);
        raw = utils::StringUtils::Trim(raw);

        if (raw.empty() || raw == "max") {
            return std::nullopt;
        }
        try {
            std::uint64_t value = std::stoull(raw);
            if (value >= kUnlimitedThreshold) {
                return std::nullopt;
            }
            return value;
        } catch (const std::exception&) {
            spdlog::debug("Ignoring unparsable cgroup value '{}' in {}", raw, file.string());
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> ResourceLimiter::HardMemoryLimit() {
    return HardLimit(RLIMIT_AS);
}

std::optional<std::uint64_t> ResourceLimiter::HardCpuLimit() {
    return HardLimit(RLIMIT_CPU);
}

AppliedLimits ResourceLimiter::Apply(const ResourceLimits& limits) {
    AppliedLimits applied;

    // CPU time
    struct rlimit cpu {};
    if (::getrlimit(RLIMIT_CPU, &cpu) != 0) {
        throw std::runtime_error(std::string("getrlimit(RLIMIT_CPU) failed: ") + std::strerror(errno));
    }
    rlim_t soft = static_cast<rlim_t>(limits.cpu_time_seconds);
    if (cpu.rlim_max != RLIM_INFINITY) {
        soft = std::min(soft, cpu.rlim_max);
    }
    rlim_t hard = cpu.rlim_max;
    if (hard == RLIM_INFINITY || soft + 1 < hard) {
        hard = soft + 1;
    }
    struct rlimit new_cpu {soft, hard};
    if (::setrlimit(RLIMIT_CPU, &new_cpu) != 0) {
        throw std::runtime_error(std::string("setrlimit(RLIMIT_CPU) failed: ") + std::strerror(errno));
    }
    applied.cpu_soft_seconds = soft;
    applied.cpu_hard_seconds = hard;

    // Address space
    if (MemoryCeilingSupported()) {
        std::uint64_t bytes = ClampMemory(limits.memory_bytes, AmbientMemoryCeiling(),
                                          HardMemoryLimit());
        struct rlimit mem {static_cast<rlim_t>(bytes), static_cast<rlim_t>(bytes)};
        if (::setrlimit(RLIMIT_AS, &mem) != 0) {
            throw std::runtime_error(std::string("setrlimit(RLIMIT_AS) failed: ") + std::strerror(errno));
        }
        applied.memory_bytes = bytes;
    }

    return applied;
}

void ResourceLimiter::CheckHeadroom(const ResourceLimits& limits) {
    if (limits.cpu_time_seconds == 0) {
        throw ResourceLimitExceeded("CPU time limit is zero; nothing can run");
    }
    auto cpu_hard = HardCpuLimit();
    if (cpu_hard && *cpu_hard == 0) {
        throw ResourceLimitExceeded("CPU time hard limit of the host process is already exhausted");
    }
    if (MemoryCeilingSupported()) {
        auto effective = ClampMemory(limits.memory_bytes, AmbientMemoryCeiling(), HardMemoryLimit());
        if (effective == 0) {
            throw ResourceLimitExceeded("Memory ceiling clamps to zero bytes");
        }
    }
}

} // namespace core
} // namespace warden
