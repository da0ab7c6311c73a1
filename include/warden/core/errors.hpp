/**
 * @file errors.hpp
 * @brief Error hierarchy reported by the sandbox pipeline
 *
 * Every failure that crosses the Sandbox boundary is surfaced as exactly one
 * SandboxError. Lower-level failures (installer output, child traces, helper
 * binary errors) are captured as text and attached through details().
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace warden {
namespace core {

/**
 * @class SandboxError
 * @brief Base error for any sandbox pipeline failure
 *
 * Raised for a missing helper binary, a nonzero child exit, a missing
 * response artifact, or an exception reported by the child.
 */
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message, std::string details = {})
        : std::runtime_error(message)
        , details_(std::move(details)) {}

    /**
     * @brief Diagnostic text attached to the error
     * @return Child trace, captured output or installer log (may be empty)
     */
    const std::string& details() const noexcept { return details_; }

    /**
     * @brief Message and details joined for display
     */
    std::string Describe() const {
        if (details_.empty()) {
            return what();
        }
        return std::string(what()) + "\n" + details_;
    }

private:
    std::string details_;
};

/**
 * @class ResourceLimitExceeded
 * @brief Ceiling violation detected before a child is spawned
 */
class ResourceLimitExceeded : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/**
 * @class SecurityViolation
 * @brief File access refused by the AllowlistGuard
 */
class SecurityViolation : public SandboxError {
public:
    using SandboxError::SandboxError;
};

} // namespace core
} // namespace warden
