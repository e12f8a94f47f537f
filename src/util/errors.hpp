#ifndef PHISCRUB_UTIL_ERRORS_HPP
#define PHISCRUB_UTIL_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception taxonomy for the de-identification pipeline.
 *
 * Detection-time failures (PatternTimeoutError, CapabilityUnavailableError)
 * are caught inside the pipeline and degrade detection. Configuration and
 * transformation failures propagate to the caller.
 */

namespace phiscrub {
namespace util {

/// Base of every error raised by phiscrub.
class DeidError : public std::runtime_error
{
public:
    explicit DeidError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/// Unrecognized mode/policy/action value, malformed config line or bad number.
class InvalidConfigError : public DeidError
{
public:
    explicit InvalidConfigError(const std::string &what)
        : DeidError("invalid config: " + what)
    {
    }
};

/// A single matcher exceeded its budget; only that pattern's matches are lost.
class PatternTimeoutError : public DeidError
{
public:
    PatternTimeoutError(const std::string &patternName, const std::string &what)
        : DeidError("pattern '" + patternName + "' aborted: " + what),
          patternName_(patternName)
    {
    }

    const std::string &patternName() const { return patternName_; }

private:
    std::string patternName_;
};

/// The NER capability is missing, failed to initialize or failed on an input.
class CapabilityUnavailableError : public DeidError
{
public:
    explicit CapabilityUnavailableError(const std::string &what)
        : DeidError("capability unavailable: " + what)
    {
    }
};

/// The Transformer was handed an entity it must not apply.
class TransformError : public DeidError
{
public:
    explicit TransformError(const std::string &what)
        : DeidError("transform failed: " + what)
    {
    }
};

/// The per-call budget expired before detection completed.
class DeadlineExceededError : public DeidError
{
public:
    explicit DeadlineExceededError(const std::string &what)
        : DeidError("deadline exceeded: " + what)
    {
    }
};

} // namespace util
} // namespace phiscrub

#endif // PHISCRUB_UTIL_ERRORS_HPP
