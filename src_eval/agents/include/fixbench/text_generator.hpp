#pragma once

#include <stdexcept>
#include <string>

#include "fixbench/cancellation.hpp"

namespace fixbench {

/// Raised when a completion could not be produced.
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& what) : std::runtime_error(what) {}
};

struct Prompt {
    std::string system;
    std::string user;
    double temperature{0.0};
};

/**
 * \brief Opaque completion service used by the fix producers.
 *
 * complete() returns the raw model text. It throws GenerationError on failure and
 * OperationCancelled once `token` has expired.
 */
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    [[nodiscard]] virtual std::string complete(const Prompt& prompt, const CancellationToken* token) = 0;
};

}  // namespace fixbench
