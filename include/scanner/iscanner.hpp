#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace promptfw {

/**
 * @brief Interface for prompt scanners
 *
 * Each scanner is built from one configuration snapshot and never mutates
 * shared state, so a single instance may scan concurrently from many
 * threads. PromptFirewall runs every enabled scanner over the same prompt
 * and merges their results.
 */
class IScanner {
public:
    virtual ~IScanner() = default;

    /**
     * @brief Whether this scanner should run (from its own config slice)
     */
    [[nodiscard]] virtual bool enabled() const = 0;

    /**
     * @brief Scan prompt text
     * @return Result labelled with name(); empty for empty prompts
     */
    [[nodiscard]] virtual ScanResult scan(std::string_view prompt) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace promptfw
