#pragma once

#include <stdexcept>
#include <string>

namespace LvTiles {

/**
 * @brief Unrecoverable setup problem (missing input root, bad config value).
 *
 * Thrown before any tile task is created; main() logs it and exits non-zero.
 */
class FatalConfigurationError : public std::runtime_error {
public:
    explicit FatalConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace LvTiles
