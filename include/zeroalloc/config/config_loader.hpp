#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a TOML file.
 * @details All defaults reference named constants to avoid magic numbers.
 *          Parsing is done by toml++; unset keys keep their defaults.
 *
 *     alignment = 64
 *     max_bytes = 1048576     # or "unlimited"
 *     verbose   = true
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "zeroalloc/compat/expected.hpp"
#include "zeroalloc/config/constants.hpp"

namespace zeroalloc::config {

    /** @struct AllocConfig
     *  @brief Settings applied by mem::Allocator to every request.
     */
    struct AllocConfig {
        std::size_t alignment{constants::DEFAULT_ALIGNMENT}; ///< Power-of-two alignment
        std::size_t max_bytes{constants::DEFAULT_MAX_BYTES}; ///< Per-request byte cap
        bool        verbose{constants::DEFAULT_VERBOSE};     ///< Log every event
    };

    /// Parse failures, with the offending line kept in ConfigIssue.
    enum class ConfigError : std::uint8_t {
        FileNotFound = 1, ///< Path could not be opened
        Syntax,           ///< Document is not valid TOML
        UnknownKey,       ///< Key is not a recognised setting
        BadValue          ///< Value failed to parse or validate
    };

    struct ConfigIssue {
        ConfigError error{ConfigError::Syntax};
        std::size_t line{0};   ///< 1-based; 0 when not line-specific
        std::string detail;    ///< Key or path involved
    };

    constexpr std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "file_not_found";
            case ConfigError::Syntax:       return "syntax";
            case ConfigError::UnknownKey:   return "unknown_key";
            case ConfigError::BadValue:     return "bad_value";
        }
        return "unknown";
    }

    /** @class Loader
     *  @brief Source of allocation configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// @return AllocConfig populated from constants.hpp.
        static AllocConfig defaults() noexcept { return AllocConfig{}; }

        /**
         * @brief Load configuration from a TOML file; unset keys keep their defaults.
         * @param path Path of the file (also reported in parse diagnostics).
         */
        static zeroalloc_detail::expected<AllocConfig, ConfigIssue>
        load_from_file(const std::string& path);

        /// @brief Same as load_from_file() but over in-memory TOML text.
        static zeroalloc_detail::expected<AllocConfig, ConfigIssue>
        parse(std::string_view text, std::string_view source = "<config>");
    };

} // namespace zeroalloc::config
