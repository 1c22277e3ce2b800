/**
* @file config_loader.cpp
 * @brief TOML (toml++) loader layered over the named defaults.
 */
#include "zeroalloc/config/config_loader.hpp"
#include "zeroalloc/mem/zeroed_alloc.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <toml++/toml.hpp>

namespace zeroalloc::config {
    using namespace zeroalloc::config::constants;

    static zeroalloc_detail::unexpected<ConfigIssue>
    issue(ConfigError e, std::size_t line, std::string_view detail) {
        return zeroalloc_detail::unexpected(ConfigIssue{e, line, std::string(detail)});
    }

    /// Non-negative TOML integer that fits in size_t.
    static bool to_size(const toml::node& n, std::size_t& out) {
        const auto* i = n.as_integer();
        if (!i || i->get() < 0) return false;
        const auto v = static_cast<std::uint64_t>(i->get());
        if (v > DEFAULT_MAX_BYTES) return false;
        out = static_cast<std::size_t>(v);
        return true;
    }

    zeroalloc_detail::expected<AllocConfig, ConfigIssue>
    Loader::parse(std::string_view text, std::string_view source) {
        toml::table tbl;
        try {
            tbl = toml::parse(text, source);
        } catch (const toml::parse_error& err) {
            return issue(ConfigError::Syntax, err.source().begin.line, err.description());
        }

        AllocConfig cfg = defaults();
        for (auto&& [key, node] : tbl) {
            const auto name = key.str();
            const std::size_t line = node.source().begin.line;

            if (name == "alignment") {
                std::size_t a = 0;
                if (!to_size(node, a) || !zeroalloc::mem::is_pow2(a) || a > MAX_ALIGNMENT) {
                    return issue(ConfigError::BadValue, line, name);
                }
                cfg.alignment = a;
            } else if (name == "max_bytes") {
                if (const auto* s = node.as_string()) {
                    if (s->get() != "unlimited") return issue(ConfigError::BadValue, line, name);
                    cfg.max_bytes = DEFAULT_MAX_BYTES;
                } else if (!to_size(node, cfg.max_bytes)) {
                    return issue(ConfigError::BadValue, line, name);
                }
            } else if (name == "verbose") {
                const auto* b = node.as_boolean();
                if (!b) return issue(ConfigError::BadValue, line, name);
                cfg.verbose = b->get();
            } else {
                return issue(ConfigError::UnknownKey, line, name);
            }
        }
        return cfg;
    }

    zeroalloc_detail::expected<AllocConfig, ConfigIssue>
    Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return issue(ConfigError::FileNotFound, 0, path);
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse(ss.str(), path);
    }

} // namespace zeroalloc::config
