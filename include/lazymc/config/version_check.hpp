#pragma once
#include "lazymc/config/defaults.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace version_check{
    enum class version_status{
        compatible,
        unknown,
        outdated,
        invalid
    };

    using version_parts = std::vector<std::uint64_t>;

    // Dotted numeric core; a "-pre" or "+build" suffix is ignored.
    std::optional<version_parts> parse_version(std::string_view text);

    // <0, 0, >0 like strcmp; missing trailing parts count as zero.
    int compare(const version_parts& lhs, const version_parts& rhs);

    version_status check(
        const std::optional<std::string>& declared,
        std::string_view minimum = config_defaults::config_version
    );

    std::string_view warning_message(version_status status);

    // Logs the warning for anything but compatible. Never fails.
    version_status warn_if_incompatible(
        const std::optional<std::string>& declared,
        std::string_view minimum = config_defaults::config_version
    );
}
