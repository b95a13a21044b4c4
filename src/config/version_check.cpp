#include "lazymc/config/version_check.hpp"
#include "lazymc/core/logger.hpp"
#include "lazymc/core/string_util.hpp"
#include <algorithm>
#include <charconv>

std::optional<version_check::version_parts> version_check::parse_version(std::string_view text){
    std::string trimmed = string_util::trim(text);
    std::string_view core = trimmed;
    if(!core.empty() && (core.front() == 'v' || core.front() == 'V')) core.remove_prefix(1);

    std::size_t suffix = core.find_first_of("-+");
    if(suffix != std::string_view::npos) core = core.substr(0, suffix);
    if(core.empty()) return std::nullopt;

    version_parts parts;
    for(const std::string& part : string_util::split(core, '.')){
        if(part.empty()) return std::nullopt;

        std::uint64_t value = 0;
        const char* first = part.data();
        const char* last = part.data() + part.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if(ec != std::errc{} || ptr != last) return std::nullopt;
        parts.push_back(value);
    }
    return parts;
}

int version_check::compare(const version_parts& lhs, const version_parts& rhs){
    std::size_t n = std::max(lhs.size(), rhs.size());
    for(std::size_t i = 0; i < n; ++i){
        std::uint64_t a = i < lhs.size() ? lhs[i] : 0;
        std::uint64_t b = i < rhs.size() ? rhs[i] : 0;
        if(a < b) return -1;
        if(a > b) return 1;
    }
    return 0;
}

version_check::version_status version_check::check(
    const std::optional<std::string>& declared, std::string_view minimum
){
    if(!declared) return version_status::unknown;

    std::optional<version_parts> have = parse_version(*declared);
    std::optional<version_parts> want = parse_version(minimum);
    if(!have || !want) return version_status::invalid;

    if(compare(*have, *want) < 0) return version_status::outdated;
    return version_status::compatible;
}

std::string_view version_check::warning_message(version_status status){
    switch(status){
        case version_status::compatible:
            return {};
        case version_status::unknown:
            return "Config version unknown, it may be outdated";
        case version_status::outdated:
            return "Config is for older lazymc version, you may need to update it";
        case version_status::invalid:
            return "Config version is invalid, you may need to update it";
    }
    return {};
}

version_check::version_status version_check::warn_if_incompatible(
    const std::optional<std::string>& declared, std::string_view minimum
){
    version_status status = check(declared, minimum);
    if(status != version_status::compatible){
        logger::log_warn("lazymc::config", __func__, warning_message(status));
    }
    return status;
}
