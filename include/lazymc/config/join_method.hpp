#pragma once
#include <optional>
#include <string_view>

enum class join_method{
    kick,
    hold,
    forward,
    lobby
};

std::string_view to_string(join_method method);

// Case-insensitive, for environment input.
std::optional<join_method> parse_join_method(std::string_view text);

// Exact lowercase name, for file input.
std::optional<join_method> parse_join_method_strict(std::string_view text);
