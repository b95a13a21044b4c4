#pragma once
#include "lazymc/core/error_code.hpp"
#include <cstddef>
#include <expected>
#include <string>

namespace crypto{
    std::expected <std::string, error_code> random_alphanumeric(std::size_t length);
}
