#pragma once
#include <cstring>
#include <expected>
#include <iostream>
#include <netdb.h>
#include <string>

namespace config_loader{
    enum class config_error : int;
}

namespace net{
    enum class addr_error : int;
}

namespace crypto{
    enum class crypto_error : int;
}

enum class error_domain { errno_domain, gai_domain, addr_domain, config_domain, crypto_domain };
struct error_code{
    error_domain domain{};
    int code{0};

    static error_code from_errno(int ec);

    static error_code from_gai(int ec);

    static error_code from_addr(int ec);
    static error_code from_addr(net::addr_error ec);

    static error_code from_config(int ec);
    static error_code from_config(config_loader::config_error ec);

    static error_code from_crypto(int ec);

    friend bool operator==(const error_code&, const error_code&) = default;
};

std::string to_string(const error_code& ec);
std::ostream& operator<<(std::ostream& os, const error_code& ec);
