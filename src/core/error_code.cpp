#include "lazymc/core/error_code.hpp"
#include "lazymc/config/config_loader.hpp"
#include "lazymc/crypto/crypto_error.hpp"
#include "lazymc/net/socket_address.hpp"

error_code error_code::from_errno(int ec){ return {error_domain::errno_domain, ec}; }

error_code error_code::from_gai(int ec){ return {error_domain::gai_domain, ec}; }

error_code error_code::from_addr(int ec){ return {error_domain::addr_domain, ec}; }
error_code error_code::from_addr(net::addr_error ec){
    return from_addr(static_cast<int>(ec));
}

error_code error_code::from_config(int ec){ return {error_domain::config_domain, ec}; }
error_code error_code::from_config(config_loader::config_error ec){
    return from_config(static_cast<int>(ec));
}

error_code error_code::from_crypto(int ec){ return {error_domain::crypto_domain, ec}; }

std::string to_string(const error_code& ec){
    if(ec.domain == error_domain::errno_domain) return std::strerror(ec.code);
    else if(ec.domain == error_domain::gai_domain) return ::gai_strerror(ec.code);
    else if(ec.domain == error_domain::addr_domain) return net::addr_strerror(ec.code);
    else if(ec.domain == error_domain::config_domain) return config_loader::config_strerror(ec.code);
    else if(ec.domain == error_domain::crypto_domain) return crypto::crypto_strerror(ec.code);
    return "unknown error";
}

std::ostream& operator<<(std::ostream& os, const error_code& ec){
    return os << to_string(ec);
}
