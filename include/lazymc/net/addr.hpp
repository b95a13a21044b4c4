#pragma once
#include <netdb.h>
#include <cstdint>
#include <memory>
#include <string_view>
#include "lazymc/core/error_code.hpp"

struct addr_option{
    int family = AF_UNSPEC;
    int socktype = SOCK_STREAM;
    int protocol = 0;
    int flags = AI_NUMERICSERV;
};

// Owns one getaddrinfo result chain.
struct addr_list{
private:
    struct deleter{
        void operator()(addrinfo* p) const noexcept { if(p) ::freeaddrinfo(p); }
    };
    std::unique_ptr<addrinfo, deleter> res{nullptr};

    [[nodiscard]] int lookup(const char* host, const char* port, addr_option opt) noexcept;
public:
    addr_list() = default;

    addr_list(const addr_list&) = delete;
    addr_list& operator=(const addr_list&) = delete;

    addr_list(addr_list&&) noexcept = default;
    addr_list& operator=(addr_list&&) noexcept = default;

    [[nodiscard]] int lookup_host(std::string_view host, std::uint16_t port, addr_option opt = {});

    // First IPv4 or IPv6 entry in resolver order, nullptr if none.
    const addrinfo* first_inet() const noexcept;
};

[[nodiscard]] std::expected <addr_list, error_code> lookup_host(std::string_view host, std::uint16_t port, addr_option opt = {});
