#pragma once
#include "lazymc/core/error_code.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <sys/socket.h>

namespace net{
    enum class addr_error : int{
        missing_port = 1,
        invalid_port,
        empty_host,
        malformed_host,
        not_literal,
        no_address
    };

    std::string addr_strerror(int code);
}

class socket_address{
    sockaddr_storage ss{};
    socklen_t len = 0;
public:
    socket_address() = default;
    socket_address(const sockaddr* sa, socklen_t sa_len);

    static std::expected <socket_address, error_code> from_ip(std::string_view ip, std::uint16_t port);

    const sockaddr* addr() const noexcept;
    socklen_t size() const noexcept;

    int family() const noexcept;
    bool is_ipv4() const noexcept;
    bool is_ipv6() const noexcept;
    std::uint16_t port() const noexcept;
    std::string host() const;
    std::string to_string() const;

    friend bool operator==(const socket_address& lhs, const socket_address& rhs) noexcept;
};

std::ostream& operator<<(std::ostream& os, const socket_address& sa);

namespace net{
    struct host_port{
        std::string host;
        std::uint16_t port = 0;
        bool bracketed = false;
    };

    std::expected <host_port, error_code> split_host_port(std::string_view text);

    // Literal IP only, never touches the resolver.
    std::expected <socket_address, error_code> parse_socket_address(std::string_view text);

    // Literal IP, or first result of a blocking hostname lookup.
    std::expected <socket_address, error_code> resolve_socket_address(std::string_view text);
}
