#include "lazymc/net/socket_address.hpp"
#include "lazymc/net/addr.hpp"

#include <arpa/inet.h>
#include <charconv>
#include <cstring>
#include <netinet/in.h>

std::string net::addr_strerror(int code){
    switch(static_cast<addr_error>(code)){
        case addr_error::missing_port:
            return "address is missing a port (expected host:port)";
        case addr_error::invalid_port:
            return "address port is not a number in 0..65535";
        case addr_error::empty_host:
            return "address host is empty";
        case addr_error::malformed_host:
            return "address host is malformed (IPv6 hosts must be written in brackets)";
        case addr_error::not_literal:
            return "address host is not a literal IP";
        case addr_error::no_address:
            return "hostname resolved to no address";
    }
    return "unknown address error";
}

socket_address::socket_address(const sockaddr* sa, socklen_t sa_len){
    if(sa == nullptr || sa_len == 0 || sa_len > sizeof(ss)) return;
    std::memcpy(&ss, sa, sa_len);
    len = sa_len;
}

std::expected <socket_address, error_code> socket_address::from_ip(std::string_view ip, std::uint16_t port){
    std::string ip_str(ip);
    socket_address out;

    sockaddr_in v4{};
    if(::inet_pton(AF_INET, ip_str.c_str(), &v4.sin_addr) == 1){
        v4.sin_family = AF_INET;
        v4.sin_port = htons(port);
        std::memcpy(&out.ss, &v4, sizeof(v4));
        out.len = sizeof(v4);
        return out;
    }

    sockaddr_in6 v6{};
    if(::inet_pton(AF_INET6, ip_str.c_str(), &v6.sin6_addr) == 1){
        v6.sin6_family = AF_INET6;
        v6.sin6_port = htons(port);
        std::memcpy(&out.ss, &v6, sizeof(v6));
        out.len = sizeof(v6);
        return out;
    }

    return std::unexpected(error_code::from_addr(net::addr_error::not_literal));
}

const sockaddr* socket_address::addr() const noexcept{ return reinterpret_cast<const sockaddr*>(&ss); }
socklen_t socket_address::size() const noexcept{ return len; }

int socket_address::family() const noexcept{ return len == 0 ? AF_UNSPEC : ss.ss_family; }
bool socket_address::is_ipv4() const noexcept{ return family() == AF_INET; }
bool socket_address::is_ipv6() const noexcept{ return family() == AF_INET6; }

std::uint16_t socket_address::port() const noexcept{
    if(is_ipv4()) return ntohs(reinterpret_cast<const sockaddr_in*>(&ss)->sin_port);
    if(is_ipv6()) return ntohs(reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_port);
    return 0;
}

std::string socket_address::host() const{
    char buf[INET6_ADDRSTRLEN]{};
    if(is_ipv4()){
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&ss);
        if(::inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf)) != nullptr) return buf;
    }
    else if(is_ipv6()){
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        if(::inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf)) != nullptr) return buf;
    }
    return {};
}

std::string socket_address::to_string() const{
    if(is_ipv6()) return "[" + host() + "]:" + std::to_string(port());
    if(is_ipv4()) return host() + ":" + std::to_string(port());
    return "<unspecified>";
}

bool operator==(const socket_address& lhs, const socket_address& rhs) noexcept{
    if(lhs.family() != rhs.family()) return false;
    if(lhs.port() != rhs.port()) return false;

    if(lhs.is_ipv4()){
        const auto* a = reinterpret_cast<const sockaddr_in*>(&lhs.ss);
        const auto* b = reinterpret_cast<const sockaddr_in*>(&rhs.ss);
        return a->sin_addr.s_addr == b->sin_addr.s_addr;
    }
    if(lhs.is_ipv6()){
        const auto* a = reinterpret_cast<const sockaddr_in6*>(&lhs.ss);
        const auto* b = reinterpret_cast<const sockaddr_in6*>(&rhs.ss);
        return std::memcmp(&a->sin6_addr, &b->sin6_addr, sizeof(in6_addr)) == 0;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const socket_address& sa){
    return os << sa.to_string();
}

std::expected <net::host_port, error_code> net::split_host_port(std::string_view text){
    host_port out;
    std::string_view port_text;

    if(!text.empty() && text.front() == '['){
        std::size_t close = text.find(']');
        if(close == std::string_view::npos){
            return std::unexpected(error_code::from_addr(addr_error::malformed_host));
        }
        out.host = std::string(text.substr(1, close - 1));
        out.bracketed = true;

        std::string_view rest = text.substr(close + 1);
        if(rest.empty() || rest.front() != ':'){
            return std::unexpected(error_code::from_addr(addr_error::missing_port));
        }
        port_text = rest.substr(1);
    }
    else{
        std::size_t colon = text.rfind(':');
        if(colon == std::string_view::npos){
            return std::unexpected(error_code::from_addr(addr_error::missing_port));
        }
        out.host = std::string(text.substr(0, colon));
        if(out.host.find(':') != std::string::npos){
            return std::unexpected(error_code::from_addr(addr_error::malformed_host));
        }
        port_text = text.substr(colon + 1);
    }

    if(out.host.empty()){
        return std::unexpected(error_code::from_addr(addr_error::empty_host));
    }

    const char* first = port_text.data();
    const char* last = port_text.data() + port_text.size();
    auto [ptr, ec] = std::from_chars(first, last, out.port);
    if(port_text.empty() || ec != std::errc{} || ptr != last){
        return std::unexpected(error_code::from_addr(addr_error::invalid_port));
    }

    return out;
}

std::expected <socket_address, error_code> net::parse_socket_address(std::string_view text){
    auto hp_exp = split_host_port(text);
    if(!hp_exp) return std::unexpected(hp_exp.error());

    auto sa_exp = socket_address::from_ip(hp_exp->host, hp_exp->port);
    if(!sa_exp) return std::unexpected(sa_exp.error());

    // "[1.2.3.4]:80" and "::1:80" are both rejected, like a strict host:port grammar.
    if(sa_exp->is_ipv6() != hp_exp->bracketed){
        return std::unexpected(error_code::from_addr(addr_error::malformed_host));
    }
    return sa_exp;
}

std::expected <socket_address, error_code> net::resolve_socket_address(std::string_view text){
    auto hp_exp = split_host_port(text);
    if(!hp_exp) return std::unexpected(hp_exp.error());

    auto literal_exp = socket_address::from_ip(hp_exp->host, hp_exp->port);
    if(literal_exp){
        if(literal_exp->is_ipv6() != hp_exp->bracketed){
            return std::unexpected(error_code::from_addr(addr_error::malformed_host));
        }
        return literal_exp;
    }
    if(hp_exp->bracketed){
        return std::unexpected(error_code::from_addr(addr_error::malformed_host));
    }

    auto list_exp = lookup_host(hp_exp->host, hp_exp->port);
    if(!list_exp) return std::unexpected(list_exp.error());

    const addrinfo* first = list_exp->first_inet();
    if(first == nullptr) return std::unexpected(error_code::from_addr(addr_error::no_address));
    return socket_address(first->ai_addr, first->ai_addrlen);
}
