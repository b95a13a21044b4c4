#include "lazymc/net/addr.hpp"
#include <cerrno>
#include <string>

int addr_list::lookup(const char* host, const char* port, addr_option opt) noexcept{
    res.reset();
    addrinfo hints{};
    hints.ai_family = opt.family;
    hints.ai_socktype = opt.socktype;
    hints.ai_protocol = opt.protocol;
    hints.ai_flags = opt.flags;

    addrinfo* raw = nullptr;
    int ec = ::getaddrinfo(host, port, &hints, &raw);
    if(ec == 0) res.reset(raw);
    return ec;
}

int addr_list::lookup_host(std::string_view host, std::uint16_t port, addr_option opt){
    std::string host_str(host);
    std::string port_str = std::to_string(port);
    return lookup(host_str.c_str(), port_str.c_str(), opt);
}

const addrinfo* addr_list::first_inet() const noexcept{
    for(const addrinfo* p = res.get(); p != nullptr; p = p->ai_next){
        if(p->ai_family == AF_INET || p->ai_family == AF_INET6) return p;
    }
    return nullptr;
}

std::expected <addr_list, error_code> lookup_host(std::string_view host, std::uint16_t port, addr_option opt){
    addr_list ret;
    int ec = ret.lookup_host(host, port, opt);
    if(ec == EAI_SYSTEM) return std::unexpected(error_code::from_errno(errno));
    if(ec) return std::unexpected(error_code::from_gai(ec));
    return ret;
}
