#include "lazymc/config/toml_section.hpp"
#include "lazymc/config/config.hpp"
#include "lazymc/config/config_loader.hpp"
#include "lazymc/core/logger.hpp"
#include <limits>
#include <utility>

namespace{
using config_loader::config_error;

template<class T, class F>
std::expected <T, error_code> narrow_integer(std::int64_t value, F on_error){
    if(value < 0 || static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()){
        return std::unexpected(on_error());
    }
    return static_cast<T>(value);
}
}

toml_section::toml_section(const toml::table* tbl, std::string path) : tbl(tbl), path(std::move(path)){}

std::expected <toml_section, error_code> toml_section::root_child(const toml::table& root, std::string_view name){
    toml_section top(&root, "");
    return top.child(name);
}

std::expected <toml_section, error_code> toml_section::child(std::string_view name) const{
    std::string child_path = path.empty() ? std::string(name) : path + "." + std::string(name);
    const toml::node* node = find(name);
    if(node == nullptr) return toml_section(nullptr, std::move(child_path));

    const toml::table* child_tbl = node->as_table();
    if(child_tbl == nullptr){
        return std::unexpected(fail(config_error::invalid_type, name, node, "expected a table"));
    }
    return toml_section(child_tbl, std::move(child_path));
}

bool toml_section::present() const noexcept{ return tbl != nullptr; }
bool toml_section::contains(std::string_view key) const{ return find(key) != nullptr; }

const toml::node* toml_section::find(std::string_view key) const{
    if(tbl == nullptr) return nullptr;
    return tbl->get(key);
}

std::string toml_section::field(std::string_view key) const{
    if(path.empty()) return std::string(key);
    return path + "." + std::string(key);
}

error_code toml_section::fail(
    config_error code, std::string_view key, const toml::node* node, std::string_view detail
) const{
    std::string msg(detail);
    if(node != nullptr){
        msg += " (line " + std::to_string(node->source().begin.line) + ")";
    }
    logger::log_error("lazymc::config", field(key), msg);
    return error_code::from_config(code);
}

std::expected <bool, error_code> toml_section::get_bool(std::string_view key, bool fallback) const{
    const toml::node* node = find(key);
    if(node == nullptr) return fallback;

    const toml::value<bool>* value = node->as_boolean();
    if(value == nullptr){
        return std::unexpected(fail(config_error::invalid_type, key, node, "expected a boolean"));
    }
    return value->get();
}

std::expected <std::uint16_t, error_code> toml_section::get_u16(std::string_view key, std::uint16_t fallback) const{
    const toml::node* node = find(key);
    if(node == nullptr) return fallback;

    const toml::value<std::int64_t>* value = node->as_integer();
    if(value == nullptr){
        return std::unexpected(fail(config_error::invalid_type, key, node, "expected an integer"));
    }
    return narrow_integer<std::uint16_t>(value->get(), [&]{
        return fail(config_error::out_of_range, key, node, "expected an integer in 0..65535");
    });
}

std::expected <std::uint32_t, error_code> toml_section::get_u32(std::string_view key, std::uint32_t fallback) const{
    const toml::node* node = find(key);
    if(node == nullptr) return fallback;

    const toml::value<std::int64_t>* value = node->as_integer();
    if(value == nullptr){
        return std::unexpected(fail(config_error::invalid_type, key, node, "expected an integer"));
    }
    return narrow_integer<std::uint32_t>(value->get(), [&]{
        return fail(config_error::out_of_range, key, node, "expected an integer in 0..4294967295");
    });
}

std::expected <std::string, error_code> toml_section::get_string(std::string_view key, std::string_view fallback) const{
    const toml::node* node = find(key);
    if(node == nullptr) return std::string(fallback);

    const toml::value<std::string>* value = node->as_string();
    if(value == nullptr){
        return std::unexpected(fail(config_error::invalid_type, key, node, "expected a string"));
    }
    return value->get();
}

std::expected <std::optional<std::string>, error_code> toml_section::get_optional_string(
    std::string_view key, std::optional<std::string> fallback
) const{
    const toml::node* node = find(key);
    if(node == nullptr) return fallback;

    const toml::value<std::string>* value = node->as_string();
    if(value == nullptr){
        return std::unexpected(fail(config_error::invalid_type, key, node, "expected a string"));
    }
    return std::optional<std::string>(value->get());
}

std::expected <std::string, error_code> toml_section::require_string(std::string_view key) const{
    const toml::node* node = find(key);
    if(node == nullptr){
        return std::unexpected(fail(config_error::missing_required_key, key, nullptr, "missing required field"));
    }
    return get_string(key, {});
}

std::expected <socket_address, error_code> toml_section::get_socket_address(
    std::string_view key, std::string_view fallback
) const{
    const toml::node* node = find(key);
    if(node == nullptr) return default_socket_address(fallback);

    const toml::value<std::string>* value = node->as_string();
    if(value == nullptr){
        return std::unexpected(fail(config_error::invalid_type, key, node, "expected an address string"));
    }

    auto sa_exp = net::resolve_socket_address(value->get());
    if(!sa_exp){
        std::string detail = "failed to parse or resolve address '" + value->get() + "': " + to_string(sa_exp.error());
        return std::unexpected(fail(config_error::invalid_address, key, node, detail));
    }
    return *sa_exp;
}

std::expected <std::vector<join_method>, error_code> toml_section::get_join_methods(
    std::string_view key, std::initializer_list<join_method> fallback
) const{
    const toml::node* node = find(key);
    if(node == nullptr) return std::vector<join_method>(fallback);

    const toml::array* arr = node->as_array();
    if(arr == nullptr){
        return std::unexpected(fail(config_error::invalid_type, key, node, "expected an array of join methods"));
    }

    std::vector<join_method> methods;
    for(const toml::node& item : *arr){
        const toml::value<std::string>* name = item.as_string();
        if(name == nullptr){
            return std::unexpected(fail(config_error::invalid_type, key, &item, "expected a join method name"));
        }

        std::optional<join_method> method = parse_join_method_strict(name->get());
        if(!method){
            std::string detail = "unknown join method '" + name->get() + "', expected kick, hold, forward or lobby";
            return std::unexpected(fail(config_error::unknown_join_method, key, &item, detail));
        }
        methods.push_back(*method);
    }
    return methods;
}
