#pragma once
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

class env_source{
public:
    using env_map = std::unordered_map<std::string, std::string>;
    using lookup_fn = std::function<std::optional<std::string>(std::string_view)>;
private:
    lookup_fn lookup;
public:
    explicit env_source(lookup_fn lookup);

    static env_source process();
    static env_source from_map(env_map vars);

    std::optional<std::string> get(std::string_view key) const;
};
