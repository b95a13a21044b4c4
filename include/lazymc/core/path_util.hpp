#pragma once
#include <filesystem>
#include <optional>

namespace path_util{
    bool is_regular_file(const std::filesystem::path& path);
    std::filesystem::path normalize(const std::filesystem::path& path);

    std::filesystem::path resolve_from_root(
        const std::filesystem::path& root, const std::filesystem::path& raw_path
    );

    std::optional<std::filesystem::path> parent_dir(const std::filesystem::path& path);
}
