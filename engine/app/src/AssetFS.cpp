#include "crystal/app/AssetFS.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>

namespace crystal::app {

namespace {

void PushIfExists(std::vector<std::filesystem::path>& roots, const std::filesystem::path& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return;
    }
    if (std::find(roots.begin(), roots.end(), path) == roots.end()) {
        roots.push_back(path);
    }
}

void HarvestAssetDirs(std::vector<std::filesystem::path>& roots, const std::filesystem::path& start,
                      int max_depth) {
    if (start.empty()) {
        return;
    }
    std::filesystem::path cursor = start;
    for (int depth = 0; depth < max_depth && !cursor.empty(); ++depth) {
        PushIfExists(roots, cursor / "assets");
        if (cursor == cursor.parent_path()) {
            break;
        }
        cursor = cursor.parent_path();
    }
}

}  // namespace

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

const std::vector<std::filesystem::path>& AssetRoots() {
    static std::vector<std::filesystem::path> roots;
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (const char* env = std::getenv("CRYSTAL_ASSETS")) {
            PushIfExists(roots, std::filesystem::path(env));
            HarvestAssetDirs(roots, std::filesystem::path(env), 2);
        }

        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            HarvestAssetDirs(roots, cwd, 8);
        }

        if (char* raw_base = SDL_GetBasePath()) {
            std::filesystem::path base_path(raw_base);
            SDL_free(raw_base);
            HarvestAssetDirs(roots, base_path, 8);
        }
    });
    return roots;
}

std::filesystem::path AssetPath(const std::string& filename) {
    for (const auto& root : AssetRoots()) {
        std::filesystem::path candidate = root / filename;
        if (FileExists(candidate)) {
            return candidate;
        }
    }
    return std::filesystem::path(filename);
}

std::optional<std::filesystem::path> ResolveVariantPath(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    const std::filesystem::path literal{name};
    if (FileExists(literal)) {
        return literal;
    }
    std::filesystem::path relative = std::filesystem::path("variants") / literal.filename();
    if (!relative.has_extension()) {
        relative.replace_extension(".json");
    }
    const std::filesystem::path resolved = AssetPath(relative.string());
    if (FileExists(resolved)) {
        return resolved;
    }
    return std::nullopt;
}

std::optional<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

}  // namespace crystal::app
