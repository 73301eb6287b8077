#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace crystal::app {

bool FileExists(const std::filesystem::path& path);

const std::vector<std::filesystem::path>& AssetRoots();

std::filesystem::path AssetPath(const std::string& filename);

// Accepts a literal path or a name under assets/variants, with or without the
// .json extension.
std::optional<std::filesystem::path> ResolveVariantPath(const std::string& name);

std::optional<std::string> ReadTextFile(const std::filesystem::path& path);

}  // namespace crystal::app
