#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fwf {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Descriptor sitting next to a data file: "<stem>.layout.json", then
// "<file>.layout.json". nullopt when neither exists.
std::optional<std::filesystem::path> sibling_layout(const std::filesystem::path& data_file);

// Slug generation: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// SHA-256 hex prefix used by slug.
std::string hex_hash_prefix(std::string_view data, int len);

}
