#include "fwf/path_utils.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace fwf {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::optional<std::filesystem::path> sibling_layout(const std::filesystem::path& data_file) {
  std::filesystem::path by_stem = data_file;
  by_stem.replace_extension(".layout.json");
  if (std::filesystem::exists(by_stem)) return by_stem;
  std::filesystem::path by_name = data_file.string() + ".layout.json";
  if (std::filesystem::exists(by_name)) return by_name;
  return std::nullopt;
}

std::string hex_hash_prefix(std::string_view data, int len) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < (len+1)/2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  auto s = o.str();
  if ((int)s.size() > len) s.resize(len);
  return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    if ((int)base.size() > len) base.resize(len);
    return base;
  }
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) if (c=='/' || c=='\\') c='-';
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
