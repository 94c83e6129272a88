#include "fwf/value.hpp"
#include <cstdio>

namespace fwf {

namespace {
struct ToText {
  std::string operator()(std::monostate) const { return {}; }
  std::string operator()(std::int64_t v) const { return std::to_string(v); }
  std::string operator()(double v) const {
    char tmp[64];
    int n = std::snprintf(tmp, sizeof(tmp), "%.15g", v);
    return std::string(tmp, (n > 0) ? static_cast<size_t>(n) : 0);
  }
  std::string operator()(const Date& d) const { return to_string(d); }
  std::string operator()(const std::string& s) const { return s; }
};
}

std::string to_string(const Value& v) { return std::visit(ToText{}, v); }

}
