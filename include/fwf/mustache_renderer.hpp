#pragma once
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fwf {

// Values handed to a template. Scalars render as {{key}}, lists as
// {{#key}}...{{/key}} sections, and the raw JSON as {{{ctx}}}.
struct RenderContext {
  using Fields = std::map<std::string, std::string>;
  std::string json;
  Fields values;
  std::map<std::string, std::vector<Fields>> lists;
};

class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials";
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  bool render_to_string(std::string_view template_name,
                        const RenderContext& ctx,
                        std::string& out);

  bool render_to_file(std::string_view template_name,
                      const RenderContext& ctx,
                      std::string_view out_path);

  const std::string& last_error() const noexcept { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
