#include "fwf/mustache_renderer.hpp"
#include "fwf/path_utils.hpp"

#if __has_include(<kainjow/mustache.hpp>)
  #include <kainjow/mustache.hpp>
#elif __has_include(<mustache.hpp>)
  #include <mustache.hpp>
#else
  #error "kainjow/Mustache header not found"
#endif

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <cctype>

namespace fwf {

MustacheRenderer::MustacheRenderer() : cfg_{} {}

MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static std::string read_file(const std::string& path, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { err += "open failed: " + path + "\n"; return {}; }
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

// naive "{{> name}}" inliner that looks for partial files in cfg_.partials_dir
static std::string inline_partials(std::string tpl,
                                   const std::filesystem::path& partials_dir,
                                   std::string& err) {
  size_t pos = 0;
  while ((pos = tpl.find("{{>", pos)) != std::string::npos) {
    size_t name_start = pos + 3;
    while (name_start < tpl.size() && std::isspace(static_cast<unsigned char>(tpl[name_start])))
      ++name_start;
    size_t close = tpl.find("}}", name_start);
    if (close == std::string::npos) break;

    size_t name_end = close;
    while (name_end > name_start &&
           std::isspace(static_cast<unsigned char>(tpl[name_end - 1])))
      --name_end;

    std::string partial_name = tpl.substr(name_start, name_end - name_start);
    if (partial_name.empty()) { pos = close + 2; continue; }

    // allow both "<name>" and "<name>.mustache"
    std::string perr;
    std::filesystem::path p1 = partials_dir / partial_name;
    std::filesystem::path p2 = partials_dir / (partial_name + ".mustache");

    std::string content = read_file(p1.string(), perr);
    if (content.empty()) content = read_file(p2.string(), perr);
    if (content.empty()) {
      err += "partial not found: " + p1.string() + " | " + p2.string() + "\n";
      pos = close + 2;
      continue;
    }

    tpl.replace(pos, (close + 2) - pos, content);
    pos += content.size();
  }
  return tpl;
}

static kainjow::mustache::data to_data(const RenderContext::Fields& fields) {
  kainjow::mustache::data obj{kainjow::mustache::data::type::object};
  for (const auto& kv : fields) obj.set(kv.first, kv.second);
  return obj;
}

bool MustacheRenderer::render_to_string(std::string_view template_name,
                                        const RenderContext& ctx,
                                        std::string& out) {
  err_.clear();

  const auto tpl_path =
      (std::filesystem::path(cfg_.template_dir) / std::string(template_name)).string();

  std::string tpl = read_file(tpl_path, err_);
  if (tpl.empty() && !err_.empty()) return false;

  tpl = inline_partials(std::move(tpl), std::filesystem::path(cfg_.partials_dir), err_);

  kainjow::mustache::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  kainjow::mustache::data data = to_data(ctx.values);
  // raw JSON; templates include it with {{{ctx}}}
  data.set("ctx", ctx.json);
  for (const auto& list : ctx.lists) {
    kainjow::mustache::data items{kainjow::mustache::data::type::list};
    for (const auto& item : list.second) items.push_back(to_data(item));
    data.set(list.first, items);
  }

  out = view.render(data);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  return true;
}

bool MustacheRenderer::render_to_file(std::string_view template_name,
                                      const RenderContext& ctx,
                                      std::string_view out_path) {
  std::string rendered;
  if (!render_to_string(template_name, ctx, rendered)) return false;

  if (!ensure_parent_dirs(std::filesystem::path(out_path))) { err_ = "mkdir -p failed"; return false; }

  std::ofstream out(std::string(out_path), std::ios::binary);
  if (!out) { err_ = "write failed: " + std::string(out_path); return false; }
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  return true;
}

}
