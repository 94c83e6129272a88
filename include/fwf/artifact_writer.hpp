#pragma once
#include <string>

#include "fwf/mustache_renderer.hpp"
#include "fwf/run_json.hpp"

namespace fwf {

// Template values for one scan (KPIs, columns, errors by field).
RenderContext make_report_context(const RunJsonPayload& p);

// Writes:
//   <artifact_root>/<slug>/run.json
//   <artifact_root>/<slug>/report.html   (templates/report.mustache)
bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const RunJsonPayload& payload,
                      std::string* err_out = nullptr);

}
