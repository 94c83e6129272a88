#pragma once
#include <string>
#include <string_view>

#include "fwf/file_layout.hpp"

namespace fwf {

// JSON layout descriptor:
//   {
//     "record_length": 40,
//     "expected_rows": 1000,          (optional)
//     "expected_size": 41000,         (optional)
//     "one_based": false,             (optional; SAS FTS positions start at 1)
//     "columns": [
//       {"ord": 0, "name": "id", "type": "NUM", "start": 0, "length": 5},
//       {"name": "amount", "type": "NUM", "start": 5, "width": [8, 2]},
//       ...
//     ]
//   }
// "ord" defaults to the array index, "scale" to 0. "width" is the
// [length, scale] pair as written in FTS files.
//
// Throws InvalidSpecError on malformed JSON or an invalid layout.
FileLayout load_layout(const std::string& descriptor_path, std::string data_path);
FileLayout parse_layout(std::string_view json_text, std::string data_path);

}
