#pragma once

#include <string>

namespace resflow {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist under the working directory are also
// looked up under RESFLOW_SOURCE_DIR (when compiled in) and the parents of the
// working directory, so tests and the CLI can be run from a build tree.
std::string read_text_file(const std::string& path);

// Writes string to file via a temporary sibling + rename, creating parent
// directories if needed. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

} // namespace resflow
