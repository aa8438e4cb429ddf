#pragma once

#include <string>

namespace chaosmine {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also tried
// against CHAOSMINE_SOURCE_DIR (when defined) and the parents of the working
// directory, so tests can find data/ from inside a build tree.
std::string read_text_file(const std::string& path);

// Writes string to file via a temporary sibling + rename, creating parent
// directories if needed. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace chaosmine
