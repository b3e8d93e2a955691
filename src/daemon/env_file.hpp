#pragma once

#include <cstddef>
#include <expected>
#include <string>

// Loads KEY=VALUE lines into the process environment. Blank lines, '#'
// comments and an optional "export " prefix are accepted; values may be
// single- or double-quoted. Variables that are already set are left alone.
// Returns the number of variables set, or an error if the file can't be read.
std::expected<size_t, std::string> load_env_file(const std::string& path);
