#pragma once

#include <string>

namespace partialjson::cli {

/// Reads a file into memory for CLI runs that need filesystem input.
/// MUST throw on missing/unreadable files and MUST not perform network IO.
/// Inputs are a path; outputs are contents; side effects are file reads/errors.
std::string read_file(const std::string& path);
/// Reads all stdin content for non-interactive usage.
/// MUST block until EOF and MUST not interpret the stream contents.
std::string read_stdin();
/// Checks whether a string should be treated as a URL.
/// MUST only match http:// and https:// prefixes.
bool is_url(const std::string& value);
/// Loads JSON text from a path, a URL, or stdin when input is empty.
/// MUST honor timeouts and MUST fail when network support is disabled.
/// Inputs are path/url and timeout; outputs are raw text with IO side effects.
std::string load_input(const std::string& input, int timeout_ms);

}  // namespace partialjson::cli
