#pragma once

#include <lexgraph/core/types.h>

#include <filesystem>
#include <string>

namespace lexgraph::parsing {

// Read a whole source file as bytes. FileNotFound / IOError on failure.
Result<std::string> readSourceFile(const std::filesystem::path& path);

} // namespace lexgraph::parsing
