#include <lexgraph/parsing/source_reader.h>

#include <fstream>
#include <sstream>

namespace lexgraph::parsing {

Result<std::string> readSourceFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Cannot open file: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IOError, "Cannot open file: " + path.string()};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::IOError, "Failed reading file: " + path.string()};
    }
    return buffer.str();
}

} // namespace lexgraph::parsing
