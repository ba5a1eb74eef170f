#include "output_parsers.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mcp::tools {

namespace {

bool is_hex(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool starts_with(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

std::vector<std::string> identify_hash_types(const std::string& hash) {
    const std::size_t length = hash.size();

    if (length == 32 && is_hex(hash)) {
        return {"MD5"};
    }
    if (length == 40 && is_hex(hash)) {
        return {"SHA1"};
    }
    if (length == 64 && is_hex(hash)) {
        return {"SHA256"};
    }
    if (starts_with(hash, "$2")) {
        return {"bcrypt"};
    }
    if (starts_with(hash, "$1$")) {
        return {"MD5 Crypt"};
    }
    if (starts_with(hash, "$5$")) {
        return {"SHA256 Crypt"};
    }
    if (starts_with(hash, "$6$")) {
        return {"SHA512 Crypt"};
    }
    return {};
}

std::optional<std::string> extract_recovered_key(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        auto marker = line.find("KEY FOUND");
        if (marker == std::string::npos) {
            continue;
        }
        auto open = line.find('[', marker);
        if (open == std::string::npos) {
            continue;
        }
        auto close = line.find(']', open + 1);
        if (close == std::string::npos) {
            continue;
        }
        return trim(line.substr(open + 1, close - open - 1));
    }
    return std::nullopt;
}

std::pair<std::string, std::string> split_base_url(const std::string& url) {
    std::string trimmed = url.substr(0, url.find_first_of("?#"));

    auto scheme_end = trimmed.find("://");
    auto path_start = trimmed.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) {
        return {trimmed, ""};
    }
    std::string path = trimmed.substr(path_start);
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return {trimmed.substr(0, path_start), path};
}

} // namespace mcp::tools
