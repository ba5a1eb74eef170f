#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcp::tools {

/// Hash families guessed from length and prefix; empty when nothing matches.
std::vector<std::string> identify_hash_types(const std::string& hash);

/// Key text between the brackets on aircrack-ng's "KEY FOUND!" line.
std::optional<std::string> extract_recovered_key(const std::string& output);

/// "http://host:8080/prefix/?q#f" -> {"http://host:8080", "/prefix"}. Query and fragment are dropped.
std::pair<std::string, std::string> split_base_url(const std::string& url);

} // namespace mcp::tools
