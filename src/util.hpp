#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hybridllm {

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Trim whitespace
std::string trim(const std::string& s);

// Split by delimiter, trimming each piece and dropping empty ones
std::vector<std::string> split_list(const std::string& s, char delim);

// Shorten to max_len bytes, appending "..." when cut
std::string truncate(const std::string& s, size_t max_len);

// Decimal digits only, no sign, must fit in 32 bits
std::optional<uint32_t> parse_u32(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace hybridllm
