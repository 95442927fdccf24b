#pragma once
#include <cstdint>
#include <string>

namespace shellwrap {

// 42 -> "42 B", 1042 -> "1 KB", 10004242 -> "9.5 MB", 100000004242 -> "93.13 GB"
std::string human_bytes(std::uint64_t n);

} // namespace shellwrap
