/*
 * File checksums - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace shellwrap {

// Lower-case hex digest of the file contents. algorithm is any OpenSSL digest
// name ("md5", "sha1", "sha256", ...). Reads 256 KiB at a time.
// Throws std::invalid_argument for an unknown algorithm and
// std::system_error if the file cannot be read.
std::string hashsum_file(const std::string& path, const std::string& algorithm = "md5");

std::string md5_file(const std::string& path);

} // namespace shellwrap
