/*
 * Persistent temporary files - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   A uniquely named file that outlives its handle. Closing (explicitly or
 *   on destruction) never removes the file; whoever receives path() owns it.
 */
#pragma once
#include <cstdio>
#include <string>
#include <utility>

namespace shellwrap {

class TempFile {
public:
    // Creates <name_prefix>XXXXXX<suffix>; the prefix may include a directory.
    // Throws std::system_error if the file cannot be created.
    static TempFile create(const std::string& name_prefix, const std::string& suffix = "");

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    ~TempFile();

    // Throws std::system_error on short write or after close().
    void write(const std::string& text);
    // Flushes and closes; throws std::system_error if the flush fails.
    void close();

    const std::string& path() const { return m_path; }
    bool is_open() const { return m_file != nullptr; }

private:
    TempFile(std::FILE* file, std::string path) : m_file(file), m_path(std::move(path)) {}
    std::FILE* m_file = nullptr;
    std::string m_path;
};

} // namespace shellwrap
