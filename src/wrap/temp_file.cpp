/*
 * Persistent temporary files implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/wrap/temp_file.hpp>
#include <cerrno>
#include <string>
#include <system_error>
#include <vector>
#ifdef _WIN32
#include <random>
#else
#include <stdlib.h>
#include <unistd.h>
#endif

namespace shellwrap {

static std::system_error io_error(int err, const std::string& what) {
    return std::system_error(err, std::generic_category(), what);
}

#ifdef _WIN32
static std::string random_name_part() {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789_";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);
    std::string out;
    for (int i=0;i<8;++i) out.push_back(alphabet[pick(gen)]);
    return out;
}
#endif

TempFile TempFile::create(const std::string& name_prefix, const std::string& suffix) {
#ifdef _WIN32
    // "x" fails if the name already exists, so a collision just retries.
    for (int attempt=0; attempt<100; ++attempt) {
        std::string candidate = name_prefix + random_name_part() + suffix;
        std::FILE* f = std::fopen(candidate.c_str(), "wx");
        if (f) return TempFile(f, candidate);
        if (errno != EEXIST) throw io_error(errno, "cannot create temporary file " + candidate);
    }
    throw io_error(EEXIST, "no usable temporary file name for prefix " + name_prefix);
#else
    std::string tmpl = name_prefix + "XXXXXX" + suffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) throw io_error(errno, "cannot create temporary file " + tmpl);
    std::FILE* f = ::fdopen(fd, "w");
    if (!f) {
        int err = errno;
        ::close(fd);
        throw io_error(err, "cannot open temporary file " + std::string(buf.data()));
    }
    return TempFile(f, std::string(buf.data()));
#endif
}

TempFile::TempFile(TempFile&& other) noexcept : m_file(other.m_file), m_path(std::move(other.m_path)) {
    other.m_file = nullptr;
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        if (m_file) std::fclose(m_file);
        m_file = other.m_file;
        m_path = std::move(other.m_path);
        other.m_file = nullptr;
    }
    return *this;
}

// Never unlinks: the path belongs to the caller.
TempFile::~TempFile() {
    if (m_file) std::fclose(m_file);
}

void TempFile::write(const std::string& text) {
    if (!m_file) throw io_error(EBADF, "write to closed temporary file " + m_path);
    if (text.empty()) return;
    size_t n = std::fwrite(text.data(), 1, text.size(), m_file);
    if (n != text.size()) throw io_error(errno ? errno : EIO, "short write to " + m_path);
}

void TempFile::close() {
    if (!m_file) return;
    std::FILE* f = m_file;
    m_file = nullptr;
    if (std::fclose(f) != 0) throw io_error(errno ? errno : EIO, "cannot close " + m_path);
}

} // namespace shellwrap
