/*
 * File checksums implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/util/hash.hpp>
#include <openssl/evp.h>
#include <cerrno>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace shellwrap {

static constexpr size_t kChunkSize = 262144;

std::string hashsum_file(const std::string& path, const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) throw std::invalid_argument("unsupported hash algorithm: " + algorithm);

    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::system_error(errno ? errno : ENOENT, std::generic_category(), "cannot open " + path);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw std::runtime_error("digest init failed: " + algorithm);
    }
    std::vector<char> chunk(kChunkSize);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        if (EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(got)) != 1) {
            throw std::runtime_error("digest update failed: " + algorithm);
        }
    }
    if (in.bad()) throw std::system_error(EIO, std::generic_category(), "read error on " + path);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) throw std::runtime_error("digest final failed: " + algorithm);

    static const char hex[] = "0123456789abcdef";
    std::string out; out.reserve(len * 2);
    for (unsigned int i=0;i<len;++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

std::string md5_file(const std::string& path) { return hashsum_file(path, "md5"); }

} // namespace shellwrap
