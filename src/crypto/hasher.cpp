#include "crypto/hasher.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <memory>
#include <vector>

namespace Hasher {

namespace {

// Helper deleter
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };
using ctx_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;

ctx_ptr begin_sha256() {
    ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL)) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, size_t size) {
    if (!EVP_DigestUpdate(ctx, data, size)) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

hash_t finish(EVP_MD_CTX* ctx) {
    hash_t hash;
    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx, hash.data(), &len)) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return hash;
}

} // namespace

hash_t sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for hashing: " + path.string());
    }

    auto ctx = begin_sha256();
    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            update(ctx.get(), buffer.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file for hashing: " + path.string());
    }
    return finish(ctx.get());
}

std::string hash_to_hex(const hash_t& hash) {
    std::stringstream ss;
    for (uint8_t byte : hash) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return ss.str();
}

} // namespace Hasher
