#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace Hasher {

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;

// Helper deleter
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;

const EVP_MD* evp_for(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::MD5: return EVP_md5();
        case ChecksumAlgorithm::SHA256: return EVP_sha256();
        case ChecksumAlgorithm::SHA512: return EVP_sha512();
    }
    throw std::invalid_argument("unknown checksum algorithm");
}

md_ctx_ptr new_context(ChecksumAlgorithm algorithm) {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (!EVP_DigestInit_ex(ctx.get(), evp_for(algorithm), nullptr)) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, size_t len) {
    if (!EVP_DigestUpdate(ctx, data, len)) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string finish(EVP_MD_CTX* ctx) {
    std::array<uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx, out.data(), &len)) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return to_hex(out.data(), len);
}

} // namespace

const std::vector<std::string>& supported_algorithms() {
    static const std::vector<std::string> names = {"sha256", "sha512", "md5"};
    return names;
}

ChecksumAlgorithm parse_algorithm(const std::string& tag) {
    std::string lower = tag;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sha256") return ChecksumAlgorithm::SHA256;
    if (lower == "sha512") return ChecksumAlgorithm::SHA512;
    if (lower == "md5") return ChecksumAlgorithm::MD5;
    throw ValidationError("unsupported hash type: " + tag);
}

bool is_supported_algorithm(const std::string& tag) {
    try {
        parse_algorithm(tag);
        return true;
    } catch (const ValidationError&) {
        return false;
    }
}

std::string algorithm_name(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::MD5: return "md5";
        case ChecksumAlgorithm::SHA256: return "sha256";
        case ChecksumAlgorithm::SHA512: return "sha512";
    }
    return "unknown";
}

std::string digest(const std::string& data, ChecksumAlgorithm algorithm) {
    md_ctx_ptr ctx = new_context(algorithm);
    update(ctx.get(), data.data(), data.size());
    return finish(ctx.get());
}

std::string file_digest(const std::filesystem::path& path, ChecksumAlgorithm algorithm,
                        const CancellationToken& token) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open file: " + path.string());
    }

    md_ctx_ptr ctx = new_context(algorithm);
    std::vector<char> block(kReadBlockSize);
    while (file) {
        token.throw_if_cancelled();
        file.read(block.data(), static_cast<std::streamsize>(block.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            update(ctx.get(), block.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        throw std::runtime_error("failed to compute hash: read error on " + path.string());
    }
    return finish(ctx.get());
}

std::string file_digest(const std::filesystem::path& path, const std::string& algorithm_tag,
                        const CancellationToken& token) {
    return file_digest(path, parse_algorithm(algorithm_tag), token);
}

std::string to_hex(const uint8_t* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

} // namespace Hasher
