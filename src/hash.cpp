#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

DigestAlgorithm digest_algorithm_for(const std::string& hex_digest) {
    const bool is_hex = std::all_of(hex_digest.begin(), hex_digest.end(),
                                    [](unsigned char c) { return std::isxdigit(c) != 0; });
    if (is_hex && hex_digest.size() == 32) return DigestAlgorithm::MD5;
    if (is_hex && hex_digest.size() == 64) return DigestAlgorithm::SHA256;
    throw InvalidRequestError(string_format("error.invalid_checksum", hex_digest));
}

std::string calculate_digest(const fs::path& file_path, DigestAlgorithm algorithm) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw FilesystemError(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw DsfetchException(get_string("error.openssl_ctx_failed"));
    }

    const EVP_MD* md = (algorithm == DigestAlgorithm::MD5) ? EVP_md5() : EVP_sha256();
    if (EVP_DigestInit_ex(md_ctx.get(), md, nullptr) != 1) {
        throw DsfetchException(get_string("error.openssl_init_failed"));
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(md_ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw DsfetchException(get_string("error.openssl_update_failed"));
        }
    }
    if (file.bad()) {
        throw FilesystemError(string_format("error.read_file_failed", file_path.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len;
    if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
        throw DsfetchException(get_string("error.openssl_final_failed"));
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }

    return ss.str();
}

std::string calculate_md5(const fs::path& file_path) {
    return calculate_digest(file_path, DigestAlgorithm::MD5);
}

std::string calculate_sha256(const fs::path& file_path) {
    return calculate_digest(file_path, DigestAlgorithm::SHA256);
}

bool verify_checksum(const fs::path& file_path, const std::string& expected_hex) {
    return calculate_digest(file_path, digest_algorithm_for(expected_hex)) == to_lower(expected_hex);
}
