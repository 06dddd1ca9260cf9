#include "utils/hash.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace kiln::utils {
namespace {

std::string ToHex(const unsigned char* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

}  // namespace

std::string Sha256Hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
    return ToHex(hash, sizeof(hash));
}

std::string HmacSha256Hex(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const auto* result = HMAC(
        EVP_sha256(),
        key.data(),
        static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()),
        message.size(),
        digest,
        &digest_len);
    if (!result) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return ToHex(digest, digest_len);
}

std::string RandomHex(std::size_t bytes) {
    std::vector<unsigned char> data(bytes);
    std::random_device rd;
    for (auto& b : data) {
        b = static_cast<unsigned char>(rd());
    }
    return ToHex(data.data(), data.size());
}

}  // namespace kiln::utils
