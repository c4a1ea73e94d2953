#include "SHA1.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

std::array<unsigned char, 20> SHA1::calculate(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    std::array<unsigned char, 20> hash{};
    unsigned int length = 0;
    if (EVP_DigestInit_ex(context.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), hash.data(), &length) != 1 ||
        length != hash.size()) {
        throw std::runtime_error("SHA1 digest failed");
    }
    return hash;
}

std::string SHA1::toHex(const std::array<unsigned char, 20>& hash) {
    static const char DIGITS[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash.size() * 2);
    for (unsigned char byte : hash) {
        hex.push_back(DIGITS[byte >> 4]);
        hex.push_back(DIGITS[byte & 0x0f]);
    }
    return hex;
}
