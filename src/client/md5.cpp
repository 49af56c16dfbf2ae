
#include <openssl/evp.h>

#include <array>
#include <stdexcept>

#include "md5.hpp"


std::string md5Hex(std::string const & data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
    unsigned int size = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &size, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(MD5) failed");
    }

    static char const hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (unsigned int i = 0; i < size; i++) {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 15]);
    }
    return result;
}
