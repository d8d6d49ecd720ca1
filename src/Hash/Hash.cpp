#include "Hash.hpp"
#include <openssl/sha.h>


// Desc: hash data into hex with OpenSSL SHA-256
// In: const std::string& data
// Out: std::string (hex digest)
std::string sha256_hex(const std::string& data) {
    unsigned char out[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out);
    static const char* hex = "0123456789abcdef";
    std::string h(2 * SHA256_DIGEST_LENGTH, '0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        h[2*i]   = hex[(out[i]>>4) & 0xF];
        h[2*i+1] = hex[out[i] & 0xF];
    }
    return h;
}
