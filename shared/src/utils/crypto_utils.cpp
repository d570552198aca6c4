#include "utils/crypto_utils.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace tsimport {
namespace utils {

std::string CryptoUtils::base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);
    
    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);
    
    BUF_MEM* buffer_ptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);
    
    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);
    
    return result;
}

std::string CryptoUtils::basic_auth_token(const std::string& username, const std::string& password) {
    if (username.empty() && password.empty()) {
        return "";
    }
    return base64_encode(string_to_bytes(username + ":" + password));
}

std::vector<uint8_t> CryptoUtils::string_to_bytes(const std::string& str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

} // namespace utils
} // namespace tsimport
