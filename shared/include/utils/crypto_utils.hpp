#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace tsimport {
namespace utils {

class CryptoUtils {
public:
    // Base64 encoding (no line breaks)
    static std::string base64_encode(const std::vector<uint8_t>& data);

    // Value for an HTTP "Authorization: Basic ..." header
    static std::string basic_auth_token(const std::string& username, const std::string& password);

    static std::vector<uint8_t> string_to_bytes(const std::string& str);
};

} // namespace utils
} // namespace tsimport
