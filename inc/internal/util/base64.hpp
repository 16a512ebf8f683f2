#ifndef SCRIBE_UTIL_BASE64_HPP
#define SCRIBE_UTIL_BASE64_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scribe {
namespace util {

/// @brief 标准 base64 (带 padding)
std::string base64Encode(const uint8_t* data, size_t len);
std::string base64Encode(const std::vector<uint8_t>& data);

/// @brief base64url (无 padding, JWT 使用)
std::string base64UrlEncode(const uint8_t* data, size_t len);
std::string base64UrlEncode(const std::string& data);

/// @brief 解码 base64 或 base64url, 非法字符返回 nullopt
std::optional<std::vector<uint8_t>> base64Decode(const std::string& input);

}  // namespace util
}  // namespace scribe

#endif  // SCRIBE_UTIL_BASE64_HPP
