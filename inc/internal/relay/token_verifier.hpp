#ifndef SCRIBE_RELAY_TOKEN_VERIFIER_HPP
#define SCRIBE_RELAY_TOKEN_VERIFIER_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace scribe {
namespace relay {

struct AuthResult {
    std::string user_id;
};

// =============================================================================
// Token Verifier Interface (身份 token 校验)
// =============================================================================

class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;

    /// @brief 校验 bearer token, 失败返回 nullopt (日志中不得出现 token)
    virtual std::optional<AuthResult> verify(const std::string& token) const = 0;
};

// =============================================================================
// HS256 JWT Verifier (本地校验, 不发起网络请求)
// =============================================================================
//
// 检查: 签名 (HMAC-SHA256), alg == "HS256", sub 非空,
// exp (若存在) 未过期, nbf (若存在) 已生效。
//

class JwtTokenVerifier : public ITokenVerifier {
public:
    explicit JwtTokenVerifier(std::string secret, int64_t leeway_seconds = 0)
        : secret_(std::move(secret)), leeway_seconds_(leeway_seconds) {}

    std::optional<AuthResult> verify(const std::string& token) const override;

private:
    std::string secret_;
    int64_t leeway_seconds_;
};

/// @brief 签发 HS256 JWT (测试与 demo 使用)
/// @param ttl_seconds 有效期, 负数生成已过期的 token
std::string issueToken(const std::string& secret, const std::string& subject, int64_t ttl_seconds = 3600);

}  // namespace relay
}  // namespace scribe

#endif  // SCRIBE_RELAY_TOKEN_VERIFIER_HPP
