#include "relay/token_verifier.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <ctime>
#include <vector>

#include <nlohmann/json.hpp>

#include "scribe_log.hpp"
#include "util/base64.hpp"

namespace scribe {
namespace relay {

using json = nlohmann::json;

namespace {

std::vector<uint8_t> hmacSha256(const std::string& key, const std::string& data) {
    unsigned int len = 0;
    unsigned char result[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         result, &len);
    return std::vector<uint8_t>(result, result + len);
}

std::optional<json> decodeSegment(const std::string& segment) {
    auto bytes = util::base64Decode(segment);
    if (!bytes) {
        return std::nullopt;
    }
    json data = json::parse(bytes->begin(), bytes->end(), nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return std::nullopt;
    }
    return data;
}

std::optional<int64_t> numericClaim(const json& payload, const char* name) {
    auto it = payload.find(name);
    if (it == payload.end() || !it->is_number()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(it->get<double>());
}

}  // namespace

std::optional<AuthResult> JwtTokenVerifier::verify(const std::string& token) const {
    auto dot1 = token.find('.');
    auto dot2 = dot1 == std::string::npos ? std::string::npos : token.find('.', dot1 + 1);
    if (dot1 == std::string::npos || dot2 == std::string::npos ||
            token.find('.', dot2 + 1) != std::string::npos) {
        safeWarn("Auth", "JWT invalid signature or format");
        return std::nullopt;
    }

    const std::string signing_input = token.substr(0, dot2);
    auto signature = util::base64Decode(token.substr(dot2 + 1));
    auto expected = hmacSha256(secret_, signing_input);
    if (!signature || signature->size() != expected.size() ||
            CRYPTO_memcmp(signature->data(), expected.data(), expected.size()) != 0) {
        safeWarn("Auth", "JWT invalid signature or format");
        return std::nullopt;
    }

    auto header = decodeSegment(token.substr(0, dot1));
    auto payload = decodeSegment(token.substr(dot1 + 1, dot2 - dot1 - 1));
    if (!header || !payload) {
        safeWarn("Auth", "JWT invalid signature or format");
        return std::nullopt;
    }

    auto alg = header->find("alg");
    if (alg == header->end() || !alg->is_string() || alg->get<std::string>() != "HS256") {
        safeWarn("Auth", "JWT invalid signature or format");
        return std::nullopt;
    }

    const int64_t now = static_cast<int64_t>(std::time(nullptr));
    auto exp = numericClaim(*payload, "exp");
    if (exp && *exp + leeway_seconds_ <= now) {
        safeWarn("Auth", "JWT expired");
        return std::nullopt;
    }
    auto nbf = numericClaim(*payload, "nbf");
    if (nbf && *nbf - leeway_seconds_ > now) {
        safeWarn("Auth", "JWT not yet valid");
        return std::nullopt;
    }

    auto sub = payload->find("sub");
    if (sub == payload->end() || !sub->is_string() || sub->get<std::string>().empty()) {
        safeWarn("Auth", "JWT missing sub claim");
        return std::nullopt;
    }

    return AuthResult{sub->get<std::string>()};
}

std::string issueToken(const std::string& secret, const std::string& subject, int64_t ttl_seconds) {
    const int64_t now = static_cast<int64_t>(std::time(nullptr));

    json header = {{"alg", "HS256"}, {"typ", "JWT"}};
    json payload = {{"sub", subject}, {"iat", now}, {"exp", now + ttl_seconds}};

    std::string signing_input = util::base64UrlEncode(header.dump()) + "." +
        util::base64UrlEncode(payload.dump());
    auto signature = hmacSha256(secret, signing_input);
    return signing_input + "." + util::base64UrlEncode(signature.data(), signature.size());
}

}  // namespace relay
}  // namespace scribe
