#include "crypto/model/EncryptedSecret.hpp"
#include "crypto/util/encrypt.hpp"

#include <nlohmann/json.hpp>

using namespace cfi::crypto::util;

namespace cfi::crypto::model {

std::string EncryptedSecret::serialize() const {
    return nlohmann::json{
        {"iv", b64_encode(iv)},
        {"value", b64_encode(value)}
    }.dump();
}

std::optional<EncryptedSecret> EncryptedSecret::parse(const std::string& payload) {
    const auto j = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    const auto iv = j.find("iv");
    const auto value = j.find("value");
    if (iv == j.end() || value == j.end() || !iv->is_string() || !value->is_string()) return std::nullopt;

    const auto& ivStr = iv->get_ref<const std::string&>();
    const auto& valueStr = value->get_ref<const std::string&>();
    if (ivStr.empty() || valueStr.empty()) return std::nullopt;

    EncryptedSecret secret;
    try {
        secret.iv = b64_decode(ivStr);
        secret.value = b64_decode(valueStr);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }

    if (secret.iv.empty() || secret.value.empty()) return std::nullopt;
    return secret;
}

}
