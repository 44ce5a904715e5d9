#include "modules/evidence/evidence_record.hpp"
#include "modules/evidence/ledger_error.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <iomanip>
#include <sstream>
#include <memory>

namespace sovereign_defense {
namespace evidence {

namespace {

std::string toHex(const unsigned char* digest, unsigned int length) {
    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

} // namespace

nlohmann::json EvidenceRecord::toJson() const {
    nlohmann::json j;
    j["sequence"] = sequence;
    j["timestamp"] = event_management::toMillis(event.getTimestamp());
    j["kind"] = event_management::eventKindToString(event.getKind());
    j["source"] = event.getSource().toJson();
    j["severity"] = event_management::severityToString(event.getSeverity());
    j["score"] = event.getScore();
    j["payload"] = event.getPayload();
    j["record_hash"] = record_hash;
    j["previous_hash"] = previous_hash;
    return j;
}

EvidenceRecord EvidenceRecord::fromJson(const nlohmann::json& json) {
    nlohmann::json event_json;
    event_json["kind"] = json.at("kind");
    event_json["source"] = json.at("source");
    event_json["severity"] = json.at("severity");
    event_json["score"] = json.at("score");
    event_json["payload"] = json.value("payload", nlohmann::json::object());
    event_json["timestamp"] = json.at("timestamp");

    return EvidenceRecord{
        json.at("sequence").get<uint64_t>(),
        event_management::SecurityEvent::fromJson(event_json),
        json.at("previous_hash").get<std::string>(),
        json.at("record_hash").get<std::string>()
    };
}

RecordHasher::RecordHasher(const std::string& hmac_key)
    : hmac_key_(hmac_key) {}

const std::string& RecordHasher::genesisHash() {
    static const std::string genesis(64, '0');
    return genesis;
}

std::string RecordHasher::hash(uint64_t sequence,
                               const event_management::SecurityEvent& event,
                               const std::string& previous_hash) const {
    std::string message = std::to_string(sequence) + "|" + event.toJson().dump() + "|" + previous_hash;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!hmac_key_.empty()) {
        unsigned char* result = HMAC(EVP_sha256(),
                                     hmac_key_.c_str(), static_cast<int>(hmac_key_.length()),
                                     reinterpret_cast<const unsigned char*>(message.c_str()),
                                     message.length(),
                                     digest,
                                     &digest_len);
        if (!result) {
            throw LedgerError("HMAC computation failed");
        }
        return toHex(digest, digest_len);
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), message.data(), message.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw LedgerError("SHA-256 computation failed");
    }
    return toHex(digest, digest_len);
}

} // namespace evidence
} // namespace sovereign_defense
