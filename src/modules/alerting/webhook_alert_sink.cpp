#include "modules/alerting/webhook_alert_sink.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace sovereign_defense {
namespace alerting {

using logging::LogLevel;

namespace {

// CURL callback
size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* s) {
    size_t length = size * nmemb;
    try {
        s->append(static_cast<char*>(contents), length);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return length;
}

} // namespace

std::string deliveryResultToString(DeliveryResult result) {
    switch (result) {
        case DeliveryResult::SUCCESS: return "success";
        case DeliveryResult::FAILURE: return "failure";
        case DeliveryResult::RETRY: return "retry";
        case DeliveryResult::CONNECTION_ERROR: return "connection_error";
        case DeliveryResult::AUTHENTICATION_ERROR: return "authentication_error";
    }
    return "failure";
}

WebhookAlertSink::WebhookAlertSink(const config::WebhookSinkConfig& config,
                                   std::shared_ptr<logging::LoggingModule> logging_module)
    : config_(config), logging_module_(std::move(logging_module)) {
    if (config_.url.empty()) {
        throw std::invalid_argument("Webhook alert sink requires a url");
    }
    curl_global_init(CURL_GLOBAL_ALL);
}

WebhookAlertSink::~WebhookAlertSink() {
    curl_global_cleanup();
}

DeliveryResult WebhookAlertSink::classifyStatus(long http_code) {
    if (http_code >= 200 && http_code < 300) {
        return DeliveryResult::SUCCESS;
    }
    if (http_code == 401 || http_code == 403) {
        return DeliveryResult::AUTHENTICATION_ERROR;
    }
    if (http_code == 429 || http_code >= 500) {
        return DeliveryResult::RETRY;
    }
    return DeliveryResult::FAILURE;
}

DeliveryResult WebhookAlertSink::post(const nlohmann::json& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return DeliveryResult::FAILURE;
    }

    curl_easy_setopt(curl, CURLOPT_URL, config_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);

    std::string json_str = body.dump();
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_str.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    std::string auth;
    if (!config_.username.empty()) {
        auth = config_.username + ":" + config_.password;
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERPWD, auth.c_str());
    }

    if (config_.url.compare(0, 8, "https://") == 0) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        if (!config_.ca_cert_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_cert_path.c_str());
        }
    }

    std::string response_string;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl);

    DeliveryResult result;
    if (res != CURLE_OK) {
        result = DeliveryResult::CONNECTION_ERROR;
        if (logging_module_) {
            logging_module_->log(LogLevel::WARNING, "WebhookAlertSink", "post",
                                 std::string("Request failed: ") + curl_easy_strerror(res),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
    } else {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        result = classifyStatus(http_code);
        if (result != DeliveryResult::SUCCESS && logging_module_) {
            logging_module_->log(LogLevel::WARNING, "WebhookAlertSink", "post",
                                 "Endpoint answered HTTP " + std::to_string(http_code),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__),
                                 nlohmann::json{{"response", response_string}});
        }
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

bool WebhookAlertSink::notify(const AlertRequest& request) {
    return post(request.toJson()) == DeliveryResult::SUCCESS;
}

} // namespace alerting
} // namespace sovereign_defense
