#include "shieldcore/io/WebhookSink.hpp"
#include "shieldcore/io/JsonCodec.hpp"
#include "shieldcore/core/Errors.hpp"

#include <curl/curl.h>
#include <boost/json.hpp>

namespace shieldcore::io {

static size_t curlWrite(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

WebhookSink::WebhookSink(std::string id, std::string url, long timeout_ms)
    : id_(std::move(id)), url_(std::move(url)), timeout_ms_(timeout_ms) {}

void WebhookSink::deliver(const MitigationAction& a) {
    post(boost::json::serialize(to_json(a)));
}

void WebhookSink::deliver(const AlertEvent& a) {
    post(boost::json::serialize(to_json(a)));
}

void WebhookSink::post(const std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) throw DispatchFailure(id_ + ": curl_easy_init failed");

    std::string response;
    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWrite);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    if (rc == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        throw DispatchFailure(id_ + ": " + curl_easy_strerror(rc));
    }
    if (status >= 400) {
        throw DispatchFailure(id_ + ": HTTP " + std::to_string(status) + " from " + url_);
    }
}

} // namespace shieldcore::io
