#ifndef PHISCRUB_CONNECTORS_HTTP_NER_CAPABILITY_HPP
#define PHISCRUB_CONNECTORS_HTTP_NER_CAPABILITY_HPP

#include <curl/curl.h>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "connectors/ner_response_parser.hpp"
#include "detection/ner_capability.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace phiscrub {
namespace connectors {

/**
 * @brief NER capability backed by a remote recognition service.
 *
 * The service is probed once at construction (GET <endpoint>/health). If the
 * probe fails the capability reports itself unavailable for the lifetime of
 * the process; the pipeline then runs rule-only. Every detect() call is an
 * independent POST <endpoint>/ner with its own curl handle, so one instance
 * can be shared read-only between threads.
 */
class HttpNerCapability : public detection::NerCapability {
  public:
    HttpNerCapability(const std::string& endpoint, uint64_t timeoutMs)
        : m_endpoint(trimSlash(endpoint)), m_timeoutMs(timeoutMs), m_available(false),
          m_model("None") {
        initCurl();
        probe();
    }

    bool available() const override { return m_available; }

    std::string modelName() const override { return m_model; }

    std::vector<detection::NerSpan> detect(const std::string& text) const override {
        if (!m_available) {
            throw util::CapabilityUnavailableError("NER service at " + m_endpoint + " not initialized");
        }
        std::string response;
        long status = 0;
        if (!httpRequest(m_endpoint + "/ner", &text, response, status)) {
            throw util::CapabilityUnavailableError("NER request to " + m_endpoint + " failed");
        }
        if (status != 200) {
            throw util::CapabilityUnavailableError("NER service returned HTTP " + std::to_string(status));
        }
        return parseNerResponse(response);
    }

  private:
    void initCurl() {
        static std::once_flag flag;
        std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    void probe() {
        std::string response;
        long status = 0;
        if (!httpRequest(m_endpoint + "/health", nullptr, response, status) || status != 200) {
            util::logger::warn("HttpNerCapability: NER service at " + m_endpoint
                               + " unavailable (HTTP " + std::to_string(status)
                               + "), falling back to rule-only detection");
            return;
        }
        m_available = true;
        m_model = parseModelName(response);
        util::logger::info("HttpNerCapability: NER service at " + m_endpoint + " ready, model "
                           + m_model);
    }

    static std::string trimSlash(const std::string& endpoint) {
        std::string out = endpoint;
        while (!out.empty() && out.back() == '/') {
            out.pop_back();
        }
        return out;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        if (!userdata)
            return 0;
        std::string* resp = reinterpret_cast<std::string*>(userdata);
        size_t total = size * nmemb;
        resp->append(ptr, total);
        return total;
    }

    // GET when text is null, otherwise POST {"text": ...}.
    bool httpRequest(const std::string& url, const std::string* text, std::string& responseOut,
                     long& statusOut) const {
        CURL* curl = curl_easy_init();
        if (!curl)
            return false;

        std::string body;
        struct curl_slist* headers = nullptr;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        if (text) {
            body = buildNerRequest(*text);
            headers = curl_slist_append(headers, "Content-Type: application/json");
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        }
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_timeoutMs));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusOut);
        } else {
            util::logger::debug(std::string("HttpNerCapability: ") + curl_easy_strerror(res));
        }
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        return res == CURLE_OK;
    }

    std::string m_endpoint;
    uint64_t m_timeoutMs;
    bool m_available;
    std::string m_model;
};

/**
 * @brief Process-wide NER capability for @p endpoint, initialized on first use
 *        and shared read-only afterwards. An empty endpoint yields the
 *        unavailable variant.
 */
inline std::shared_ptr<const detection::NerCapability> sharedNerCapability(const std::string& endpoint,
                                                                          uint64_t timeoutMs) {
    if (endpoint.empty()) {
        return detection::unavailableNer();
    }
    static std::mutex mutex;
    static std::map<std::string, std::shared_ptr<const detection::NerCapability>> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(endpoint);
    if (it != cache.end()) {
        return it->second;
    }
    auto capability = std::make_shared<const HttpNerCapability>(endpoint, timeoutMs);
    cache.emplace(endpoint, capability);
    return capability;
}

} // namespace connectors
} // namespace phiscrub

#endif // PHISCRUB_CONNECTORS_HTTP_NER_CAPABILITY_HPP
