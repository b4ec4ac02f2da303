/// @file liveness_probe.cpp
/// @brief HttpLivenessProbe implementation over libcurl.
///
/// One easy handle per check, so concurrent checks from the job scheduler
/// never share transfer state. CURLOPT_TIMEOUT_MS bounds the whole
/// transfer, name resolution included.

#include "pgw/service/liveness_probe.hpp"

#include <array>
#include <mutex>
#include <string>

#include <curl/curl.h>

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

namespace {

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

std::once_flag curlInitFlag;
CURLcode curlInitResult = CURLE_OK;

/// Liveness only needs the status code; drop the body.
size_t discardBody(char* /*data*/, size_t size, size_t count, void* /*userdata*/) {
    return size * count;
}

GatewayError transferError(CURLcode code, const std::string& url, const char* detail) {
    std::string reason = detail[0] != '\0' ? detail : curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return GatewayError(ErrorCode::ProbeTimeout, "Request timeout: " + reason);
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return GatewayError(ErrorCode::InvalidArgument,
                                "unsupported probe URL: " + url + " (" + reason + ")");
        default:
            return GatewayError(ErrorCode::ProbeFailed, reason);
    }
}

}  // anonymous namespace

std::map<std::string, std::string> defaultProbeEndpoints() {
    return {
        {"groq", "https://api.groq.com/openai/v1/models"},
        {"together", "https://api.together.xyz/v1/models"},
        {"openrouter", "https://openrouter.ai/api/v1/models"},
        {"huggingface", "https://huggingface.co/api/models"},
    };
}

// ── Impl ────────────────────────────────────────────────────────────────────

struct HttpLivenessProbe::Impl {
    std::map<std::string, std::string> endpoints;

    explicit Impl(std::map<std::string, std::string> eps) : endpoints(std::move(eps)) {
        // curl_global_init is not thread-safe; run it once per process.
        std::call_once(curlInitFlag, [] { curlInitResult = curl_global_init(CURL_GLOBAL_ALL); });
    }

    GatewayResult<ProbeOutcome> run(const std::string& url, std::chrono::milliseconds timeout) {
        if (curlInitResult != CURLE_OK) {
            return GatewayResult<ProbeOutcome>::err(GatewayError(
                ErrorCode::ProbeFailed,
                std::string("curl init failed: ") + curl_easy_strerror(curlInitResult)));
        }

        CurlPtr curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            return GatewayResult<ProbeOutcome>::err(
                GatewayError(ErrorCode::ProbeFailed, "curl handle allocation failed"));
        }

        std::array<char, CURL_ERROR_SIZE> errorBuffer{};
        auto timeoutMs = static_cast<long>(timeout.count());

        CURLcode rc = curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer.data());
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "http,https");
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs);
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "pgw-health");
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &discardBody);
        if (rc != CURLE_OK) {
            return GatewayResult<ProbeOutcome>::err(transferError(rc, url, errorBuffer.data()));
        }

        rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            return GatewayResult<ProbeOutcome>::err(transferError(rc, url, errorBuffer.data()));
        }

        long status = 0;
        rc = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (rc != CURLE_OK) {
            return GatewayResult<ProbeOutcome>::err(transferError(rc, url, errorBuffer.data()));
        }
        return GatewayResult<ProbeOutcome>::ok(ProbeOutcome{.statusCode = static_cast<int>(status)});
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

HttpLivenessProbe::HttpLivenessProbe(std::map<std::string, std::string> endpoints)
    : impl_(std::make_unique<Impl>(std::move(endpoints))) {}

HttpLivenessProbe::~HttpLivenessProbe() = default;

bool HttpLivenessProbe::knows(std::string_view provider) const {
    return impl_->endpoints.find(std::string(provider)) != impl_->endpoints.end();
}

GatewayResult<ProbeOutcome> HttpLivenessProbe::probe(std::string_view provider,
                                                     std::chrono::milliseconds timeout) {
    auto it = impl_->endpoints.find(std::string(provider));
    if (it == impl_->endpoints.end()) {
        return GatewayResult<ProbeOutcome>::err(GatewayError(
            ErrorCode::UnknownProvider, "Unknown provider: " + std::string(provider)));
    }
    return impl_->run(it->second, timeout);
}

const std::map<std::string, std::string>& HttpLivenessProbe::endpoints() const noexcept {
    return impl_->endpoints;
}

} // namespace pgw::service
