/*
 * dircat C++ - Pinned HTTPS Client Implementation
 */
#include <dircat/net/http_client.hpp>
#include <dircat/security/input_validator.hpp>
#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>

#include <curl/curl.h>

namespace dircat {

namespace {

struct WriteContext {
    std::string* body;
    size_t limit;
    bool overflow;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    WriteContext* ctx = static_cast<WriteContext*>(userdata);
    size_t n = size * nmemb;
    if (ctx->body->size() + n > ctx->limit) {
        ctx->overflow = true;
        return 0;   // aborts the transfer with CURLE_WRITE_ERROR
    }
    ctx->body->append(ptr, n);
    return n;
}

} // namespace

// ============================================================================
// PinnedAddress
// ============================================================================

std::string PinnedAddress::resolve_entry() const {
    std::string addr = address.to_string();
    if (!address.is_v4()) {
        addr = "[" + addr + "]";
    }
    return host + ":" + std::to_string(port) + ":" + addr;
}

bool make_pinned_address(const std::string& url, const IpAddress& address, PinnedAddress& out) {
    ParsedUrl parsed;
    std::string error;
    if (!parse_url(url, parsed, error)) {
        LOG_DEBUG("[HTTP] Cannot pin '%s': %s", escape_for_log(url).c_str(), error.c_str());
        return false;
    }
    out.host = parsed.bare_host();
    out.port = parsed.effective_port();
    out.address = address;
    return out.port > 0;
}

Json HttpResponse::json() const {
    return Json::parse(body, nullptr, false);
}

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient()
    : timeout_seconds_(30)
    , max_body_bytes_(16 * 1024 * 1024)
    , user_agent_("dircat-guard/1.0")
    , pinned_(false)
{}

void HttpClient::pin(const PinnedAddress& pinned) {
    pin_ = pinned;
    pinned_ = true;
    LOG_DEBUG("[HTTP] Pinned %s", pin_.resolve_entry().c_str());
}

bool HttpClient::preflight(const std::string& url, std::string& error) const {
    ParsedUrl parsed;
    std::string parse_error;
    if (!parse_url(url, parsed, parse_error)) {
        error = "invalid URL (" + parse_error + ")";
        return false;
    }
    if (parsed.scheme != "https") {
        error = "only https URLs are allowed";
        return false;
    }
    if (pinned_ && (to_lower(parsed.bare_host()) != to_lower(pin_.host) ||
                    parsed.effective_port() != pin_.port)) {
        error = "URL does not match the pinned host";
        return false;
    }
    return true;
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& headers) {
    return perform("GET", url, "", headers);
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& body,
                                   const std::map<std::string, std::string>& headers) {
    std::map<std::string, std::string> all = headers;
    if (all.find("Content-Type") == all.end()) {
        all["Content-Type"] = "application/json";
    }
    return perform("POST", url, body, all);
}

HttpResponse HttpClient::perform(const std::string& method, const std::string& url,
                                 const std::string& body,
                                 const std::map<std::string, std::string>& headers) {
    HttpResponse response;
    if (!preflight(url, response.error)) {
        LOG_WARN("[HTTP] Refusing %s %s: %s", method.c_str(),
                 escape_for_log(url).c_str(), response.error.c_str());
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    for (std::map<std::string, std::string>::const_iterator it = headers.begin();
         it != headers.end(); ++it) {
        std::string line = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    struct curl_slist* resolve_list = nullptr;
    if (pinned_) {
        resolve_list = curl_slist_append(resolve_list, pin_.resolve_entry().c_str());
        curl_easy_setopt(curl, CURLOPT_RESOLVE, resolve_list);
    }

    WriteContext ctx;
    ctx.body = &response.body;
    ctx.limit = max_body_bytes_;
    ctx.overflow = false;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "https");
#else
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTPS));
#endif
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    LOG_DEBUG("[HTTP] %s %s%s", method.c_str(), url.c_str(), pinned_ ? " (pinned)" : "");

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else if (ctx.overflow) {
        response.error = "response exceeds " + std::to_string(max_body_bytes_) + " bytes";
        response.body.clear();
    } else {
        response.error = curl_easy_strerror(rc);
    }

    curl_slist_free_all(header_list);
    curl_slist_free_all(resolve_list);
    curl_easy_cleanup(curl);

    if (!response.error.empty()) {
        LOG_WARN("[HTTP] %s %s failed: %s", method.c_str(),
                 escape_for_log(url).c_str(), response.error.c_str());
    }
    return response;
}

} // namespace dircat
