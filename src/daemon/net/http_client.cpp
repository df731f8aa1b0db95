#include "net/http_client.hpp"

#include <curl/curl.h>
#include <memory>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<const std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct MimeDeleter {
    void operator()(curl_mime* m) const { curl_mime_free(m); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

StageResult<HttpResponse> perform(CURL* curl, const std::string& url, const StageContext& ctx) {
    if (ctx.stop.stop_requested()) {
        return std::unexpected(StageError::cancelled());
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    if (ctx.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(ctx.timeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx.stop);

    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(StageError::cancelled());
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(StageError::timeout(
            "no response from " + url + " within " + std::to_string(ctx.timeout.count()) + " ms"));
    }
    if (res != CURLE_OK) {
        return std::unexpected(StageError::failure(std::string("curl error: ") + curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status >= 400) {
        return std::unexpected(StageError::failure(
            "HTTP " + std::to_string(response.status) + " from " + url));
    }
    return response;
}

} // namespace

HttpClient::HttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

StageResult<HttpResponse> HttpClient::get(const std::string& url, const StageContext& ctx) const {
    CurlPtr curl(curl_easy_init());
    if (!curl) return std::unexpected(StageError::failure("curl_easy_init failed"));

    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    return perform(curl.get(), url, ctx);
}

StageResult<HttpResponse> HttpClient::post_json(const std::string& url, const std::string& body,
                                                const StageContext& ctx) const {
    CurlPtr curl(curl_easy_init());
    if (!curl) return std::unexpected(StageError::failure("curl_easy_init failed"));

    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    return perform(curl.get(), url, ctx);
}

StageResult<HttpResponse> HttpClient::post_form(const std::string& url, const std::vector<FormPart>& parts,
                                                const StageContext& ctx) const {
    CurlPtr curl(curl_easy_init());
    if (!curl) return std::unexpected(StageError::failure("curl_easy_init failed"));

    std::unique_ptr<curl_mime, MimeDeleter> mime(curl_mime_init(curl.get()));
    for (auto& p : parts) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, p.name.c_str());
        curl_mime_data(part, p.data.data(), p.data.size());
        if (!p.filename.empty()) curl_mime_filename(part, p.filename.c_str());
        if (!p.content_type.empty()) curl_mime_type(part, p.content_type.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    return perform(curl.get(), url, ctx);
}
