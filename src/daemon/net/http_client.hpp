#pragma once

#include "pipeline/stage.hpp"

#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
};

struct FormPart {
    std::string name;
    std::string data;
    std::string filename;     // empty for plain fields
    std::string content_type; // empty for plain fields
};

// Blocking libcurl calls that honour a StageContext: the transfer is bounded
// by ctx.timeout and aborted as soon as ctx.stop is requested.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    StageResult<HttpResponse> get(const std::string& url, const StageContext& ctx) const;
    StageResult<HttpResponse> post_json(const std::string& url, const std::string& body,
                                        const StageContext& ctx) const;
    StageResult<HttpResponse> post_form(const std::string& url, const std::vector<FormPart>& parts,
                                        const StageContext& ctx) const;
};
