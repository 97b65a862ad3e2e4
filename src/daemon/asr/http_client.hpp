#pragma once

#include <expected>
#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
    double elapsed_s = 0.0;
};

struct FormField {
    std::string name;
    std::string data;
    std::string filename;      // set for file parts
    std::string content_type;  // set for file parts
};

// Thin libcurl wrapper. One easy handle per request, so a single client
// can be shared by concurrent callers.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpResponse, std::string>
        post_form(const std::string& url, const std::vector<FormField>& fields,
                  const std::vector<std::string>& headers, long timeout_s) const;

    std::expected<HttpResponse, std::string>
        post_json(const std::string& url, const std::string& body,
                  const std::vector<std::string>& headers, long timeout_s) const;
};
