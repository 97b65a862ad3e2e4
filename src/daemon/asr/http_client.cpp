#include "asr/http_client.hpp"

#include <chrono>
#include <curl/curl.h>
#include <format>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Runs a prepared easy handle and collects the response. Takes ownership
// of nothing; the caller frees mime/headers/handle.
std::expected<HttpResponse, std::string> perform(CURL* curl, const std::string& url,
                                                 curl_slist* headers, long timeout_s) {
    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    // Worker threads must not receive SIGALRM from the resolver.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl);
    auto end = std::chrono::steady_clock::now();
    response.elapsed_s = std::chrono::duration<double>(end - start).count();

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(std::format("request timed out after {}s", timeout_s));
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

curl_slist* build_headers(const std::vector<std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        list = curl_slist_append(list, h.c_str());
    }
    return list;
}

} // namespace

HttpClient::HttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

std::expected<HttpResponse, std::string>
HttpClient::post_form(const std::string& url, const std::vector<FormField>& fields,
                      const std::vector<std::string>& headers, long timeout_s) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, field.name.c_str());
        curl_mime_data(part, field.data.data(), field.data.size());
        if (!field.filename.empty()) {
            curl_mime_filename(part, field.filename.c_str());
        }
        if (!field.content_type.empty()) {
            curl_mime_type(part, field.content_type.c_str());
        }
    }
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    curl_slist* header_list = build_headers(headers);
    auto result = perform(curl, url, header_list, timeout_s);

    curl_slist_free_all(header_list);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);
    return result;
}

std::expected<HttpResponse, std::string>
HttpClient::post_json(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers, long timeout_s) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    auto all_headers = headers;
    all_headers.push_back("Content-Type: application/json");
    curl_slist* header_list = build_headers(all_headers);
    auto result = perform(curl, url, header_list, timeout_s);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return result;
}
