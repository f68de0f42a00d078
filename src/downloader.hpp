#pragma once

#include <filesystem>
#include <string>
#include <string_view>

// HTTP access used by the AUR backend. Both calls throw BorealisException on
// transport errors and on HTTP error statuses.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual std::string fetch(const std::string& url) = 0;
    virtual void download(const std::string& url, const std::filesystem::path& output_path) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(int max_retries = 3) : max_retries_(max_retries) {}

    std::string fetch(const std::string& url) override;
    void download(const std::string& url, const std::filesystem::path& output_path) override;

private:
    int max_retries_;
};

// Keeps curl_global_init/cleanup paired for the lifetime of the program.
class CurlGlobalInitializer {
public:
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

void download_file(const std::string& url, const std::filesystem::path& output_path);
void download_with_retries(const std::string& url, const std::filesystem::path& output_path, int max_retries = 3);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(std::string_view value);
// Resolves `path` against `base`, with exactly one '/' between them.
std::string join_url(std::string_view base, std::string_view path);
