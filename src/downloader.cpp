#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <cctype>
#include <fstream>
#include <memory>

namespace {

size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::ostream* out = static_cast<std::ostream*>(stream);
    size_t bytes = size * nmemb;
    out->write(static_cast<char*>(ptr), bytes);
    return out->good() ? bytes : 0;
}

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    out->append(static_cast<char*>(ptr), bytes);
    return bytes;
}

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle make_handle(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw BorealisException(string_format("error.download_failed", url));
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "borealis");
    return curl;
}

void perform(CURL* curl, const std::string& url) {
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw BorealisException(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
}

}

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

void download_file(const std::string& url, const fs::path& output_path) {
    CurlHandle curl = make_handle(url);

    std::ofstream ofile(output_path, std::ios::binary);
    if (!ofile) {
        throw BorealisException(string_format("error.create_file_failed", output_path.string()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofile);
    perform(curl.get(), url);
}

void download_with_retries(const std::string& url, const fs::path& output_path, int max_retries) {
    for (int i = 0; i < max_retries; ++i) {
        try {
            download_file(url, output_path);
            return;
        } catch (const BorealisException& e) {
            std::error_code ec;
            fs::remove(output_path, ec);
            if (i < max_retries - 1) {
                log_warning(string_format("warning.retrying", std::string(e.what())));
            } else {
                throw;
            }
        }
    }
}

std::string CurlHttpClient::fetch(const std::string& url) {
    CurlHandle curl = make_handle(url);
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    perform(curl.get(), url);
    return body;
}

void CurlHttpClient::download(const std::string& url, const fs::path& output_path) {
    download_with_retries(url, output_path, max_retries_);
}

std::string url_encode(std::string_view value) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

std::string join_url(std::string_view base, std::string_view path) {
    if (path.starts_with("http://") || path.starts_with("https://")) {
        return std::string(path);
    }
    std::string out(base);
    while (!out.empty() && out.back() == '/') out.pop_back();
    while (path.starts_with("/")) path.remove_prefix(1);
    return out + "/" + std::string(path);
}
