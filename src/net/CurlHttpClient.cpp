#include "net/CurlHttpClient.hpp"
#include "util/curlWrappers.hpp"
#include "util/files.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace bob::net {

using namespace util;

namespace {

void applyHeaders(CURL* h, SList& list, const Headers& headers) {
    for (const auto& [k, v] : headers) list.add(k + ": " + v);
    if (list.get()) curl_easy_setopt(h, CURLOPT_HTTPHEADER, list.get());
}

}

CurlHttpClient::CurlHttpClient() {
    if (const auto rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK)
        throw std::runtime_error(fmt::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
}

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string& url, const Headers& headers) {
    log::Registry::net()->debug("[CurlHttpClient] GET {}", url);

    SList list;
    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        applyHeaders(h, list, headers);
    });

    if (res.curl != CURLE_OK)
        throw NetworkError(fmt::format("Request to {} failed: {}", url, curl_easy_strerror(res.curl)));

    log::Registry::net()->debug("[CurlHttpClient] {} -> HTTP {}", url, res.http);
    return {res.http, res.body};
}

HttpResponse CurlHttpClient::download(const std::string& url, const fs::path& dest, const Headers& headers) {
    log::Registry::net()->debug("[CurlHttpClient] Downloading {} -> {}", url, dest.string());

    if (dest.has_parent_path()) fs::create_directories(dest.parent_path());

    CurlEasy h;
    SList list;
    FileSink file(dest.string());

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, nullptr);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, file.get());
    applyHeaders(h, list, headers);

    const CURLcode rc = curl_easy_perform(h);
    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    const bool closed = file.close();

    if (rc != CURLE_OK) {
        std::error_code ec;
        fs::remove(dest, ec);
        throw NetworkError(fmt::format("Download of {} failed: {}", url, curl_easy_strerror(rc)), status);
    }

    if (!closed) {
        std::error_code ec;
        fs::remove(dest, ec);
        throw std::runtime_error("Failed to flush " + dest.string());
    }

    HttpResponse out{status, {}};
    if (!out.ok()) {
        std::error_code ec;
        if (fs::exists(dest, ec)) out.body = readFileToString(dest);
        fs::remove(dest, ec);
        return out;
    }

    log::Registry::net()->debug("[CurlHttpClient] Downloaded {} ({})", dest.filename().string(),
                                bytesToSize(fs::file_size(dest)));
    return out;
}

}
