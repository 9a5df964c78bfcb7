#pragma once

#include "net/HttpClient.hpp"

namespace bob::net {

class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    HttpResponse get(const std::string& url, const Headers& headers = {}) override;
    HttpResponse download(const std::string& url, const std::filesystem::path& dest,
                          const Headers& headers = {}) override;
};

}
