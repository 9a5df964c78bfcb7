#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace bob::net {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status = 0;
    std::string body;

    [[nodiscard]] bool ok() const { return status / 100 == 2; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Transport failures throw NetworkError; HTTP error statuses are returned.
    virtual HttpResponse get(const std::string& url, const Headers& headers = {}) = 0;

    // Streams a 2xx body into dest. On any other status dest is removed and the
    // returned body holds the error payload.
    virtual HttpResponse download(const std::string& url, const std::filesystem::path& dest,
                                  const Headers& headers = {}) = 0;
};

}
