#pragma once

#include "util/result.hpp"

#include <expected>
#include <string>

namespace vfsup {

class IHttpClient {
  public:
    virtual ~IHttpClient() = default;
    virtual std::expected<std::string, std::string> Get(const std::string& url) = 0;
    virtual Result DownloadToFile(const std::string& url, const std::string& path) = 0;
};

// libcurl easy interface; file:// URLs work too.
class CurlHttpClient final : public IHttpClient {
  public:
    struct Options {
        long connect_timeout_ms = 15000;
        long low_speed_time_s = 60;
        std::string user_agent = "vfs-upgrader";
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options opt);

    std::expected<std::string, std::string> Get(const std::string& url) override;
    Result DownloadToFile(const std::string& url, const std::string& path) override;

  private:
    Options opt_{};
};

} // namespace vfsup
