#include "net/http_client.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>

namespace vfsup {

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};

bool EnsureCurlGlobalInit() {
    static std::once_flag init_flag;
    static bool init_ok = false;
    std::call_once(init_flag, []() { init_ok = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK); });
    return init_ok;
}

size_t WriteToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t WriteToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<std::FILE*>(userdata));
}

void ApplyCommonOptions(CURL* c, const std::string& url, const CurlHttpClient::Options& opt) {
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(c, CURLOPT_USERAGENT, opt.user_agent.c_str());
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, opt.connect_timeout_ms);
    if (opt.low_speed_time_s > 0) {
        curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, opt.low_speed_time_s);
    }
}

std::string DescribeFailure(CURLcode rc, const char* errbuf) {
    if (errbuf && errbuf[0] != '\0') return errbuf;
    return curl_easy_strerror(rc);
}

} // namespace

CurlHttpClient::CurlHttpClient() = default;

CurlHttpClient::CurlHttpClient(Options opt) : opt_(std::move(opt)) {}

std::expected<std::string, std::string> CurlHttpClient::Get(const std::string& url) {
    if (!EnsureCurlGlobalInit()) return std::unexpected("curl_global_init failed");

    std::unique_ptr<CURL, CurlDeleter> c(curl_easy_init());
    if (!c) return std::unexpected("curl_easy_init failed");

    std::string body;
    char errbuf[CURL_ERROR_SIZE] = {};
    ApplyCommonOptions(c.get(), url, opt_);
    curl_easy_setopt(c.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, WriteToString);
    curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, &body);

    const CURLcode rc = curl_easy_perform(c.get());
    if (rc != CURLE_OK) {
        return std::unexpected("GET " + url + " failed: " + DescribeFailure(rc, errbuf));
    }
    LogDebug("GET %s: %zu bytes", url.c_str(), body.size());
    return body;
}

Result CurlHttpClient::DownloadToFile(const std::string& url, const std::string& path) {
    if (!EnsureCurlGlobalInit()) return Result::Fail("curl_global_init failed");

    std::unique_ptr<CURL, CurlDeleter> c(curl_easy_init());
    if (!c) return Result::Fail("curl_easy_init failed");

    CURLcode rc;
    char errbuf[CURL_ERROR_SIZE] = {};
    {
        std::unique_ptr<std::FILE, FileCloser> f(std::fopen(path.c_str(), "wb"));
        if (!f) return Result::Fail(errno, "cannot create " + path);

        ApplyCommonOptions(c.get(), url, opt_);
        curl_easy_setopt(c.get(), CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, WriteToFile);
        curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, f.get());

        rc = curl_easy_perform(c.get());
        if (rc == CURLE_OK && std::fflush(f.get()) != 0) {
            rc = CURLE_WRITE_ERROR;
        }
    }

    if (rc != CURLE_OK) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return Result::Fail(static_cast<int>(rc),
                            "download of " + url + " failed: " + DescribeFailure(rc, errbuf));
    }

    LogInfo("Downloaded %s -> %s", url.c_str(), path.c_str());
    return Result::Ok();
}

} // namespace vfsup
