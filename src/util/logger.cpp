#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <mutex>

namespace vfsup {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
bool g_console = true;
std::ofstream g_file;
std::string g_file_path;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    const char* backslash = std::strrchr(file, '\\');
    const char* base = slash;
    if (!base || (backslash && backslash > base)) {
        base = backslash;
    }
    return base ? (base + 1) : file;
}

std::string FormatV(const char* fmt, va_list ap) {
    va_list probe;
    va_copy(probe, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, probe);
    va_end(probe);
    if (n <= 0) return {};

    std::string out(static_cast<size_t>(n) + 1, '\0');
    std::vsnprintf(out.data(), out.size(), fmt, ap);
    out.resize(static_cast<size_t>(n));
    return out;
}

} // namespace

bool ParseLogLevel(std::string_view text, LogLevel& out) {
    std::string lower(text);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "debug") out = LogLevel::Debug;
    else if (lower == "info") out = LogLevel::Info;
    else if (lower == "warn" || lower == "warning") out = LogLevel::Warn;
    else if (lower == "error") out = LogLevel::Error;
    else if (lower == "none") out = LogLevel::None;
    else return false;
    return true;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

void Logger::SetConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_console = enabled;
}

Result Logger::OpenLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) g_file.close();
    g_file.clear();
    g_file.open(path, std::ios::out | std::ios::app);
    if (!g_file.good()) {
        g_file_path.clear();
        return Result::Fail(errno, "cannot open log file " + path + ": " + std::strerror(errno));
    }
    g_file_path = path;
    return Result::Ok();
}

void Logger::CloseLogFile() {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) g_file.close();
    g_file_path.clear();
}

std::string Logger::LogFilePath() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_file_path;
}

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    if (lvl < Level()) return;
    Write(lvl, file, line, FormatV(fmt, ap), nullptr);
}

void Logger::LogEvent(LogLevel lvl, std::string_view message, const EventMetadata& metadata) {
    if (lvl < Level()) return;
    Write(lvl, nullptr, 0, std::string(message), &metadata);
}

void Logger::Write(LogLevel lvl,
                   const char* file,
                   int line,
                   const std::string& message,
                   const EventMetadata* metadata) {
    std::lock_guard<std::mutex> lk(g_mu);

    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    const char* base = BaseName(file);

    if (g_console) {
        // Print to stderr (typical for tools)
        if (ts[0] != '\0') {
            std::fprintf(stderr, "[%s] [%s] ", ts, ToStr(lvl));
        } else {
            std::fprintf(stderr, "[%s] ", ToStr(lvl));
        }
        if (base && line > 0) {
            std::fprintf(stderr, "[%s:%d] ", base, line);
        }
        std::fputs(message.c_str(), stderr);
        if (metadata) {
            for (const auto& [key, value] : *metadata) {
                std::fprintf(stderr, " %s=%s", key.c_str(), value.c_str());
            }
        }
        std::fprintf(stderr, "\n");
    }

    if (!g_file.is_open()) return;

    nlohmann::json record;
    record["time"] = ts;
    record["level"] = ToStr(lvl);
    if (base && line > 0) {
        record["source"] = std::string(base) + ":" + std::to_string(line);
    }
    record["message"] = message;
    if (metadata && !metadata->empty()) {
        nlohmann::json md = nlohmann::json::object();
        for (const auto& [key, value] : *metadata) md[key] = value;
        record["metadata"] = std::move(md);
    }
    // Invalid UTF-8 from external tools must not throw out of the logger.
    g_file << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    g_file.flush();
}

} // namespace vfsup
