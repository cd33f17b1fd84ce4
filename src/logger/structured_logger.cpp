// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "serializer/json_value.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration - seconds);

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                       tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, millis.count());
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// snippet 필드 두 개 ("snippet", "snippet_truncated")
std::string snippet_fields(std::string_view snippet) {
    const auto shown = StructuredLogger::truncate_snippet(snippet);
    return fmt::format(R"("snippet":"{}","snippet_truncated":{})",
                       json_escape(shown), shown.size() < snippet.size() ? "true" : "false");
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        constexpr std::size_t max_file_size = std::size_t{100} * 1024 * 1024;
        constexpr std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>("ocigate_events", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 타임스탬프만 (이벤트 본문은 각 메서드에서 JSON 으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_query
// ---------------------------------------------------------------------------
void StructuredLogger::log_query(const QueryLog& entry) {
    const LogLevel level = entry.ok ? LogLevel::kInfo : LogLevel::kWarn;
    if (!logger_ || min_level_ > level) {
        return;
    }

    const std::string json = fmt::format(
        R"({{"event":"query_executed","request_id":{},"ok":{},"error_kind":"{}","message":"{}",)"
        R"("whitelist_version":"{}",{},"result_bytes":{},"duration_ms":{},"timestamp":"{}"}})",
        entry.request_id,
        entry.ok ? "true" : "false",
        json_escape(entry.error_kind),
        json_escape(entry.message),
        json_escape(entry.whitelist_version),
        snippet_fields(entry.snippet),
        entry.result_bytes,
        entry.duration.count(),
        format_iso8601(entry.timestamp));

    if (entry.ok) {
        logger_->info(json);
    } else {
        logger_->warn(json);
    }
}

// ---------------------------------------------------------------------------
// log_deny
// ---------------------------------------------------------------------------
void StructuredLogger::log_deny(const DenyLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kWarn) {
        return;
    }

    std::string violations = "[";
    for (std::size_t i = 0; i < entry.violations.size(); ++i) {
        if (i > 0) {
            violations += ',';
        }
        violations += '"';
        violations += json_escape(entry.violations[i]);
        violations += '"';
    }
    violations += ']';

    logger_->warn(fmt::format(
        R"({{"event":"query_denied","request_id":{},"whitelist_version":"{}",{},)"
        R"("violations":{},"timestamp":"{}"}})",
        entry.request_id,
        json_escape(entry.whitelist_version),
        snippet_fields(entry.snippet),
        violations,
        format_iso8601(entry.timestamp)));
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// static
std::string_view StructuredLogger::truncate_snippet(std::string_view snippet,
                                                    std::size_t      max_bytes) noexcept {
    if (snippet.size() <= max_bytes) {
        return snippet;
    }
    std::size_t cut = max_bytes;
    // continuation byte (10xxxxxx) 에서 자르지 않는다
    while (cut > 0 && (static_cast<unsigned char>(snippet[cut]) & 0xC0U) == 0x80U) {
        --cut;
    }
    return snippet.substr(0, cut);
}

LogLevel parse_log_level(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "debug") { return LogLevel::kDebug; }
    if (lower == "warn" || lower == "warning") { return LogLevel::kWarn; }
    if (lower == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}
