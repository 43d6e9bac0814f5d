/// @file json_log_formatter.cpp
/// @brief JSON line rendering, request correlation ids and string escaping.

#include "rsb/foundation/json_log_formatter.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace rsb::foundation {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

/// Append the low @p digits nibbles of @p value as lowercase hex.
void appendHex(std::string& out, uint64_t value, int digits) {
    for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
        out += kHexDigits[(value >> shift) & 0xF];
    }
}

/// Append @p value zero-padded to @p width decimal digits.
void appendPadded(std::string& out, int value, int width) {
    auto digits = std::to_string(value);
    if (static_cast<int>(digits.size()) < width) {
        out.append(static_cast<std::size_t>(width) - digits.size(), '0');
    }
    out += digits;
}

/// UTC "YYYY-MM-DDTHH:MM:SS.mmmZ" for the current wall-clock time.
std::string utcTimestamp() {
    auto now = WallClock::now();
    auto sinceEpoch = now.time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch) -
              std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);

    std::time_t tt = WallClock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    std::string out;
    out.reserve(24);
    appendPadded(out, utc.tm_year + 1900, 4);
    out += '-';
    appendPadded(out, utc.tm_mon + 1, 2);
    out += '-';
    appendPadded(out, utc.tm_mday, 2);
    out += 'T';
    appendPadded(out, utc.tm_hour, 2);
    out += ':';
    appendPadded(out, utc.tm_min, 2);
    out += ':';
    appendPadded(out, utc.tm_sec, 2);
    out += '.';
    appendPadded(out, static_cast<int>(ms.count()), 3);
    out += 'Z';
    return out;
}

/// Append `,"key":"value"` with @p value escaped.
void appendStringField(std::string& out, std::string_view key, std::string_view value) {
    out += ',';
    appendJsonString(out, key);
    out += ':';
    appendJsonString(out, value);
}

thread_local std::string currentTraceId;

}  // anonymous namespace

// ── Escaping ────────────────────────────────────────────────────────────────

void appendJsonString(std::string& out, std::string_view value) {
    out.reserve(out.size() + value.size() + 2);
    out += '"';
    for (char c : value) {
        auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (byte < 0x20) {
            out += "\\u";
            appendHex(out, byte, 4);
        } else {
            out += c;
        }
    }
    out += '"';
}

// ── Correlation ids ─────────────────────────────────────────────────────────

std::string generateCorrelationId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    std::array<uint64_t, 2> bits{engine(), engine()};
    bits[0] = (bits[0] & ~0xF000ULL) | 0x4000ULL;                 // version 4
    bits[1] = (bits[1] & ~(0x3ULL << 62)) | (0x2ULL << 62);       // RFC 4122 variant

    std::string id;
    id.reserve(36);
    appendHex(id, bits[0] >> 32, 8);
    id += '-';
    appendHex(id, bits[0] >> 16, 4);
    id += '-';
    appendHex(id, bits[0], 4);
    id += '-';
    appendHex(id, bits[1] >> 48, 4);
    id += '-';
    appendHex(id, bits[1], 12);
    return id;
}

CorrelationScope::CorrelationScope(std::string correlationId)
    : previous_(std::exchange(currentTraceId, std::move(correlationId))) {}

CorrelationScope::~CorrelationScope() {
    currentTraceId = std::move(previous_);
}

const std::string& CorrelationScope::current() {
    return currentTraceId;
}

// ── JsonLogFormatter ────────────────────────────────────────────────────────

std::string JsonLogFormatter::format(LogLevel level,
                                     LogCategory category,
                                     std::string_view message,
                                     const LogContext& ctx) {
    std::string out = "{\"timestamp\":";
    out.reserve(256);
    appendJsonString(out, utcTimestamp());
    appendStringField(out, "level", logLevelName(level));
    appendStringField(out, "category", logCategoryName(category));

    std::string_view traceId = currentTraceId;
    if (ctx.traceId && !ctx.traceId->empty()) {
        traceId = *ctx.traceId;
    }
    if (!traceId.empty()) {
        appendStringField(out, "correlation_id", traceId);
    }

    appendStringField(out, "message", message);

    if (ctx.requestId && ctx.requestId->isValid()) {
        out += ",\"request_id\":" + std::to_string(ctx.requestId->value());
    }
    if (ctx.userId && !ctx.userId->empty()) {
        appendStringField(out, "user_id", *ctx.userId);
    }

    if (!ctx.extra.empty()) {
        out += ",\"extra\":{";
        const char* sep = "";
        for (const auto& [key, val] : ctx.extra) {
            out += sep;
            appendJsonString(out, key);
            out += ':';
            appendJsonString(out, val);
            sep = ",";
        }
        out += '}';
    }

    out += '}';
    return out;
}

}  // namespace rsb::foundation
