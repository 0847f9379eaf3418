#include "omotes/helpers.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>
#include <cmath>
#include <cstdint>
#include <random>
#include <sstream>

namespace omotes {
namespace helpers {

namespace {

using google::protobuf::util::TimeUtil;

InvalidTimestampError invalid_iso(const std::string& text) {
    return InvalidTimestampError("Invalid isoformat string: '" + text + "'");
}

// Rewrites "YYYY-MM-DD", "YYYY-MM-DD HH:MM" and offset-less timestamps into
// the RFC 3339 form accepted by TimeUtil. Naive timestamps become UTC.
bool to_rfc3339(const std::string& text, std::string& out) {
    if (text.size() < 10) return false;
    out = text.substr(0, 10);
    if (text.size() == 10) {
        out += "T00:00:00Z";
        return true;
    }
    if (text[10] != 'T' && text[10] != ' ') return false;

    std::string time = text.substr(11);
    if (time.size() >= 5 && (time.size() == 5 || time[5] != ':')) {
        time.insert(5, ":00");
    }
    if (time.size() < 8 || time[2] != ':' || time[5] != ':') return false;

    out += 'T';
    out += time;
    if (time.back() != 'Z' && time.find_first_of("+-", 8) == std::string::npos) {
        out += 'Z';
    }
    return true;
}

google::protobuf::Timestamp to_pb_timestamp(DateTime value) {
    const int64_t micros = value.time_since_epoch().count();
    auto timestamp = TimeUtil::MicrosecondsToTimestamp(micros);
    if (timestamp.seconds() < TimeUtil::kTimestampMinSeconds ||
        timestamp.seconds() > TimeUtil::kTimestampMaxSeconds) {
        throw InvalidTimestampError("Datetime out of range: " + std::to_string(micros) +
                                    " microseconds since epoch");
    }
    return timestamp;
}

} // namespace

std::string generate_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char hex[] = "0123456789abcdef";

    uint8_t bytes[16];
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(rng());
    }
    // RFC 4122 variant + version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::string uuid;
    uuid.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) uuid.push_back('-');
        uuid.push_back(hex[bytes[i] >> 4]);
        uuid.push_back(hex[bytes[i] & 0x0F]);
    }
    return uuid;
}

DateTime parse_iso8601(const std::string& text) {
    std::string rfc3339;
    google::protobuf::Timestamp timestamp;
    if (!to_rfc3339(text, rfc3339) || !TimeUtil::FromString(rfc3339, &timestamp)) {
        throw invalid_iso(text);
    }
    return DateTime(std::chrono::microseconds(TimeUtil::TimestampToMicroseconds(timestamp)));
}

std::string format_iso8601(DateTime value) {
    std::string text = TimeUtil::ToString(to_pb_timestamp(value));
    // Drop the trailing "Z" and widen millisecond fractions to microseconds.
    text.pop_back();
    auto dot = text.find('.');
    if (dot != std::string::npos) {
        text.append(6 - (text.size() - dot - 1), '0');
    }
    return text;
}

double to_timestamp(DateTime value) {
    return static_cast<double>(value.time_since_epoch().count()) / 1e6;
}

DateTime from_timestamp(double seconds) {
    if (!std::isfinite(seconds) ||
        seconds < static_cast<double>(TimeUtil::kTimestampMinSeconds) ||
        seconds >= static_cast<double>(TimeUtil::kTimestampMaxSeconds + 1)) {
        std::ostringstream out;
        out << "Timestamp out of range: " << seconds;
        throw InvalidTimestampError(out.str());
    }
    return DateTime(std::chrono::microseconds(std::llround(seconds * 1e6)));
}

} // namespace helpers
} // namespace omotes
