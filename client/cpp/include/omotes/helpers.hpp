#pragma once

#include <chrono>
#include <string>
#include "errors.hpp"

namespace omotes {

/**
 * Runtime representation of a datetime workflow parameter.
 *
 * Microsecond ticks keep the whole 0001-9999 calendar range representable.
 */
using DateTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/**
 * Helper functions shared by the SDK, orchestrator and worker sides.
 */
namespace helpers {

/**
 * Generate a random RFC 4122 version 4 UUID in canonical text form.
 */
std::string generate_uuid();

/**
 * Parse an ISO 8601 date or datetime.
 *
 * Accepts "YYYY-MM-DD" and "YYYY-MM-DD[T ]HH:MM[:SS[.ffffff]]" with an
 * optional "Z" or "+HH:MM"/"-HH:MM" offset. Timestamps without an offset
 * are taken as UTC.
 *
 * @throws InvalidTimestampError if the text is not in ISO format or lies
 *         outside years 0001-9999
 */
DateTime parse_iso8601(const std::string& text);

/**
 * Format as "YYYY-MM-DDTHH:MM:SS" in UTC, with a ".ffffff" suffix only
 * when the time point has a sub-second part.
 *
 * @throws InvalidTimestampError if the value lies outside years 0001-9999
 */
std::string format_iso8601(DateTime value);

/**
 * Seconds since the Unix epoch, with microsecond resolution.
 */
double to_timestamp(DateTime value);

/**
 * @throws InvalidTimestampError if seconds is not finite or lies outside
 *         years 0001-9999
 */
DateTime from_timestamp(double seconds);

/**
 * Parse a protobuf message received from the message bus.
 *
 * @throws MessageDecodeError if the bytes are not a valid T
 */
template<typename T>
T decode_message(const std::string& bytes) {
    T message;
    if (!message.ParseFromString(bytes)) {
        const std::string& type_name = T::descriptor()->full_name();
        throw MessageDecodeError("Could not decode message of type " + type_name +
                                 " (" + std::to_string(bytes.size()) + " bytes)",
                                 type_name);
    }
    return message;
}

} // namespace helpers
} // namespace omotes
