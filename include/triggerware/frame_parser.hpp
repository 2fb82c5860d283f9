#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace triggerware {

/// Splits a stream of whitespace-separated, concatenated JSON values.
///
/// Bytes are appended as they arrive from the socket; next() hands back one
/// complete value at a time. A value split across reads stays buffered until
/// its last byte shows up; several values in one read come out one per call.
///
/// Not thread-safe: owned by the single reader.
class FrameParser {
public:
    /// Append raw bytes read from the stream.
    void feed(std::string_view bytes);
    void feed(const char* data, size_t size) { feed(std::string_view(data, size)); }

    /// Decode the next complete value.
    /// Returns std::nullopt when the buffer holds no complete value yet; the
    /// partial bytes are kept for the next attempt.
    /// Throws TwParseError when a complete value is malformed. The offending
    /// bytes are consumed first, so the following call resumes after them.
    [[nodiscard]] std::optional<nlohmann::json> next();

    /// Bytes buffered but not yet consumed (leading whitespace included).
    [[nodiscard]] size_t buffered() const { return buffer_.size() - pos_; }

    void clear();

    /// Locate one JSON value in `buf` starting at the first non-whitespace
    /// byte at or after `begin`. On success sets `begin` to that byte and
    /// returns the offset one past the value's last byte. Returns
    /// std::nullopt if the value is incomplete (or `buf` is all whitespace).
    [[nodiscard]] static std::optional<size_t> scan(std::string_view buf, size_t& begin);

private:
    void compact();

    std::string buffer_;
    size_t pos_{0};
};

} // namespace triggerware
