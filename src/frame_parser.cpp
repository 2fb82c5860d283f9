#include "triggerware/frame_parser.hpp"
#include "triggerware/codec.hpp"
#include "triggerware/error.hpp"

namespace triggerware {

namespace {

constexpr size_t kCompactThreshold = 64 * 1024;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool ends_scalar(char c) {
    return is_space(c) || c == '{' || c == '}' || c == '[' || c == ']'
           || c == ',' || c == ':' || c == '"';
}

} // anonymous namespace

std::optional<size_t> FrameParser::scan(std::string_view buf, size_t& begin) {
    while (begin < buf.size() && is_space(buf[begin])) ++begin;
    if (begin >= buf.size()) return std::nullopt;

    const char first = buf[begin];

    if (first == '{' || first == '[') {
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        for (size_t i = begin; i < buf.size(); ++i) {
            char c = buf[i];
            if (in_string) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }
            switch (c) {
                case '"':
                    in_string = true;
                    break;
                case '{':
                case '[':
                    ++depth;
                    break;
                case '}':
                case ']':
                    if (--depth == 0) return i + 1;
                    break;
                default:
                    break;
            }
        }
        return std::nullopt;
    }

    if (first == '"') {
        bool escaped = false;
        for (size_t i = begin + 1; i < buf.size(); ++i) {
            char c = buf[i];
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                return i + 1;
            }
        }
        return std::nullopt;
    }

    // A stray closer or separator is a one-byte malformed value.
    if (first == '}' || first == ']' || first == ',' || first == ':') {
        return begin + 1;
    }

    // Bare literal or number: it ends at the first delimiter. Running into the
    // end of the buffer means more digits may still arrive.
    for (size_t i = begin + 1; i < buf.size(); ++i) {
        if (ends_scalar(buf[i])) return i;
    }
    return std::nullopt;
}

void FrameParser::feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

std::optional<nlohmann::json> FrameParser::next() {
    size_t begin = pos_;
    auto end = scan(std::string_view(buffer_), begin);
    if (!end) {
        pos_ = begin;
        compact();
        return std::nullopt;
    }

    pos_ = *end;
    std::string_view frame(buffer_.data() + begin, *end - begin);
    try {
        nlohmann::json value = Codec::decode(frame);
        compact();
        return value;
    } catch (const TwParseError&) {
        compact();
        throw;
    }
}

void FrameParser::clear() {
    buffer_.clear();
    pos_ = 0;
}

void FrameParser::compact() {
    if (pos_ == buffer_.size()) {
        buffer_.clear();
        pos_ = 0;
    } else if (pos_ >= kCompactThreshold) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
}

} // namespace triggerware
