#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcpguard {

/// Incremental framer for newline-delimited messages.
///
/// Bytes are appended as they arrive; extract_lines() hands back every
/// complete line and keeps the unterminated tail for the next append.
/// There is no line-length cap. One instance per stream direction.
class LineFramer {
public:
    void append(std::string_view bytes);
    void append(const char* data, size_t size) { append(std::string_view(data, size)); }

    /// Complete lines with the delimiter and a trailing '\r' removed.
    /// Empty lines and lines that are not valid UTF-8 are dropped.
    [[nodiscard]] std::vector<std::string> extract_lines();

    /// True while an unterminated fragment is buffered.
    [[nodiscard]] bool has_partial_data() const { return !buffer_.empty(); }

    [[nodiscard]] size_t buffered_size() const { return buffer_.size(); }

    /// Number of frames dropped for invalid UTF-8 since construction.
    [[nodiscard]] size_t dropped_frames() const { return dropped_; }

    void clear() { buffer_.clear(); }

private:
    std::string buffer_;
    size_t dropped_{0};
};

} // namespace mcpguard
