#include "mcpguard/line_framer.hpp"
#include <simdjson.h>

namespace mcpguard {

void LineFramer::append(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

std::vector<std::string> LineFramer::extract_lines() {
    std::vector<std::string> lines;

    size_t pos = 0;
    while (true) {
        size_t nl = buffer_.find('\n', pos);
        if (nl == std::string::npos) break;

        size_t end = nl;
        if (end > pos && buffer_[end - 1] == '\r') --end;
        std::string_view line(buffer_.data() + pos, end - pos);
        pos = nl + 1;

        if (line.empty()) continue;
        if (!simdjson::validate_utf8(line.data(), line.size())) {
            ++dropped_;
            continue;
        }
        lines.emplace_back(line);
    }

    if (pos > 0) {
        buffer_.erase(0, pos);
    }
    return lines;
}

} // namespace mcpguard
