#include "raven_parser.hpp"
#include "logger.hpp"
#include <cctype>

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':';
}

// Reads the children of a fragment body. Nested elements deeper than one
// level are kept as raw text.
std::map<std::string, std::string> parse_children(const std::string& body) {
    std::map<std::string, std::string> fields;
    size_t pos = 0;

    while ((pos = body.find('<', pos)) != std::string::npos) {
        size_t name_end = pos + 1;
        while (name_end < body.size() && is_name_char(body[name_end])) name_end++;
        if (name_end == pos + 1) {
            pos++;
            continue;
        }
        std::string name = body.substr(pos + 1, name_end - pos - 1);

        size_t tag_close = body.find('>', name_end);
        if (tag_close == std::string::npos) break;

        if (body[tag_close - 1] == '/') {
            fields[name] = "";
            pos = tag_close + 1;
            continue;
        }

        std::string closing = "</" + name + ">";
        size_t end = body.find(closing, tag_close + 1);
        if (end == std::string::npos) break;

        fields[name] = trim(body.substr(tag_close + 1, end - tag_close - 1));
        pos = end + closing.size();
    }
    return fields;
}

}

std::optional<std::string> RavenFragment::text(const std::string& field) const {
    auto it = fields.find(field);
    if (it == fields.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> RavenFragment::hex(const std::string& field) const {
    auto value = text(field);
    if (!value || value->empty()) return std::nullopt;

    try {
        size_t consumed = 0;
        uint64_t parsed = std::stoull(*value, &consumed, 16);
        if (consumed != value->size()) return std::nullopt;
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void RavenParser::feed(const std::string& data) {
    buffer += data;
    if (buffer.size() > kMaxBuffered) {
        Logger::warning("Discarding " + std::to_string(buffer.size()) + " bytes of unparseable device output");
        buffer.clear();
    }
}

std::optional<RavenFragment> RavenParser::next() {
    size_t pos = 0;
    while ((pos = buffer.find('<', pos)) != std::string::npos) {
        size_t name_end = pos + 1;
        while (name_end < buffer.size() && is_name_char(buffer[name_end])) name_end++;

        // Stray closing tags, declarations and noise are skipped.
        if (name_end == pos + 1) {
            pos++;
            continue;
        }
        if (name_end == buffer.size()) {
            break;
        }

        std::string name = buffer.substr(pos + 1, name_end - pos - 1);
        size_t tag_close = buffer.find('>', name_end);
        if (tag_close == std::string::npos) {
            break;
        }
        if (buffer[tag_close - 1] == '/') {
            pos = tag_close + 1;
            continue;
        }

        std::string closing = "</" + name + ">";
        size_t end = buffer.find(closing, tag_close + 1);
        if (end == std::string::npos) {
            buffer.erase(0, pos);
            return std::nullopt;
        }

        RavenFragment fragment;
        fragment.name = name;
        fragment.fields = parse_children(buffer.substr(tag_close + 1, end - tag_close - 1));
        buffer.erase(0, end + closing.size());
        return fragment;
    }

    if (pos == std::string::npos) {
        buffer.clear();
    } else {
        buffer.erase(0, pos);
    }
    return std::nullopt;
}
