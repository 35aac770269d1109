// bridge/raven_parser.hpp
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

// One top-level element of the RAVEn XML stream, e.g. <InstantaneousDemand>
// with its flat child elements.
struct RavenFragment {
    std::string name;
    std::map<std::string, std::string> fields;

    std::optional<std::string> text(const std::string& field) const;
    // Fields such as <Demand>0x00032d</Demand> are hexadecimal.
    std::optional<uint64_t> hex(const std::string& field) const;
};

// Incremental splitter for the device's XML fragment stream. Bytes are fed
// as they come off the tty; complete fragments are handed out in order.
class RavenParser {
private:
    std::string buffer;

public:
    static constexpr size_t kMaxBuffered = 64 * 1024;

    void feed(const std::string& data);
    std::optional<RavenFragment> next();
    void reset() { buffer.clear(); }
    size_t buffered() const { return buffer.size(); }
};
