#include "config.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Only whole-line comments exist; ';' and '#' inside a value are kept.
bool is_comment(const std::string& content) {
    return !content.empty() && (content.front() == ';' || content.front() == '#');
}

using Sections = std::map<std::string, std::map<std::string, std::string>>;

Sections read_sections(std::istream& in, const std::string& source_name) {
    Sections sections;
    std::string section;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        std::string content = trim(line);
        if (content.empty() || is_comment(content)) continue;

        if (content.front() == '[') {
            if (content.back() != ']') {
                throw ConfigError(source_name + ":" + std::to_string(line_no) + ": unterminated section header");
            }
            section = trim(content.substr(1, content.size() - 2));
            sections[section];
            continue;
        }

        size_t eq = content.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(source_name + ":" + std::to_string(line_no) + ": expected key = value");
        }
        if (section.empty()) {
            throw ConfigError(source_name + ":" + std::to_string(line_no) + ": key outside of a section");
        }
        std::string key = trim(content.substr(0, eq));
        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        sections[section][key] = trim(content.substr(eq + 1));
    }
    return sections;
}

class SectionReader {
private:
    const Sections& sections;
    std::string source_name;
    std::map<std::string, std::map<std::string, bool>> used;

    const std::string* find(const std::string& section, const std::string& key) {
        auto sit = sections.find(section);
        if (sit == sections.end()) return nullptr;
        auto kit = sit->second.find(key);
        if (kit == sit->second.end()) return nullptr;
        used[section][key] = true;
        return &kit->second;
    }

public:
    SectionReader(const Sections& s, std::string name) : sections(s), source_name(std::move(name)) {}

    std::string required(const std::string& section, const std::string& key) {
        const std::string* value = find(section, key);
        if (!value || value->empty()) {
            throw ConfigError(source_name + ": missing required option [" + section + "] " + key);
        }
        return *value;
    }

    std::string text(const std::string& section, const std::string& key, const std::string& fallback) {
        const std::string* value = find(section, key);
        return (value && !value->empty()) ? *value : fallback;
    }

    int integer(const std::string& section, const std::string& key, int fallback, int min_value) {
        const std::string* value = find(section, key);
        if (!value || value->empty()) return fallback;

        size_t consumed = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(*value, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed != value->size()) {
            throw ConfigError(source_name + ": [" + section + "] " + key + " is not an integer: " + *value);
        }
        if (parsed < min_value) {
            throw ConfigError(source_name + ": [" + section + "] " + key + " must be at least " +
                              std::to_string(min_value));
        }
        return parsed;
    }

    void warn_unused() const {
        for (const auto& [section, keys] : sections) {
            for (const auto& entry : keys) {
                auto uit = used.find(section);
                if (uit == used.end() || uit->second.find(entry.first) == uit->second.end()) {
                    Logger::warning(source_name + ": ignoring unknown option [" + section + "] " + entry.first);
                }
            }
        }
    }
};

}

BridgeConfig parse_config(std::istream& in, const std::string& source_name) {
    Sections sections = read_sections(in, source_name);
    SectionReader reader(sections, source_name);
    BridgeConfig config;

    config.serial_path = reader.required("emu", "serial");
    config.request_timeout = std::chrono::seconds(
        reader.integer("emu", "timeout_s", static_cast<int>(config.request_timeout.count()), 1));

    config.mqtt_hostname = reader.required("mqtt", "hostname");
    config.mqtt_port = reader.integer("mqtt", "port", config.mqtt_port, 1);
    if (config.mqtt_port > 65535) {
        throw ConfigError(source_name + ": [mqtt] port out of range: " + std::to_string(config.mqtt_port));
    }
    config.mqtt_client_id = reader.text("mqtt", "client_id", config.mqtt_client_id);
    config.discovery_prefix = reader.text("mqtt", "discovery_prefix", config.discovery_prefix);
    config.mqtt_keepalive = std::chrono::seconds(
        reader.integer("mqtt", "keepalive_s", static_cast<int>(config.mqtt_keepalive.count()), 5));

    config.poll_interval = std::chrono::seconds(
        reader.integer("general", "interval_s", static_cast<int>(config.poll_interval.count()), 0));
    config.app_id = reader.text("general", "app_id", config.app_id);
    config.unresponsive_max = reader.integer("general", "unresponsive_max", config.unresponsive_max, 0);

    reader.warn_unused();
    return config;
}

BridgeConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    return parse_config(in, path);
}
