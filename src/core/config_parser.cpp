#include "terratile/core/config_parser.hpp"
#include "terratile/core/log.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace terratile {

namespace {

// Includes nested deeper than this are treated as a cycle
constexpr int MAX_INCLUDE_DEPTH = 16;

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

std::optional<bool> ConfigValue::tryBool() const {
    if (text_ == "true" || text_ == "yes" || text_ == "1" || text_ == "on") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" || text_ == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<float> ConfigValue::tryFloat() const {
    if (text_.empty()) return std::nullopt;

    char* end = nullptr;
    float val = std::strtof(text_.c_str(), &end);
    if (end == text_.c_str() || *end != '\0') return std::nullopt;
    return val;
}

std::optional<long long> ConfigValue::tryInt() const {
    if (text_.empty()) return std::nullopt;

    char* end = nullptr;
    long long val = std::strtoll(text_.c_str(), &end, 10);
    if (end == text_.c_str() || *end != '\0') return std::nullopt;
    return val;
}

bool ConfigValue::asBool(bool defaultVal) const {
    return tryBool().value_or(defaultVal);
}

float ConfigValue::asFloat(float defaultVal) const {
    return tryFloat().value_or(defaultVal);
}

int ConfigValue::asInt(int defaultVal) const {
    auto val = tryInt();
    return val ? static_cast<int>(*val) : defaultVal;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

float ConfigDocument::getFloat(std::string_view key, float defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asFloat(defaultVal);
    }
    return defaultVal;
}

int ConfigDocument::getInt(std::string_view key, int defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

bool ConfigDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFileAt(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    return parseContent(content, basePath, 0);
}

std::optional<ConfigDocument> ConfigParser::parseFileAt(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Relative includes resolve against the including file's directory
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseContent(buffer.str(), basePath, depth);
}

ConfigDocument ConfigParser::parseContent(std::string_view content, const std::string& basePath,
                                          int depth) const {
    ConfigDocument doc;
    std::string_view remaining = content;
    int lineNumber = 0;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        ++lineNumber;

        parseLine(line, lineNumber, doc, basePath, depth);
    }

    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNumber, ConfigDocument& doc,
                             const std::string& basePath, int depth) const {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return;
    }

    ConfigEntry entry;
    entry.line = lineNumber;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        entry.key = std::string(line);
        doc.addEntry(std::move(entry));
        return;
    }

    entry.key = std::string(trim(line.substr(0, colonPos)));
    auto rest = trim(line.substr(colonPos + 1));

    // Trailing comments after a value
    auto hashPos = rest.find(" #");
    if (hashPos != std::string_view::npos) {
        rest = trim(rest.substr(0, hashPos));
    }

    if (entry.key == "include") {
        if (depth >= MAX_INCLUDE_DEPTH) {
            Log::warn("ConfigParser", "Include depth exceeded at line " + std::to_string(lineNumber));
            return;
        }

        std::string includePath(rest);
        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath)
                                                    : basePath + includePath;

        if (auto included = parseFileAt(resolvedPath, depth + 1)) {
            for (const auto& includedEntry : *included) {
                doc.addEntry(includedEntry);
            }
        } else {
            Log::warn("ConfigParser", "Cannot open include file: " + resolvedPath);
        }
        return;
    }

    entry.value = ConfigValue(rest);
    doc.addEntry(std::move(entry));
}

}  // namespace terratile
