#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terratile {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief Text value of a config entry with typed views
 *
 * The as*() accessors fall back to a default on malformed text; the try*()
 * accessors report malformed text as nullopt so callers can reject it.
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    [[nodiscard]] bool asBool(bool defaultVal = false) const;
    [[nodiscard]] float asFloat(float defaultVal = 0.0f) const;
    [[nodiscard]] int asInt(int defaultVal = 0) const;

    [[nodiscard]] std::optional<bool> tryBool() const;
    [[nodiscard]] std::optional<float> tryFloat() const;
    [[nodiscard]] std::optional<long long> tryInt() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry - One "key: value" line
// ============================================================================

struct ConfigEntry {
    std::string key;     // e.g. "sea.threshold"
    ConfigValue value;   // text after the colon, trimmed
    int line = 0;        // 1-based line in the file it came from
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief Ordered list of entries; later entries with the same key override
 * earlier ones for lookups (includes are merged in place).
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    // Lookup by key (returns last entry with this key, or nullptr)
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] bool has(std::string_view key) const { return get(key) != nullptr; }

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] float getFloat(std::string_view key, float defaultVal = 0.0f) const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser
// ============================================================================

/**
 * @brief Parser for generation config files
 *
 * Format:
 * ```
 * # Comments start with #
 * sea.threshold: 0.376
 * heightmap.algorithm: diamond_square
 * include: coastline.conf
 * ```
 *
 * Blank lines and comment lines are ignored. A line without a colon is an
 * entry with an empty value. `include:` paths are resolved relative to the
 * including file unless an include resolver is set; a missing include file is
 * skipped.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /// Parse a file; nullopt if it cannot be opened
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    void parseLine(std::string_view line, int lineNumber, ConfigDocument& doc,
                   const std::string& basePath, int depth) const;
    [[nodiscard]] ConfigDocument parseContent(std::string_view content, const std::string& basePath,
                                              int depth) const;
    [[nodiscard]] std::optional<ConfigDocument> parseFileAt(const std::string& path, int depth) const;

    IncludeResolver includeResolver_;
};

}  // namespace terratile
