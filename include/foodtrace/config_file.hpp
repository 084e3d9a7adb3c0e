#pragma once

/**
 * @file config_file.hpp
 * @brief Config file parsing with comment preservation
 *
 * Format: one `key: value` pair per line, `#` starts a comment line.
 * Values are typed on load: true/false/yes/no become bool, decimal or 0x hex
 * integers become int64, other numbers double, everything else a string.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace foodtrace {

// ============================================================================
// ConfigFile - A configuration file that preserves structure when modified
// ============================================================================
//
// Comments, blank lines and ordering survive a load/modify/save cycle. When a
// value is modified only that line changes. New keys are appended at the end.
//
// Usage:
//   ConfigFile config;
//   if (config.load("data/registry.conf")) {
//       auto file = config.getString("ledger.file", "products.ledger");
//       config.set("ledger.compression", false);
//       config.save();
//   }
//
class ConfigFile {
public:
    using Value = std::variant<bool, int64_t, double, std::string>;

    ConfigFile() = default;
    explicit ConfigFile(std::filesystem::path path);

    // Load from file (returns false if file doesn't exist or can't be read)
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Save to file (creates directories if needed)
    [[nodiscard]] bool save();

    // Save to a different path
    [[nodiscard]] bool saveAs(const std::filesystem::path& path);

    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] bool isDirty() const { return dirty_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // ========================================================================
    // Value access (read)
    // ========================================================================

    [[nodiscard]] bool has(std::string_view key) const;

    // Typed getters fall back to the default when the key is missing or holds
    // a different type (an int is accepted where a double is asked for)
    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;
    [[nodiscard]] double getFloat(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    // ========================================================================
    // Value access (write)
    // ========================================================================

    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, const char* value) { set(key, std::string_view(value)); }
    void set(std::string_view key, int64_t value);
    void set(std::string_view key, double value);
    void set(std::string_view key, bool value);

    // Remove a key (comments out the line rather than deleting)
    void remove(std::string_view key);

    // Header comment written on the first save of a config not loaded from disk
    void setHeader(std::string_view header) { header_ = header; }

private:
    struct Line {
        std::string content;      // Original line content
        std::string key;          // Key if this is a key-value line, empty otherwise
        size_t valueStart = 0;    // Position where value starts (after ": ")
        bool isKeyValue = false;
    };

    void parseLines(std::string_view content);
    [[nodiscard]] static Value parseValue(std::string_view text);

    [[nodiscard]] int findLine(std::string_view key) const;
    [[nodiscard]] const Value* find(std::string_view key) const;
    void setImpl(std::string_view key, const std::string& formattedValue, Value value);

    std::filesystem::path path_;
    std::vector<Line> lines_;
    std::unordered_map<std::string, size_t> keyToLine_;
    std::unordered_map<std::string, Value> values_;
    std::string header_;
    bool loaded_ = false;
    bool dirty_ = false;
};

}  // namespace foodtrace
