#include "foodtrace/config_file.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace foodtrace {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

ConfigFile::ConfigFile(std::filesystem::path path)
    : path_(std::move(path)) {
    (void)load(path_);
}

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    lines_.clear();
    keyToLine_.clear();
    values_.clear();
    loaded_ = false;
    dirty_ = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    parseLines(buffer.str());

    loaded_ = true;
    return true;
}

void ConfigFile::parseLines(std::string_view content) {
    size_t pos = 0;

    while (pos < content.size()) {
        size_t lineEnd = content.find('\n', pos);
        std::string_view lineView;
        if (lineEnd == std::string_view::npos) {
            lineView = content.substr(pos);
            pos = content.size();
        } else {
            lineView = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }

        if (!lineView.empty() && lineView.back() == '\r') {
            lineView.remove_suffix(1);
        }

        Line line;
        line.content = std::string(lineView);

        // Key-value lines start with a non-space, non-comment character
        if (!lineView.empty() && lineView[0] != '#' &&
            !std::isspace(static_cast<unsigned char>(lineView[0]))) {

            auto colonPos = lineView.find(':');
            if (colonPos != std::string_view::npos) {
                std::string key(trim(lineView.substr(0, colonPos)));

                size_t valueStart = colonPos + 1;
                while (valueStart < lineView.size() &&
                       std::isspace(static_cast<unsigned char>(lineView[valueStart]))) {
                    valueStart++;
                }

                line.key = key;
                line.valueStart = valueStart;
                line.isKeyValue = true;

                // Later lines override earlier ones for the same key
                keyToLine_[key] = lines_.size();

                auto valueText = trim(lineView.substr(valueStart));
                if (!valueText.empty()) {
                    values_[key] = parseValue(valueText);
                } else {
                    values_.erase(key);
                }
            }
        }

        lines_.push_back(std::move(line));
    }
}

ConfigFile::Value ConfigFile::parseValue(std::string_view text) {
    if (text == "true" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "no") {
        return false;
    }

    std::string str(text);
    const char* begin = str.c_str();
    const char* end = begin + str.size();
    char* parsed = nullptr;

    bool hex = str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
    long long intVal = std::strtoll(begin, &parsed, hex ? 16 : 10);
    if (parsed != begin && parsed == end) {
        return static_cast<int64_t>(intVal);
    }

    double floatVal = std::strtod(begin, &parsed);
    if (parsed != begin && parsed == end) {
        return floatVal;
    }

    return str;
}

bool ConfigFile::save() {
    return saveAs(path_);
}

bool ConfigFile::saveAs(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    bool writeHeader = !loaded_ && !header_.empty();
    if (writeHeader) {
        file << header_;
        if (header_.back() != '\n') {
            file << '\n';
        }
    }

    for (const auto& line : lines_) {
        file << line.content << '\n';
    }

    file.close();
    if (file.fail()) {
        return false;
    }

    if (writeHeader) {
        // Pick up the header lines so the next save keeps them in place
        return load(path);
    }

    path_ = path;
    dirty_ = false;
    return true;
}

bool ConfigFile::has(std::string_view key) const {
    return keyToLine_.find(std::string(key)) != keyToLine_.end();
}

const ConfigFile::Value* ConfigFile::find(std::string_view key) const {
    auto it = values_.find(std::string(key));
    return it != values_.end() ? &it->second : nullptr;
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    const Value* v = find(key);
    if (!v) {
        return std::string(defaultVal);
    }
    // Any scalar can be read back as the text it was written as
    int lineIdx = findLine(key);
    if (!std::holds_alternative<std::string>(*v) && lineIdx >= 0) {
        const auto& line = lines_[static_cast<size_t>(lineIdx)];
        return std::string(trim(std::string_view(line.content).substr(line.valueStart)));
    }
    if (const auto* s = std::get_if<std::string>(v)) {
        return *s;
    }
    return std::string(defaultVal);
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    const Value* v = find(key);
    if (v) {
        if (const auto* i = std::get_if<int64_t>(v)) return *i;
    }
    return defaultVal;
}

double ConfigFile::getFloat(std::string_view key, double defaultVal) const {
    const Value* v = find(key);
    if (v) {
        if (const auto* d = std::get_if<double>(v)) return *d;
        if (const auto* i = std::get_if<int64_t>(v)) return static_cast<double>(*i);
    }
    return defaultVal;
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    const Value* v = find(key);
    if (v) {
        if (const auto* b = std::get_if<bool>(v)) return *b;
    }
    return defaultVal;
}

int ConfigFile::findLine(std::string_view key) const {
    auto it = keyToLine_.find(std::string(key));
    if (it != keyToLine_.end()) {
        return static_cast<int>(it->second);
    }
    return -1;
}

void ConfigFile::setImpl(std::string_view key, const std::string& formattedValue, Value value) {
    int lineIdx = findLine(key);

    if (lineIdx >= 0) {
        // Replace just the value portion
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = line.content.substr(0, line.valueStart) + formattedValue;
    } else {
        Line newLine;
        newLine.key = std::string(key);
        newLine.content = std::string(key) + ": " + formattedValue;
        newLine.valueStart = key.size() + 2;  // "key: " length
        newLine.isKeyValue = true;

        keyToLine_[std::string(key)] = lines_.size();
        lines_.push_back(std::move(newLine));
    }

    values_[std::string(key)] = std::move(value);
    dirty_ = true;
}

void ConfigFile::set(std::string_view key, std::string_view value) {
    setImpl(key, std::string(value), std::string(value));
}

void ConfigFile::set(std::string_view key, int64_t value) {
    setImpl(key, std::to_string(value), value);
}

void ConfigFile::set(std::string_view key, double value) {
    std::ostringstream oss;
    oss << value;
    setImpl(key, oss.str(), value);
}

void ConfigFile::set(std::string_view key, bool value) {
    setImpl(key, value ? "true" : "false", value);
}

void ConfigFile::remove(std::string_view key) {
    int lineIdx = findLine(key);
    if (lineIdx >= 0) {
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = "# " + line.content;
        line.isKeyValue = false;

        keyToLine_.erase(std::string(key));
        values_.erase(std::string(key));
        dirty_ = true;
    }
}

}  // namespace foodtrace
