#pragma once

/**
 * @file tool_command.hpp
 * @brief Argument parsing for foodtrace_tool
 *
 * Parsing is complete before the registry is opened, so a malformed
 * invocation never touches the data directory.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace foodtrace {

enum class ToolCommandKind {
    Register,
    Verify,
    Check,
    List,
    Events,
    Audit,
};

struct ToolCommand {
    ToolCommandKind kind = ToolCommandKind::List;
    std::vector<std::string> args;   // Positional arguments after the command name
    int64_t manufacturingDate = 0;   // Parsed from args[4] for Register
};

// Parse a base-10 int64; rejects empty input, trailing characters and overflow
[[nodiscard]] bool parseDate(const std::string& text, int64_t& out);

// Parse `<command> [args]`. On failure returns nullopt and sets `error`
// (empty when only the usage text applies).
[[nodiscard]] std::optional<ToolCommand> parseToolCommand(const std::string& command,
                                                          std::vector<std::string> args,
                                                          std::string& error);

}  // namespace foodtrace
