#include "tool_command.hpp"
#include <cerrno>
#include <cstdlib>

namespace foodtrace {

bool parseDate(const std::string& text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

std::optional<ToolCommand> parseToolCommand(const std::string& command,
                                            std::vector<std::string> args,
                                            std::string& error) {
    error.clear();

    ToolCommand result;
    size_t minArgs = 0;
    size_t maxArgs = 0;

    if (command == "register") {
        result.kind = ToolCommandKind::Register;
        minArgs = maxArgs = 5;
    } else if (command == "verify") {
        result.kind = ToolCommandKind::Verify;
        minArgs = maxArgs = 1;
    } else if (command == "check") {
        result.kind = ToolCommandKind::Check;
        minArgs = maxArgs = 1;
    } else if (command == "list") {
        result.kind = ToolCommandKind::List;
    } else if (command == "events") {
        result.kind = ToolCommandKind::Events;
        maxArgs = 1;
    } else if (command == "audit") {
        result.kind = ToolCommandKind::Audit;
    } else {
        error = "Unknown command: " + command;
        return std::nullopt;
    }

    if (args.size() < minArgs || args.size() > maxArgs) {
        return std::nullopt;
    }

    if (result.kind == ToolCommandKind::Register &&
        !parseDate(args[4], result.manufacturingDate)) {
        error = "Manufacturing date must be a 64-bit integer: " + args[4];
        return std::nullopt;
    }

    result.args = std::move(args);
    return result;
}

}  // namespace foodtrace
