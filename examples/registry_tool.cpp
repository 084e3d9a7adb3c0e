/**
 * @file registry_tool.cpp
 * @brief Command-line front end for a product registry
 *
 * Manufacturer side:  foodtrace_tool <data-dir> register <id> <name> <ingredients> <manufacturer> <date>
 * Consumer side:      foodtrace_tool <data-dir> verify <id>
 *                     foodtrace_tool <data-dir> check <id>
 * Auditing:           foodtrace_tool <data-dir> list
 *                     foodtrace_tool <data-dir> events [id]
 *                     foodtrace_tool <data-dir> audit
 *
 * Exit codes: 0 success, 1 error, 2 already registered, 3 not found / unknown
 */

#include <foodtrace/core/product_registry.hpp>
#include <foodtrace/core/registry_config.hpp>

#include "tool_command.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace foodtrace;

namespace {

constexpr int EXIT_ALREADY_REGISTERED = 2;
constexpr int EXIT_NOT_FOUND = 3;

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <data-dir> <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  register <id> <name> <ingredients> <manufacturer> <date>\n"
              << "  verify <id>        Print the stored record\n"
              << "  check <id>         Print 'authentic' or 'unknown'\n"
              << "  list               Print all registered ids\n"
              << "  events [id]        Print registration events\n"
              << "  audit              Re-verify the ledger hash chain\n";
}

void printEvent(const RegistrationEvent& event) {
    std::cout << event.sequence << '\t' << event.productId << '\t' << event.productName
              << '\t' << event.manufacturer << '\t' << event.recordedAt << '\t'
              << toHex(event.entryDigest) << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string dataDir = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    // Parse fully before opening, which creates the registry on disk
    std::string error;
    auto parsed = parseToolCommand(command, args, error);
    if (!parsed) {
        if (!error.empty()) {
            std::cerr << error << '\n';
        }
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }
    const auto& params = parsed->args;

    RegistryConfig config(dataDir);

    LedgerStatus status = LedgerStatus::Ok;
    auto registry = ProductRegistry::open(config, &status);
    if (!registry) {
        std::cerr << "Cannot open registry in " << dataDir << ": " << toString(status) << '\n';
        return EXIT_FAILURE;
    }

    switch (parsed->kind) {
        case ToolCommandKind::Register: {
            RegisterResult result = registry->registerProduct(
                params[0], params[1], params[2], params[3], parsed->manufacturingDate);
            std::cout << params[0] << ": " << toString(result) << '\n';
            switch (result) {
                case RegisterResult::Registered: return EXIT_SUCCESS;
                case RegisterResult::AlreadyRegistered: return EXIT_ALREADY_REGISTERED;
                case RegisterResult::StorageError: return EXIT_FAILURE;
            }
            return EXIT_FAILURE;
        }

        case ToolCommandKind::Verify: {
            auto record = registry->verify(params[0]);
            if (!record) {
                std::cout << params[0] << ": not found\n";
                return EXIT_NOT_FOUND;
            }
            std::cout << "id:           " << record->productId << '\n'
                      << "name:         " << record->productName << '\n'
                      << "ingredients:  " << record->ingredients << '\n'
                      << "manufacturer: " << record->manufacturer << '\n'
                      << "date:         " << record->manufacturingDate << '\n';
            return EXIT_SUCCESS;
        }

        case ToolCommandKind::Check: {
            bool authentic = registry->isAuthentic(params[0]);
            std::cout << (authentic ? "authentic" : "unknown") << '\n';
            return authentic ? EXIT_SUCCESS : EXIT_NOT_FOUND;
        }

        case ToolCommandKind::List:
            for (const auto& id : registry->productIds()) {
                std::cout << id << '\n';
            }
            return EXIT_SUCCESS;

        case ToolCommandKind::Events: {
            auto events = params.empty() ? registry->auditLog().events()
                                         : registry->auditLog().eventsFor(params[0]);
            for (const auto& event : events) {
                printEvent(event);
            }
            return EXIT_SUCCESS;
        }

        case ToolCommandKind::Audit: {
            IntegrityReport report = registry->verifyIntegrity();
            std::cout << "entries: " << report.entriesChecked << '\n'
                      << "head:    " << toHex(report.headDigest) << '\n'
                      << "status:  "
                      << (report.status != LedgerStatus::Ok ? toString(report.status)
                          : report.matchesMemory           ? "ok"
                                                           : "ledger changed since open")
                      << '\n';
            return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
        }
    }
    return EXIT_FAILURE;
}
