#pragma once

/**
 * @file registry_config.hpp
 * @brief Per-registry configuration stored in the data directory
 *
 * File: <dataDir>/registry.conf
 *
 *   ledger.file: products.ledger
 *   ledger.compression: true
 *   ledger.recover_torn_tail: true
 *   log.verbose: false
 *
 * Missing keys take the defaults above. Setters change the in-memory value and
 * the file text; nothing is written until save().
 */

#include "foodtrace/core/ledger_file.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace foodtrace {

class ConfigFile;

class RegistryConfig {
public:
    static constexpr const char* FILE_NAME = "registry.conf";
    static constexpr const char* DEFAULT_LEDGER_FILE = "products.ledger";

    // Load <dataDir>/registry.conf if present, otherwise start from defaults
    explicit RegistryConfig(std::filesystem::path dataDir);

    // Move-only (has unique_ptr member)
    ~RegistryConfig();
    RegistryConfig(RegistryConfig&&) noexcept;
    RegistryConfig& operator=(RegistryConfig&&) noexcept;
    RegistryConfig(const RegistryConfig&) = delete;
    RegistryConfig& operator=(const RegistryConfig&) = delete;

    // Write the config file (creates the data directory if needed)
    [[nodiscard]] bool save();

    // Discard unsaved changes and re-read from disk
    bool reload();

    [[nodiscard]] const std::filesystem::path& dataDir() const { return dataDir_; }
    [[nodiscard]] std::filesystem::path configPath() const { return dataDir_ / FILE_NAME; }

    // ========================================================================
    // Ledger settings
    // ========================================================================

    // Ledger file name, relative to the data directory unless absolute
    [[nodiscard]] std::string ledgerFile() const;
    void setLedgerFile(const std::string& name);

    // Resolved ledger path
    [[nodiscard]] std::filesystem::path ledgerPath() const;

    [[nodiscard]] bool compressionEnabled() const;
    void setCompressionEnabled(bool enabled);

    [[nodiscard]] bool recoverTornTail() const;
    void setRecoverTornTail(bool enabled);

    [[nodiscard]] LedgerOptions ledgerOptions() const;

    // ========================================================================
    // Logging
    // ========================================================================

    [[nodiscard]] bool verboseLogging() const;
    void setVerboseLogging(bool enabled);

private:
    std::filesystem::path dataDir_;
    std::unique_ptr<ConfigFile> configFile_;
};

}  // namespace foodtrace
