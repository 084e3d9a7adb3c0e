#include "foodtrace/core/registry_config.hpp"
#include "foodtrace/config_file.hpp"

namespace foodtrace {

namespace {

constexpr const char* KEY_LEDGER_FILE = "ledger.file";
constexpr const char* KEY_COMPRESSION = "ledger.compression";
constexpr const char* KEY_RECOVER_TAIL = "ledger.recover_torn_tail";
constexpr const char* KEY_VERBOSE = "log.verbose";

constexpr const char* HEADER =
    "# foodtrace registry configuration\n"
    "# Format: key: value\n";

}  // namespace

RegistryConfig::RegistryConfig(std::filesystem::path dataDir)
    : dataDir_(std::move(dataDir))
    , configFile_(std::make_unique<ConfigFile>())
{
    reload();
}

RegistryConfig::~RegistryConfig() = default;
RegistryConfig::RegistryConfig(RegistryConfig&&) noexcept = default;
RegistryConfig& RegistryConfig::operator=(RegistryConfig&&) noexcept = default;

bool RegistryConfig::save() {
    configFile_->setHeader(HEADER);
    return configFile_->saveAs(configPath());
}

bool RegistryConfig::reload() {
    // A missing file is not an error: defaults apply
    return configFile_->load(configPath());
}

std::string RegistryConfig::ledgerFile() const {
    return configFile_->getString(KEY_LEDGER_FILE, DEFAULT_LEDGER_FILE);
}

void RegistryConfig::setLedgerFile(const std::string& name) {
    configFile_->set(KEY_LEDGER_FILE, std::string_view(name));
}

std::filesystem::path RegistryConfig::ledgerPath() const {
    std::filesystem::path file = ledgerFile();
    if (file.is_absolute()) {
        return file;
    }
    return dataDir_ / file;
}

bool RegistryConfig::compressionEnabled() const {
    return configFile_->getBool(KEY_COMPRESSION, true);
}

void RegistryConfig::setCompressionEnabled(bool enabled) {
    configFile_->set(KEY_COMPRESSION, enabled);
}

bool RegistryConfig::recoverTornTail() const {
    return configFile_->getBool(KEY_RECOVER_TAIL, true);
}

void RegistryConfig::setRecoverTornTail(bool enabled) {
    configFile_->set(KEY_RECOVER_TAIL, enabled);
}

LedgerOptions RegistryConfig::ledgerOptions() const {
    LedgerOptions options;
    options.compression = compressionEnabled();
    options.recoverTornTail = recoverTornTail();
    return options;
}

bool RegistryConfig::verboseLogging() const {
    return configFile_->getBool(KEY_VERBOSE, false);
}

void RegistryConfig::setVerboseLogging(bool enabled) {
    configFile_->set(KEY_VERBOSE, enabled);
}

}  // namespace foodtrace
