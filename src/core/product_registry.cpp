#include "foodtrace/core/product_registry.hpp"
#include "foodtrace/core/registry_config.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>

namespace foodtrace {

const char* toString(RegisterResult result) {
    switch (result) {
        case RegisterResult::Registered: return "registered";
        case RegisterResult::AlreadyRegistered: return "already registered";
        case RegisterResult::StorageError: return "storage error";
    }
    return "unknown";
}

// ============================================================================
// Open / replay
// ============================================================================

ProductRegistry::ProductRegistry(std::filesystem::path ledgerPath, LedgerOptions options, bool verbose)
    : ledger_(std::move(ledgerPath), options)
    , verbose_(verbose)
{
}

ProductRegistry::~ProductRegistry() {
    flush();
}

std::unique_ptr<ProductRegistry> ProductRegistry::open(const RegistryConfig& config,
                                                       LedgerStatus* outStatus) {
    // Constructor is private, so no make_unique
    std::unique_ptr<ProductRegistry> registry(
        new ProductRegistry(config.ledgerPath(), config.ledgerOptions(), config.verboseLogging()));

    LedgerStatus status = registry->ledger_.open(
        [&reg = *registry](uint64_t index, std::span<const uint8_t> payload, const Digest& digest) {
            return reg.restoreEntry(index, payload, digest);
        });

    if (outStatus) {
        *outStatus = status;
    }

    if (status != LedgerStatus::Ok) {
        std::cerr << "[ProductRegistry] Cannot open " << config.ledgerPath() << ": "
                  << toString(status) << '\n';
        return nullptr;
    }

    if (registry->verbose_) {
        std::cout << "[ProductRegistry] Opened " << config.ledgerPath() << " with "
                  << registry->records_.size() << " products, head "
                  << toHex(registry->ledger_.headDigest()) << '\n';
    }

    return registry;
}

bool ProductRegistry::restoreEntry(uint64_t index, std::span<const uint8_t> payload,
                                   const Digest& digest) {
    auto entry = RecordSerializer::fromCBOR(payload);
    if (!entry) {
        std::cerr << "[ProductRegistry] Ledger entry " << index << " does not decode\n";
        return false;
    }

    // A duplicate id in a correctly chained ledger means it was written by
    // something other than this registry
    if (records_.contains(entry->record.productId)) {
        std::cerr << "[ProductRegistry] Ledger entry " << index << " repeats product '"
                  << entry->record.productId << "'\n";
        return false;
    }

    RegistrationEvent event;
    event.productId = entry->record.productId;
    event.productName = entry->record.productName;
    event.manufacturer = entry->record.manufacturer;
    event.recordedAt = entry->recordedAt;
    event.entryDigest = digest;

    std::string key = entry->record.productId;
    records_.emplace(std::move(key), std::move(entry->record));
    auditLog_.append(std::move(event));
    return true;
}

// ============================================================================
// Registration
// ============================================================================

RegisterResult ProductRegistry::registerProduct(std::string productId, std::string productName,
                                                std::string ingredients, std::string manufacturer,
                                                int64_t manufacturingDate) {
    ProductRecord record;
    record.productId = std::move(productId);
    record.productName = std::move(productName);
    record.ingredients = std::move(ingredients);
    record.manufacturer = std::move(manufacturer);
    record.manufacturingDate = manufacturingDate;
    return registerProduct(record);
}

RegisterResult ProductRegistry::registerProduct(const ProductRecord& record) {
    RegistrationEvent committed;
    {
        std::unique_lock lock(mutex_);

        if (records_.contains(record.productId)) {
            return RegisterResult::AlreadyRegistered;
        }

        uint64_t recordedAt = currentTimestamp();
        auto payload = RecordSerializer::toCBOR(record, recordedAt);

        // Durable first: nothing becomes visible unless the ledger accepted it
        auto digest = ledger_.append(payload);
        if (!digest) {
            std::cerr << "[ProductRegistry] Ledger append failed for product '"
                      << record.productId << "'\n";
            return RegisterResult::StorageError;
        }

        records_.emplace(record.productId, record);

        RegistrationEvent event;
        event.productId = record.productId;
        event.productName = record.productName;
        event.manufacturer = record.manufacturer;
        event.recordedAt = recordedAt;
        event.entryDigest = *digest;
        committed = auditLog_.append(std::move(event));
    }

    if (verbose_) {
        std::cout << "[ProductRegistry] Registered '" << committed.productId << "' ("
                  << committed.productName << ", " << committed.manufacturer << ") as event "
                  << committed.sequence << '\n';
    }

    auditLog_.notify(committed);
    return RegisterResult::Registered;
}

// ============================================================================
// Lookup
// ============================================================================

std::optional<ProductRecord> ProductRegistry::verify(std::string_view productId) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(std::string(productId));
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ProductRegistry::isAuthentic(std::string_view productId) const {
    std::shared_lock lock(mutex_);
    return records_.contains(std::string(productId));
}

size_t ProductRegistry::productCount() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

std::vector<std::string> ProductRegistry::productIds() const {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(mutex_);
        ids.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ============================================================================
// Audit
// ============================================================================

Digest ProductRegistry::headDigest() const {
    std::shared_lock lock(mutex_);
    return ledger_.headDigest();
}

IntegrityReport ProductRegistry::verifyIntegrity() const {
    // Shared lock keeps appends out while the file is re-read
    std::shared_lock lock(mutex_);

    LedgerScan scan = ledger_.verify();

    IntegrityReport report;
    report.status = scan.status;
    report.entriesChecked = scan.entries;
    report.headDigest = scan.head;
    report.matchesMemory = scan.entries == ledger_.entryCount() &&
                           scan.head == ledger_.headDigest() &&
                           scan.entries == records_.size();

    if (!report.ok()) {
        std::cerr << "[ProductRegistry] Integrity check failed: " << toString(scan.status)
                  << ", " << scan.entries << " entries on disk, " << records_.size()
                  << " in memory\n";
    }
    return report;
}

void ProductRegistry::flush() {
    std::unique_lock lock(mutex_);
    ledger_.flush();
}

uint64_t ProductRegistry::currentTimestamp() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

}  // namespace foodtrace
