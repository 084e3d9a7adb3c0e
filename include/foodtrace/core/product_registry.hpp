#pragma once

/**
 * @file product_registry.hpp
 * @brief Tamper-evident registry of product id -> immutable product record
 *
 * Each product id moves through exactly two states:
 *
 *   Unregistered --registerProduct()--> Registered   (terminal)
 *
 * There is no update or delete. Every successful registration is written to
 * the ledger as one hash-chained entry before it becomes visible, and the
 * matching RegistrationEvent is appended to the audit log in the same
 * critical section. Reopening the registry replays the ledger and rebuilds
 * both the records and the audit log.
 *
 * Thread safety: all public methods are thread-safe. Registration takes an
 * exclusive lock across check, ledger append and insertion; lookups take a
 * shared lock.
 */

#include "foodtrace/core/audit_log.hpp"
#include "foodtrace/core/ledger_file.hpp"
#include "foodtrace/core/product_record.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace foodtrace {

class RegistryConfig;

enum class RegisterResult {
    Registered,          // New record stored and audit event emitted
    AlreadyRegistered,   // Id already present; nothing changed
    StorageError,        // Ledger write failed; nothing changed
};

[[nodiscard]] const char* toString(RegisterResult result);

struct IntegrityReport {
    LedgerStatus status = LedgerStatus::Ok;
    uint64_t entriesChecked = 0;
    Digest headDigest = GENESIS_DIGEST;
    bool matchesMemory = true;   // Disk entry count and head equal the in-memory state

    [[nodiscard]] bool ok() const { return status == LedgerStatus::Ok && matchesMemory; }
};

class ProductRegistry {
public:
    // Open the registry described by `config`, replaying its ledger.
    // Returns nullptr on failure; the reason is stored in *outStatus if given.
    [[nodiscard]] static std::unique_ptr<ProductRegistry> open(const RegistryConfig& config,
                                                               LedgerStatus* outStatus = nullptr);

    ~ProductRegistry();

    // Non-copyable, non-movable (owns ledger and locks)
    ProductRegistry(const ProductRegistry&) = delete;
    ProductRegistry& operator=(const ProductRegistry&) = delete;
    ProductRegistry(ProductRegistry&&) = delete;
    ProductRegistry& operator=(ProductRegistry&&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    RegisterResult registerProduct(const ProductRecord& record);

    RegisterResult registerProduct(std::string productId, std::string productName,
                                   std::string ingredients, std::string manufacturer,
                                   int64_t manufacturingDate);

    // ========================================================================
    // Lookup
    // ========================================================================

    /// Stored record, or nullopt if the id was never registered
    [[nodiscard]] std::optional<ProductRecord> verify(std::string_view productId) const;

    /// True if a record exists for the id
    [[nodiscard]] bool isAuthentic(std::string_view productId) const;

    [[nodiscard]] size_t productCount() const;

    /// All registered ids, sorted
    [[nodiscard]] std::vector<std::string> productIds() const;

    // ========================================================================
    // Audit
    // ========================================================================

    [[nodiscard]] const AuditLog& auditLog() const { return auditLog_; }
    [[nodiscard]] AuditLog& auditLog() { return auditLog_; }

    /// Digest of the newest ledger entry (all zero for an empty registry)
    [[nodiscard]] Digest headDigest() const;

    /// Re-read the ledger from disk and check it against the in-memory state
    [[nodiscard]] IntegrityReport verifyIntegrity() const;

    void flush();

    [[nodiscard]] const std::filesystem::path& ledgerPath() const { return ledger_.path(); }

private:
    ProductRegistry(std::filesystem::path ledgerPath, LedgerOptions options, bool verbose);

    // Replay callback: rebuild one record and its event
    bool restoreEntry(uint64_t index, std::span<const uint8_t> payload, const Digest& digest);

    [[nodiscard]] static uint64_t currentTimestamp();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ProductRecord> records_;
    LedgerFile ledger_;
    AuditLog auditLog_;
    bool verbose_ = false;
};

}  // namespace foodtrace
