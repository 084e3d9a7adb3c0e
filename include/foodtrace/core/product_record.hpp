#pragma once

/**
 * @file product_record.hpp
 * @brief Registered product data and its ledger encoding
 *
 * A ProductRecord is immutable once registered. Each successful registration
 * becomes exactly one ledger entry whose payload is a CBOR map:
 *
 *   {
 *     "id":   text,     // productId
 *     "name": text,     // productName
 *     "ingr": text,     // ingredients
 *     "mfr":  text,     // manufacturer
 *     "date": int,      // manufacturingDate, caller-defined encoding
 *     "at":   uint      // recordedAt, microseconds since Unix epoch
 *   }
 *
 * Unknown keys are skipped on decode so later versions may add fields.
 */

#include "foodtrace/core/digest.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace foodtrace {

struct ProductRecord {
    std::string productId;
    std::string productName;
    std::string ingredients;
    std::string manufacturer;
    int64_t manufacturingDate = 0;

    bool operator==(const ProductRecord&) const = default;
};

// Audit event emitted for every successful registration
struct RegistrationEvent {
    uint64_t sequence = 0;        // Position in the audit log (== ledger entry index)
    std::string productId;
    std::string productName;
    std::string manufacturer;
    uint64_t recordedAt = 0;      // Microseconds since Unix epoch
    Digest entryDigest{};         // Digest of the ledger entry carrying this registration

    bool operator==(const RegistrationEvent&) const = default;
};

// What one ledger entry carries
struct RegistrationEntry {
    ProductRecord record;
    uint64_t recordedAt = 0;
};

class RecordSerializer {
public:
    [[nodiscard]] static std::vector<uint8_t> toCBOR(const ProductRecord& record, uint64_t recordedAt);

    // Returns nullopt if the payload is malformed or lacks a required field
    [[nodiscard]] static std::optional<RegistrationEntry> fromCBOR(std::span<const uint8_t> data);
};

}  // namespace foodtrace
