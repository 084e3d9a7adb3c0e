#include "foodtrace/core/product_record.hpp"
#include "foodtrace/cbor.hpp"

namespace foodtrace {

namespace {

// Map keys
constexpr const char* KEY_ID = "id";
constexpr const char* KEY_NAME = "name";
constexpr const char* KEY_INGREDIENTS = "ingr";
constexpr const char* KEY_MANUFACTURER = "mfr";
constexpr const char* KEY_DATE = "date";
constexpr const char* KEY_RECORDED_AT = "at";

// Bits for tracking which required fields were seen
constexpr uint32_t HAS_ID = 1 << 0;
constexpr uint32_t HAS_NAME = 1 << 1;
constexpr uint32_t HAS_INGREDIENTS = 1 << 2;
constexpr uint32_t HAS_MANUFACTURER = 1 << 3;
constexpr uint32_t HAS_DATE = 1 << 4;
constexpr uint32_t HAS_RECORDED_AT = 1 << 5;
constexpr uint32_t HAS_ALL = (1 << 6) - 1;

}  // namespace

std::vector<uint8_t> RecordSerializer::toCBOR(const ProductRecord& record, uint64_t recordedAt) {
    std::vector<uint8_t> out;
    out.reserve(64 + record.productId.size() + record.productName.size() +
                record.ingredients.size() + record.manufacturer.size());

    cbor::encodeMapHeader(out, 6);

    cbor::encodeString(out, KEY_ID);
    cbor::encodeString(out, record.productId);

    cbor::encodeString(out, KEY_NAME);
    cbor::encodeString(out, record.productName);

    cbor::encodeString(out, KEY_INGREDIENTS);
    cbor::encodeString(out, record.ingredients);

    cbor::encodeString(out, KEY_MANUFACTURER);
    cbor::encodeString(out, record.manufacturer);

    cbor::encodeString(out, KEY_DATE);
    cbor::encodeInt(out, record.manufacturingDate);

    cbor::encodeString(out, KEY_RECORDED_AT);
    cbor::encodeUint(out, recordedAt);

    return out;
}

std::optional<RegistrationEntry> RecordSerializer::fromCBOR(std::span<const uint8_t> data) {
    cbor::Decoder dec(data);

    uint64_t count = dec.expect(cbor::MAP);
    if (!dec.ok()) {
        return std::nullopt;
    }

    RegistrationEntry entry;
    uint32_t seen = 0;

    for (uint64_t i = 0; i < count && dec.ok(); ++i) {
        std::string key = dec.readString();

        if (key == KEY_ID) {
            entry.record.productId = dec.readString();
            seen |= HAS_ID;
        } else if (key == KEY_NAME) {
            entry.record.productName = dec.readString();
            seen |= HAS_NAME;
        } else if (key == KEY_INGREDIENTS) {
            entry.record.ingredients = dec.readString();
            seen |= HAS_INGREDIENTS;
        } else if (key == KEY_MANUFACTURER) {
            entry.record.manufacturer = dec.readString();
            seen |= HAS_MANUFACTURER;
        } else if (key == KEY_DATE) {
            entry.record.manufacturingDate = dec.readInt();
            seen |= HAS_DATE;
        } else if (key == KEY_RECORDED_AT) {
            entry.recordedAt = dec.readUint();
            seen |= HAS_RECORDED_AT;
        } else {
            dec.skipValue();
        }
    }

    // Trailing bytes mean the payload is not a single well-formed map
    if (!dec.ok() || dec.hasMore() || seen != HAS_ALL) {
        return std::nullopt;
    }

    return entry;
}

}  // namespace foodtrace
