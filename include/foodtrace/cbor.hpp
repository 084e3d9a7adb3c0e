#pragma once

/**
 * @file cbor.hpp
 * @brief Minimal CBOR (RFC 8949) encoding and decoding for ledger payloads
 *
 * Only the subset needed by registry records is supported: integers, text
 * strings, byte strings, arrays and maps with definite lengths.
 *
 * The Decoder never reads past the end of its buffer. Any overrun or type
 * mismatch latches a failure flag, so callers decode a whole structure and
 * check ok() once at the end.
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace foodtrace {
namespace cbor {

// CBOR major types
constexpr uint8_t UNSIGNED_INT = 0;
constexpr uint8_t NEGATIVE_INT = 1;
constexpr uint8_t BYTE_STRING = 2;
constexpr uint8_t TEXT_STRING = 3;
constexpr uint8_t ARRAY = 4;
constexpr uint8_t MAP = 5;

// ============================================================================
// Encoding
// ============================================================================

// Major type + argument, shortest form
inline void encodeHeader(std::vector<uint8_t>& out, uint8_t majorType, uint64_t value) {
    const uint8_t mt = static_cast<uint8_t>(majorType << 5);

    int extraBytes;
    if (value < 24) {
        out.push_back(mt | static_cast<uint8_t>(value));
        return;
    } else if (value <= 0xFF) {
        out.push_back(mt | 24);
        extraBytes = 1;
    } else if (value <= 0xFFFF) {
        out.push_back(mt | 25);
        extraBytes = 2;
    } else if (value <= 0xFFFFFFFF) {
        out.push_back(mt | 26);
        extraBytes = 4;
    } else {
        out.push_back(mt | 27);
        extraBytes = 8;
    }

    // Arguments are big-endian
    for (int i = extraBytes - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void encodeInt(std::vector<uint8_t>& out, int64_t value) {
    if (value >= 0) {
        encodeHeader(out, UNSIGNED_INT, static_cast<uint64_t>(value));
    } else {
        encodeHeader(out, NEGATIVE_INT, static_cast<uint64_t>(-1 - value));
    }
}

inline void encodeUint(std::vector<uint8_t>& out, uint64_t value) {
    encodeHeader(out, UNSIGNED_INT, value);
}

inline void encodeString(std::vector<uint8_t>& out, std::string_view str) {
    encodeHeader(out, TEXT_STRING, str.size());
    out.insert(out.end(), str.begin(), str.end());
}

inline void encodeBytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    encodeHeader(out, BYTE_STRING, bytes.size());
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void encodeMapHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, MAP, count);
}

inline void encodeArrayHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, ARRAY, count);
}

// ============================================================================
// Decoding
// ============================================================================

class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] bool hasMore() const { return ok_ && pos_ < data_.size(); }
    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

    // Read a header; returns (major type, argument).
    // Indefinite lengths and reserved encodings fail the decoder.
    std::pair<uint8_t, uint64_t> readHeader() {
        uint8_t initial = readByte();
        uint8_t majorType = initial >> 5;
        uint8_t additional = initial & 0x1F;

        if (additional < 24) {
            return {majorType, additional};
        }

        int extraBytes = 0;
        switch (additional) {
            case 24: extraBytes = 1; break;
            case 25: extraBytes = 2; break;
            case 26: extraBytes = 4; break;
            case 27: extraBytes = 8; break;
            default:
                ok_ = false;
                return {majorType, 0};
        }

        uint64_t value = 0;
        for (int i = 0; i < extraBytes; ++i) {
            value = (value << 8) | readByte();
        }
        return {majorType, value};
    }

    // Expect a header of the given major type; returns its argument
    uint64_t expect(uint8_t majorType) {
        auto [mt, value] = readHeader();
        if (mt != majorType) {
            ok_ = false;
            return 0;
        }
        return value;
    }

    int64_t readInt() {
        auto [mt, value] = readHeader();
        if (mt == UNSIGNED_INT && value <= static_cast<uint64_t>(INT64_MAX)) {
            return static_cast<int64_t>(value);
        }
        if (mt == NEGATIVE_INT && value <= static_cast<uint64_t>(INT64_MAX)) {
            return -1 - static_cast<int64_t>(value);
        }
        ok_ = false;
        return 0;
    }

    uint64_t readUint() {
        return expect(UNSIGNED_INT);
    }

    std::string readString() {
        uint64_t length = expect(TEXT_STRING);
        if (!take(length)) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(data_.data() + pos_ - length),
                           static_cast<size_t>(length));
    }

    std::vector<uint8_t> readBytes() {
        uint64_t length = expect(BYTE_STRING);
        if (!take(length)) {
            return {};
        }
        auto first = data_.begin() + static_cast<std::ptrdiff_t>(pos_ - length);
        return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(length));
    }

    // Nesting limit for skipValue(); deeper input fails the decoder
    static constexpr int MAX_SKIP_DEPTH = 16;

    // Skip one complete value (used for unknown map keys)
    void skipValue(int depth = 0) {
        if (depth > MAX_SKIP_DEPTH) {
            ok_ = false;
            return;
        }
        auto [mt, value] = readHeader();
        if (!ok_) {
            return;
        }
        switch (mt) {
            case UNSIGNED_INT:
            case NEGATIVE_INT:
                break;
            case BYTE_STRING:
            case TEXT_STRING:
                take(value);
                break;
            case ARRAY:
                for (uint64_t i = 0; i < value && ok_; ++i) {
                    skipValue(depth + 1);
                }
                break;
            case MAP:
                for (uint64_t i = 0; i < value && ok_; ++i) {
                    skipValue(depth + 1);
                    skipValue(depth + 1);
                }
                break;
            default:
                ok_ = false;
                break;
        }
    }

private:
    uint8_t readByte() {
        if (pos_ >= data_.size()) {
            ok_ = false;
            return 0;
        }
        return data_[pos_++];
    }

    // Advance past `length` payload bytes if available
    bool take(uint64_t length) {
        if (!ok_ || length > remaining()) {
            ok_ = false;
            return false;
        }
        pos_ += static_cast<size_t>(length);
        return true;
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
    bool ok_ = true;
};

}  // namespace cbor
}  // namespace foodtrace
