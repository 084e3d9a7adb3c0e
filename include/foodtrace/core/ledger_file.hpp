#pragma once

/**
 * @file ledger_file.hpp
 * @brief Append-only, hash-chained journal of registrations
 *
 * File structure (all integers little-endian):
 *
 *   Header:  magic "FTLG" (4) | version (4)
 *   Entry:   magic "FTEN" (4) | flags (4) | size (4) | payload (size) | digest (32)
 *
 * digest[n] = SHA-256(digest[n-1] || flags || size || payload), with
 * digest[-1] all zero. The digest covers the payload as stored, so a
 * compressed entry is verified before it is decompressed.
 *
 * Entries are never rewritten. The only in-place modification is truncating
 * an incomplete final entry left behind by an interrupted write.
 */

#include "foodtrace/core/digest.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace foodtrace {

// Entry flags (stored in entry header)
namespace EntryFlags {
    constexpr uint32_t NONE = 0;
    constexpr uint32_t COMPRESSED_LZ4 = 1 << 0;  // Payload is LZ4 compressed
    constexpr uint32_t KNOWN = COMPRESSED_LZ4;
}

// Magic numbers
constexpr uint32_t LEDGER_MAGIC = 0x474C5446;   // "FTLG"
constexpr uint32_t ENTRY_MAGIC = 0x4E455446;    // "FTEN"
constexpr uint32_t LEDGER_VERSION = 1;

constexpr size_t LEDGER_HEADER_SIZE = 8;
constexpr size_t ENTRY_HEADER_SIZE = 12;
constexpr size_t ENTRY_OVERHEAD = ENTRY_HEADER_SIZE + DIGEST_SIZE;

// Upper bound for a single stored payload; larger size fields are treated as damage
constexpr uint32_t MAX_ENTRY_PAYLOAD = 16u * 1024u * 1024u;

enum class LedgerStatus {
    Ok,
    IoError,          // File could not be created, opened, read or written
    BadHeader,        // Not a ledger file, or unsupported version
    ChainBroken,      // Entry framing or digest mismatch before end of file
    TruncatedTail,    // File ends inside the final entry
    CorruptPayload,   // Digest matches but the payload could not be used
    Locked,           // Another LedgerFile (in this or another process) holds the file
};

[[nodiscard]] const char* toString(LedgerStatus status);

struct LedgerOptions {
    bool compression = true;       // LZ4-compress payloads when it saves space
    bool recoverTornTail = true;   // Truncate an incomplete final entry on open
};

// Outcome of walking a ledger from the start
struct LedgerScan {
    LedgerStatus status = LedgerStatus::Ok;
    uint64_t entries = 0;          // Complete, verified entries
    Digest head = GENESIS_DIGEST;  // Digest of the last verified entry
    uint64_t validEnd = 0;         // Byte offset just past the last verified entry
};

class LedgerFile {
public:
    // Receives each entry's decoded payload in order.
    // Returning false stops the scan with CorruptPayload.
    using Visitor = std::function<bool(uint64_t index, std::span<const uint8_t> payload,
                                       const Digest& digest)>;

    explicit LedgerFile(std::filesystem::path path, LedgerOptions options = {});
    ~LedgerFile();

    // Non-copyable, non-movable (owns file handle)
    LedgerFile(const LedgerFile&) = delete;
    LedgerFile& operator=(const LedgerFile&) = delete;
    LedgerFile(LedgerFile&&) = delete;
    LedgerFile& operator=(LedgerFile&&) = delete;

    // Open or create the file, take an exclusive lock on it and replay every
    // entry through the visitor. The lock is held until destruction.
    // The ledger accepts appends only if this returns Ok.
    [[nodiscard]] LedgerStatus open(const Visitor& visitor);

    [[nodiscard]] bool isOpen() const { return open_; }

    // Append one entry and flush it. Returns the entry's digest, or nullopt
    // if the write failed (in which case the file is restored to its prior end).
    [[nodiscard]] std::optional<Digest> append(std::span<const uint8_t> payload);

    // Re-read the whole file from disk and verify the chain
    [[nodiscard]] LedgerScan verify() const;

    void flush();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] uint64_t entryCount() const { return entryCount_; }
    [[nodiscard]] const Digest& headDigest() const { return head_; }
    [[nodiscard]] uint64_t fileSize() const { return fileEnd_; }

private:
    bool createFile();
    bool openStream();
    void rollbackTo(uint64_t offset);

    // Advisory flock() on a descriptor kept open for the ledger's lifetime
    [[nodiscard]] LedgerStatus acquireLock();
    void releaseLock();

    // Walk entries from the start of `in`. `visitor` may be empty.
    static LedgerScan scan(std::istream& in, uint64_t fileSize, const Visitor& visitor);

    // LZ4 helpers; stored form is original size (4 bytes) + LZ4 block
    [[nodiscard]] static std::optional<std::vector<uint8_t>> compress(std::span<const uint8_t> data);
    [[nodiscard]] static std::optional<std::vector<uint8_t>> decompress(std::span<const uint8_t> data);

    std::filesystem::path path_;
    LedgerOptions options_;
    std::fstream file_;
    int lockFd_ = -1;
    bool open_ = false;

    uint64_t entryCount_ = 0;
    Digest head_ = GENESIS_DIGEST;
    uint64_t fileEnd_ = 0;
};

}  // namespace foodtrace
