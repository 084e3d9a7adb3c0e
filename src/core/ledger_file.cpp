#include "foodtrace/core/ledger_file.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <lz4.h>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace foodtrace {

namespace {

void putLE32(uint8_t* out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
}

uint32_t getLE32(const uint8_t* in) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(in[i]) << (i * 8);
    }
    return value;
}

}  // namespace

const char* toString(LedgerStatus status) {
    switch (status) {
        case LedgerStatus::Ok: return "ok";
        case LedgerStatus::IoError: return "I/O error";
        case LedgerStatus::BadHeader: return "bad ledger header";
        case LedgerStatus::ChainBroken: return "hash chain broken";
        case LedgerStatus::TruncatedTail: return "truncated final entry";
        case LedgerStatus::CorruptPayload: return "corrupt entry payload";
        case LedgerStatus::Locked: return "ledger in use by another registry";
    }
    return "unknown";
}

// ============================================================================
// LedgerFile implementation
// ============================================================================

LedgerFile::LedgerFile(std::filesystem::path path, LedgerOptions options)
    : path_(std::move(path))
    , options_(options)
{
}

LedgerFile::~LedgerFile() {
    flush();
    if (file_.is_open()) file_.close();
    releaseLock();
}

LedgerStatus LedgerFile::acquireLock() {
    releaseLock();

    lockFd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (lockFd_ < 0) {
        std::cerr << "[LedgerFile] Cannot open " << path_ << " for locking: "
                  << std::strerror(errno) << '\n';
        return LedgerStatus::IoError;
    }

    if (::flock(lockFd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        releaseLock();
        if (err == EWOULDBLOCK) {
            std::cerr << "[LedgerFile] " << path_ << " is already open elsewhere\n";
            return LedgerStatus::Locked;
        }
        std::cerr << "[LedgerFile] Cannot lock " << path_ << ": " << std::strerror(err) << '\n';
        return LedgerStatus::IoError;
    }
    return LedgerStatus::Ok;
}

void LedgerFile::releaseLock() {
    if (lockFd_ >= 0) {
        ::close(lockFd_);  // Closing the descriptor drops the flock
        lockFd_ = -1;
    }
}

bool LedgerFile::createFile() {
    std::ofstream create(path_, std::ios::binary | std::ios::trunc);
    if (!create.is_open()) {
        return false;
    }

    uint8_t header[LEDGER_HEADER_SIZE];
    putLE32(header, LEDGER_MAGIC);
    putLE32(header + 4, LEDGER_VERSION);
    create.write(reinterpret_cast<const char*>(header), sizeof(header));
    create.close();
    return create.good();
}

bool LedgerFile::openStream() {
    if (file_.is_open()) file_.close();
    file_.clear();
    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    return file_.is_open();
}

LedgerStatus LedgerFile::open(const Visitor& visitor) {
    open_ = false;
    entryCount_ = 0;
    head_ = GENESIS_DIGEST;
    fileEnd_ = 0;

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[LedgerFile] Cannot create directory " << parent
                      << ": " << ec.message() << '\n';
            return LedgerStatus::IoError;
        }
    }

    // Lock before inspecting the file so two openers never both initialize it
    LedgerStatus lockStatus = acquireLock();
    if (lockStatus != LedgerStatus::Ok) {
        return lockStatus;
    }

    // A zero-length file is new, or a ledger whose creation was interrupted
    bool fresh = std::filesystem::file_size(path_, ec) == 0;
    if (ec || (fresh && !createFile())) {
        std::cerr << "[LedgerFile] Cannot create " << path_ << '\n';
        releaseLock();
        return LedgerStatus::IoError;
    }

    if (!openStream()) {
        std::cerr << "[LedgerFile] Cannot open " << path_ << '\n';
        releaseLock();
        return LedgerStatus::IoError;
    }

    file_.seekg(0, std::ios::end);
    auto size = static_cast<uint64_t>(file_.tellg());
    file_.seekg(0, std::ios::beg);

    LedgerScan result = scan(file_, size, visitor);

    if (result.status == LedgerStatus::TruncatedTail && options_.recoverTornTail) {
        std::cerr << "[LedgerFile] Dropping incomplete final entry in " << path_
                  << " (" << (size - result.validEnd) << " bytes)\n";
        file_.close();
        std::filesystem::resize_file(path_, result.validEnd, ec);
        if (ec || !openStream()) {
            std::cerr << "[LedgerFile] Cannot truncate " << path_ << ": " << ec.message() << '\n';
            releaseLock();
            return LedgerStatus::IoError;
        }
        result.status = LedgerStatus::Ok;
    }

    if (result.status != LedgerStatus::Ok) {
        std::cerr << "[LedgerFile] " << path_ << ": " << toString(result.status)
                  << " after " << result.entries << " entries\n";
        file_.close();
        releaseLock();
        return result.status;
    }

    file_.clear();  // Clear EOF flag left by the scan
    entryCount_ = result.entries;
    head_ = result.head;
    fileEnd_ = result.validEnd;
    open_ = true;
    return LedgerStatus::Ok;
}

LedgerScan LedgerFile::scan(std::istream& in, uint64_t fileSize, const Visitor& visitor) {
    LedgerScan result;

    if (fileSize < LEDGER_HEADER_SIZE) {
        result.status = LedgerStatus::BadHeader;
        return result;
    }

    uint8_t header[LEDGER_HEADER_SIZE];
    in.read(reinterpret_cast<char*>(header), sizeof(header));
    if (!in.good()) {
        result.status = LedgerStatus::IoError;
        return result;
    }
    if (getLE32(header) != LEDGER_MAGIC || getLE32(header + 4) != LEDGER_VERSION) {
        result.status = LedgerStatus::BadHeader;
        return result;
    }

    uint64_t pos = LEDGER_HEADER_SIZE;
    result.validEnd = pos;

    std::vector<uint8_t> payload;
    while (pos < fileSize) {
        if (fileSize - pos < ENTRY_HEADER_SIZE) {
            result.status = LedgerStatus::TruncatedTail;
            return result;
        }

        uint8_t entryHeader[ENTRY_HEADER_SIZE];
        in.read(reinterpret_cast<char*>(entryHeader), sizeof(entryHeader));
        if (!in.good()) {
            result.status = LedgerStatus::IoError;
            return result;
        }

        uint32_t magic = getLE32(entryHeader);
        uint32_t flags = getLE32(entryHeader + 4);
        uint32_t size = getLE32(entryHeader + 8);

        if (magic != ENTRY_MAGIC || size > MAX_ENTRY_PAYLOAD) {
            result.status = LedgerStatus::ChainBroken;
            return result;
        }

        if (fileSize - pos < ENTRY_OVERHEAD + size) {
            result.status = LedgerStatus::TruncatedTail;
            return result;
        }

        payload.resize(size);
        Digest stored{};
        in.read(reinterpret_cast<char*>(payload.data()), size);
        in.read(reinterpret_cast<char*>(stored.data()), DIGEST_SIZE);
        if (!in.good()) {
            result.status = LedgerStatus::IoError;
            return result;
        }

        Digest expected{};
        if (!chainDigest(result.head, flags, payload, expected)) {
            result.status = LedgerStatus::IoError;
            return result;
        }
        if (expected != stored) {
            result.status = LedgerStatus::ChainBroken;
            return result;
        }

        if ((flags & ~EntryFlags::KNOWN) != 0) {
            result.status = LedgerStatus::CorruptPayload;
            return result;
        }

        if (visitor) {
            bool accepted;
            if (flags & EntryFlags::COMPRESSED_LZ4) {
                auto plain = decompress(payload);
                accepted = plain && visitor(result.entries, *plain, stored);
            } else {
                accepted = visitor(result.entries, payload, stored);
            }
            if (!accepted) {
                result.status = LedgerStatus::CorruptPayload;
                return result;
            }
        }

        pos += ENTRY_OVERHEAD + size;
        result.entries++;
        result.head = stored;
        result.validEnd = pos;
    }

    return result;
}

std::optional<Digest> LedgerFile::append(std::span<const uint8_t> payload) {
    if (!open_) {
        return std::nullopt;
    }

    // Replay decompresses into at most MAX_ENTRY_PAYLOAD bytes
    if (payload.size() > MAX_ENTRY_PAYLOAD) {
        std::cerr << "[LedgerFile] Entry of " << payload.size() << " bytes exceeds limit\n";
        return std::nullopt;
    }

    std::vector<uint8_t> stored;
    uint32_t flags = EntryFlags::NONE;

    if (options_.compression && !payload.empty()) {
        auto compressed = compress(payload);
        if (compressed && compressed->size() < payload.size()) {
            stored = std::move(*compressed);
            flags = EntryFlags::COMPRESSED_LZ4;
        }
    }
    if (flags == EntryFlags::NONE) {
        stored.assign(payload.begin(), payload.end());
    }

    Digest digest{};
    if (!chainDigest(head_, flags, stored, digest)) {
        std::cerr << "[LedgerFile] Digest computation failed\n";
        return std::nullopt;
    }

    uint8_t header[ENTRY_HEADER_SIZE];
    putLE32(header, ENTRY_MAGIC);
    putLE32(header + 4, flags);
    putLE32(header + 8, static_cast<uint32_t>(stored.size()));

    file_.seekp(static_cast<std::streamoff>(fileEnd_));
    file_.write(reinterpret_cast<const char*>(header), sizeof(header));
    file_.write(reinterpret_cast<const char*>(stored.data()), static_cast<std::streamsize>(stored.size()));
    file_.write(reinterpret_cast<const char*>(digest.data()), DIGEST_SIZE);
    file_.flush();

    if (!file_.good()) {
        std::cerr << "[LedgerFile] Write failed at offset " << fileEnd_ << " in " << path_ << '\n';
        rollbackTo(fileEnd_);
        return std::nullopt;
    }

    fileEnd_ += ENTRY_OVERHEAD + stored.size();
    entryCount_++;
    head_ = digest;
    return digest;
}

void LedgerFile::rollbackTo(uint64_t offset) {
    file_.close();

    std::error_code ec;
    std::filesystem::resize_file(path_, offset, ec);
    if (ec) {
        std::cerr << "[LedgerFile] Cannot roll back " << path_ << ": " << ec.message() << '\n';
    }

    if (!openStream()) {
        std::cerr << "[LedgerFile] Cannot reopen " << path_ << "; ledger closed\n";
        open_ = false;
    }
}

LedgerScan LedgerFile::verify() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        LedgerScan result;
        result.status = LedgerStatus::IoError;
        return result;
    }

    in.seekg(0, std::ios::end);
    auto size = static_cast<uint64_t>(in.tellg());
    in.seekg(0, std::ios::beg);

    // Decode compressed payloads too, so an undecodable block is reported
    return scan(in, size, [](uint64_t, std::span<const uint8_t>, const Digest&) { return true; });
}

void LedgerFile::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// Compression (LZ4)
// ============================================================================

std::optional<std::vector<uint8_t>> LedgerFile::compress(std::span<const uint8_t> data) {
    int maxCompressedSize = LZ4_compressBound(static_cast<int>(data.size()));
    if (maxCompressedSize <= 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(4 + static_cast<size_t>(maxCompressedSize));
    putLE32(out.data(), static_cast<uint32_t>(data.size()));

    int compressedSize = LZ4_compress_default(
        reinterpret_cast<const char*>(data.data()),
        reinterpret_cast<char*>(out.data() + 4),
        static_cast<int>(data.size()),
        maxCompressedSize
    );

    if (compressedSize <= 0) {
        return std::nullopt;
    }

    out.resize(4 + static_cast<size_t>(compressedSize));
    return out;
}

std::optional<std::vector<uint8_t>> LedgerFile::decompress(std::span<const uint8_t> data) {
    if (data.size() < 4) {
        return std::nullopt;
    }

    uint32_t originalSize = getLE32(data.data());
    if (originalSize > MAX_ENTRY_PAYLOAD) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(originalSize);
    int decompressedSize = LZ4_decompress_safe(
        reinterpret_cast<const char*>(data.data() + 4),
        reinterpret_cast<char*>(out.data()),
        static_cast<int>(data.size() - 4),
        static_cast<int>(originalSize)
    );

    if (decompressedSize < 0 || static_cast<uint32_t>(decompressedSize) != originalSize) {
        return std::nullopt;
    }
    return out;
}

}  // namespace foodtrace
