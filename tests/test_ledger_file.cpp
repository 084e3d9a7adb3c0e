#include <gtest/gtest.h>
#include "foodtrace/core/ledger_file.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace foodtrace;

namespace {

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Collects every replayed payload
struct Collector {
    std::vector<std::string> payloads;
    std::vector<Digest> digests;

    LedgerFile::Visitor visitor() {
        return [this](uint64_t index, std::span<const uint8_t> payload, const Digest& digest) {
            EXPECT_EQ(index, payloads.size());
            payloads.emplace_back(payload.begin(), payload.end());
            digests.push_back(digest);
            return true;
        };
    }
};

void flipByte(const std::filesystem::path& path, uint64_t offset) {
    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    f.seekg(static_cast<std::streamoff>(offset));
    char c = 0;
    f.read(&c, 1);
    c = static_cast<char>(c ^ 0x5A);
    f.seekp(static_cast<std::streamoff>(offset));
    f.write(&c, 1);
}

uint32_t readLE32(const std::filesystem::path& path, uint64_t offset) {
    std::ifstream f(path, std::ios::binary);
    f.seekg(static_cast<std::streamoff>(offset));
    uint8_t b[4] = {};
    f.read(reinterpret_cast<char*>(b), 4);
    return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
}

}  // namespace

class LedgerFileTest : public ::testing::Test {
protected:
    std::filesystem::path tempDir;
    std::filesystem::path ledgerPath;

    void SetUp() override {
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        tempDir = std::filesystem::temp_directory_path() / ("foodtrace_test_ledger_" + name);
        std::filesystem::remove_all(tempDir);
        std::filesystem::create_directories(tempDir);
        ledgerPath = tempDir / "test.ledger";
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    LedgerOptions uncompressed() {
        LedgerOptions options;
        options.compression = false;
        return options;
    }
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(LedgerFileTest, CreatesFileWithHeader) {
    LedgerFile ledger(ledgerPath);
    EXPECT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
    EXPECT_TRUE(ledger.isOpen());
    EXPECT_EQ(ledger.entryCount(), 0u);
    EXPECT_EQ(ledger.headDigest(), GENESIS_DIGEST);

    EXPECT_EQ(std::filesystem::file_size(ledgerPath), LEDGER_HEADER_SIZE);
    EXPECT_EQ(readLE32(ledgerPath, 0), LEDGER_MAGIC);
    EXPECT_EQ(readLE32(ledgerPath, 4), LEDGER_VERSION);
}

TEST_F(LedgerFileTest, CreatesMissingDirectories) {
    auto nested = tempDir / "a" / "b" / "nested.ledger";
    LedgerFile ledger(nested);
    EXPECT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
    EXPECT_TRUE(std::filesystem::exists(nested));
}

TEST_F(LedgerFileTest, ZeroLengthFileIsInitialized) {
    { std::ofstream touch(ledgerPath, std::ios::binary); }
    ASSERT_EQ(std::filesystem::file_size(ledgerPath), 0u);

    LedgerFile ledger(ledgerPath);
    EXPECT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
    EXPECT_EQ(std::filesystem::file_size(ledgerPath), LEDGER_HEADER_SIZE);
}

TEST_F(LedgerFileTest, RejectsForeignFile) {
    {
        std::ofstream f(ledgerPath, std::ios::binary);
        f << "this is not a ledger file";
    }

    LedgerFile ledger(ledgerPath);
    EXPECT_EQ(ledger.open(nullptr), LedgerStatus::BadHeader);
    EXPECT_FALSE(ledger.isOpen());
    EXPECT_FALSE(ledger.append(bytesOf("x")).has_value());
}

// ============================================================================
// Append and replay
// ============================================================================

TEST_F(LedgerFileTest, AppendThenReplayInOrder) {
    Digest head{};
    {
        LedgerFile ledger(ledgerPath, uncompressed());
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);

        auto d1 = ledger.append(bytesOf("first"));
        auto d2 = ledger.append(bytesOf("second"));
        auto d3 = ledger.append(bytesOf("third"));
        ASSERT_TRUE(d1 && d2 && d3);
        EXPECT_NE(*d1, *d2);
        EXPECT_NE(*d2, *d3);
        EXPECT_EQ(ledger.entryCount(), 3u);
        EXPECT_EQ(ledger.headDigest(), *d3);
        head = *d3;
    }

    Collector collector;
    LedgerFile reopened(ledgerPath, uncompressed());
    ASSERT_EQ(reopened.open(collector.visitor()), LedgerStatus::Ok);

    ASSERT_EQ(collector.payloads.size(), 3u);
    EXPECT_EQ(collector.payloads[0], "first");
    EXPECT_EQ(collector.payloads[1], "second");
    EXPECT_EQ(collector.payloads[2], "third");
    EXPECT_EQ(reopened.entryCount(), 3u);
    EXPECT_EQ(reopened.headDigest(), head);
}

TEST_F(LedgerFileTest, DigestsFollowChainRule) {
    LedgerFile ledger(ledgerPath, uncompressed());
    ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);

    auto p1 = bytesOf("alpha");
    auto p2 = bytesOf("beta");
    auto d1 = ledger.append(p1);
    auto d2 = ledger.append(p2);
    ASSERT_TRUE(d1 && d2);

    Digest expected1{};
    Digest expected2{};
    ASSERT_TRUE(chainDigest(GENESIS_DIGEST, EntryFlags::NONE, p1, expected1));
    ASSERT_TRUE(chainDigest(expected1, EntryFlags::NONE, p2, expected2));
    EXPECT_EQ(*d1, expected1);
    EXPECT_EQ(*d2, expected2);
}

TEST_F(LedgerFileTest, AppendsContinueAfterReopen) {
    {
        LedgerFile ledger(ledgerPath);
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf("one")).has_value());
    }
    {
        LedgerFile ledger(ledgerPath);
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf("two")).has_value());
        EXPECT_EQ(ledger.entryCount(), 2u);
    }

    Collector collector;
    LedgerFile ledger(ledgerPath);
    ASSERT_EQ(ledger.open(collector.visitor()), LedgerStatus::Ok);
    ASSERT_EQ(collector.payloads.size(), 2u);
    EXPECT_EQ(collector.payloads[1], "two");
}

TEST_F(LedgerFileTest, VisitorRejectionFailsOpen) {
    {
        LedgerFile ledger(ledgerPath);
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf("ok")).has_value());
        ASSERT_TRUE(ledger.append(bytesOf("bad")).has_value());
    }

    LedgerFile ledger(ledgerPath);
    auto status = ledger.open([](uint64_t, std::span<const uint8_t> payload, const Digest&) {
        return std::string(payload.begin(), payload.end()) != "bad";
    });
    EXPECT_EQ(status, LedgerStatus::CorruptPayload);
    EXPECT_FALSE(ledger.isOpen());
}

// ============================================================================
// Compression
// ============================================================================

TEST_F(LedgerFileTest, CompressibleEntryIsStoredCompressed) {
    std::string big(4000, 'a');
    {
        LedgerFile ledger(ledgerPath);
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf(big)).has_value());
    }

    // Flags live right after the entry magic
    EXPECT_EQ(readLE32(ledgerPath, LEDGER_HEADER_SIZE + 4), EntryFlags::COMPRESSED_LZ4);
    EXPECT_LT(std::filesystem::file_size(ledgerPath), LEDGER_HEADER_SIZE + ENTRY_OVERHEAD + big.size());

    Collector collector;
    LedgerFile ledger(ledgerPath);
    ASSERT_EQ(ledger.open(collector.visitor()), LedgerStatus::Ok);
    ASSERT_EQ(collector.payloads.size(), 1u);
    EXPECT_EQ(collector.payloads[0], big);
}

TEST_F(LedgerFileTest, CompressionDisabledStoresRaw) {
    std::string big(4000, 'a');
    {
        LedgerFile ledger(ledgerPath, uncompressed());
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf(big)).has_value());
    }

    EXPECT_EQ(readLE32(ledgerPath, LEDGER_HEADER_SIZE + 4), EntryFlags::NONE);
    EXPECT_EQ(std::filesystem::file_size(ledgerPath), LEDGER_HEADER_SIZE + ENTRY_OVERHEAD + big.size());
}

// ============================================================================
// Tamper evidence
// ============================================================================

TEST_F(LedgerFileTest, ModifiedPayloadBreaksChain) {
    {
        LedgerFile ledger(ledgerPath, uncompressed());
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf("genuine entry")).has_value());
        ASSERT_TRUE(ledger.append(bytesOf("second entry")).has_value());
    }

    flipByte(ledgerPath, LEDGER_HEADER_SIZE + ENTRY_HEADER_SIZE + 3);

    Collector collector;
    LedgerFile ledger(ledgerPath, uncompressed());
    EXPECT_EQ(ledger.open(collector.visitor()), LedgerStatus::ChainBroken);
    EXPECT_FALSE(ledger.isOpen());
    EXPECT_TRUE(collector.payloads.empty());
}

TEST_F(LedgerFileTest, ModifiedLaterEntryKeepsEarlierOnes) {
    uint64_t firstEnd = 0;
    {
        LedgerFile ledger(ledgerPath, uncompressed());
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf("first")).has_value());
        firstEnd = ledger.fileSize();
        ASSERT_TRUE(ledger.append(bytesOf("second")).has_value());
    }

    // Corrupt the stored digest of the second entry
    flipByte(ledgerPath, std::filesystem::file_size(ledgerPath) - 1);

    Collector collector;
    LedgerFile ledger(ledgerPath, uncompressed());
    EXPECT_EQ(ledger.open(collector.visitor()), LedgerStatus::ChainBroken);
    ASSERT_EQ(collector.payloads.size(), 1u);
    EXPECT_EQ(collector.payloads[0], "first");

    LedgerScan scan = ledger.verify();
    EXPECT_EQ(scan.status, LedgerStatus::ChainBroken);
    EXPECT_EQ(scan.entries, 1u);
    EXPECT_EQ(scan.validEnd, firstEnd);
}

TEST_F(LedgerFileTest, RemovedEntryBreaksChain) {
    std::vector<uint8_t> bytes;
    uint64_t firstEnd = 0;
    uint64_t secondEnd = 0;
    {
        LedgerFile ledger(ledgerPath, uncompressed());
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf("first")).has_value());
        firstEnd = ledger.fileSize();
        ASSERT_TRUE(ledger.append(bytesOf("second")).has_value());
        secondEnd = ledger.fileSize();
        ASSERT_TRUE(ledger.append(bytesOf("third")).has_value());
    }

    // Splice out the middle entry
    {
        std::ifstream in(ledgerPath, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    bytes.erase(bytes.begin() + static_cast<std::ptrdiff_t>(firstEnd),
                bytes.begin() + static_cast<std::ptrdiff_t>(secondEnd));
    {
        std::ofstream out(ledgerPath, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    LedgerFile ledger(ledgerPath, uncompressed());
    EXPECT_EQ(ledger.open(nullptr), LedgerStatus::ChainBroken);
}

TEST_F(LedgerFileTest, VerifyDetectsTamperAfterOpen) {
    LedgerFile ledger(ledgerPath, uncompressed());
    ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
    ASSERT_TRUE(ledger.append(bytesOf("payload")).has_value());

    EXPECT_EQ(ledger.verify().status, LedgerStatus::Ok);
    EXPECT_EQ(ledger.verify().entries, 1u);

    flipByte(ledgerPath, LEDGER_HEADER_SIZE + ENTRY_HEADER_SIZE);
    EXPECT_EQ(ledger.verify().status, LedgerStatus::ChainBroken);
}

// ============================================================================
// Torn tail
// ============================================================================

TEST_F(LedgerFileTest, TornTailIsTruncatedOnOpen) {
    uint64_t firstEnd = 0;
    {
        LedgerFile ledger(ledgerPath);
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf("complete")).has_value());
        firstEnd = ledger.fileSize();
        ASSERT_TRUE(ledger.append(bytesOf("interrupted")).has_value());
    }

    std::filesystem::resize_file(ledgerPath, std::filesystem::file_size(ledgerPath) - 10);

    {
        Collector collector;
        LedgerFile ledger(ledgerPath);
        ASSERT_EQ(ledger.open(collector.visitor()), LedgerStatus::Ok);
        ASSERT_EQ(collector.payloads.size(), 1u);
        EXPECT_EQ(collector.payloads[0], "complete");
        EXPECT_EQ(std::filesystem::file_size(ledgerPath), firstEnd);

        // Still writable after recovery
        ASSERT_TRUE(ledger.append(bytesOf("retry")).has_value());
    }

    Collector collector;
    LedgerFile ledger(ledgerPath);
    ASSERT_EQ(ledger.open(collector.visitor()), LedgerStatus::Ok);
    ASSERT_EQ(collector.payloads.size(), 2u);
    EXPECT_EQ(collector.payloads[1], "retry");
}

TEST_F(LedgerFileTest, TornTailFailsWhenRecoveryDisabled) {
    {
        LedgerFile ledger(ledgerPath);
        ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(ledger.append(bytesOf("complete")).has_value());
    }

    // Partial entry header only
    {
        std::ofstream out(ledgerPath, std::ios::binary | std::ios::app);
        out.write("FTE", 3);
    }
    auto sizeBefore = std::filesystem::file_size(ledgerPath);

    LedgerOptions options;
    options.recoverTornTail = false;
    LedgerFile ledger(ledgerPath, options);
    EXPECT_EQ(ledger.open(nullptr), LedgerStatus::TruncatedTail);
    EXPECT_EQ(std::filesystem::file_size(ledgerPath), sizeBefore);
}

// ============================================================================
// Exclusive access
// ============================================================================

TEST_F(LedgerFileTest, SecondOpenIsLocked) {
    LedgerFile first(ledgerPath);
    ASSERT_EQ(first.open(nullptr), LedgerStatus::Ok);
    ASSERT_TRUE(first.append(bytesOf("first")).has_value());

    LedgerFile second(ledgerPath);
    EXPECT_EQ(second.open(nullptr), LedgerStatus::Locked);
    EXPECT_FALSE(second.isOpen());
    EXPECT_FALSE(second.append(bytesOf("second")).has_value());

    // The holder is unaffected
    ASSERT_TRUE(first.append(bytesOf("third")).has_value());
    EXPECT_EQ(first.entryCount(), 2u);
}

TEST_F(LedgerFileTest, LockReleasedOnDestruction) {
    {
        LedgerFile first(ledgerPath);
        ASSERT_EQ(first.open(nullptr), LedgerStatus::Ok);
        ASSERT_TRUE(first.append(bytesOf("entry")).has_value());
    }

    Collector collector;
    LedgerFile second(ledgerPath);
    ASSERT_EQ(second.open(collector.visitor()), LedgerStatus::Ok);
    EXPECT_EQ(collector.payloads, (std::vector<std::string>{"entry"}));
}

TEST_F(LedgerFileTest, FailedOpenReleasesLock) {
    {
        std::ofstream out(ledgerPath, std::ios::binary);
        out << "not a ledger at all";
    }

    LedgerFile first(ledgerPath);
    EXPECT_EQ(first.open(nullptr), LedgerStatus::BadHeader);

    // Still the header that fails, not the lock left behind by the first attempt
    LedgerFile second(ledgerPath);
    EXPECT_EQ(second.open(nullptr), LedgerStatus::BadHeader);
}

// ============================================================================
// Rejected appends
// ============================================================================

TEST_F(LedgerFileTest, OversizedAppendLeavesLedgerUnchanged) {
    LedgerFile ledger(ledgerPath);
    ASSERT_EQ(ledger.open(nullptr), LedgerStatus::Ok);
    ASSERT_TRUE(ledger.append(bytesOf("before")).has_value());

    Digest head = ledger.headDigest();
    uint64_t size = ledger.fileSize();

    // Highly compressible, so the limit applies to the plain size
    std::vector<uint8_t> oversized(MAX_ENTRY_PAYLOAD + 1, 'a');
    EXPECT_FALSE(ledger.append(oversized).has_value());

    EXPECT_EQ(ledger.headDigest(), head);
    EXPECT_EQ(ledger.fileSize(), size);
    EXPECT_EQ(ledger.entryCount(), 1u);
    EXPECT_EQ(std::filesystem::file_size(ledgerPath), size);

    ASSERT_TRUE(ledger.append(bytesOf("after")).has_value());
    EXPECT_EQ(ledger.entryCount(), 2u);
    EXPECT_TRUE(ledger.isOpen());
}

TEST(LedgerStatusTest, ToStringCoversAll) {
    EXPECT_STREQ(toString(LedgerStatus::Ok), "ok");
    EXPECT_STREQ(toString(LedgerStatus::ChainBroken), "hash chain broken");
    EXPECT_STREQ(toString(LedgerStatus::TruncatedTail), "truncated final entry");
    EXPECT_STREQ(toString(LedgerStatus::Locked), "ledger in use by another registry");
}
