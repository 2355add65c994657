#include <gtest/gtest.h>

#include <zlib.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "storage/segment_store.hpp"
#include "storage/wav_writer.hpp"
#include "test_fakes.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

uint32_t readU32(const std::vector<uint8_t>& b, size_t at) {
    return (uint32_t)b[at] | ((uint32_t)b[at + 1] << 8) | ((uint32_t)b[at + 2] << 16) | ((uint32_t)b[at + 3] << 24);
}

uint16_t readU16(const std::vector<uint8_t>& b, size_t at) {
    return (uint16_t)(b[at] | (b[at + 1] << 8));
}

std::vector<uint8_t> readPlain(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<uint8_t> readGzip(const fs::path& path) {
    std::vector<uint8_t> out;
    gzFile gz = gzopen(path.string().c_str(), "rb");
    if (!gz) return out;
    uint8_t buff[4096];
    int n = 0;
    while ((n = gzread(gz, buff, sizeof(buff))) > 0) out.insert(out.end(), buff, buff + n);
    gzclose(gz);
    return out;
}

Segment makeSegment(size_t frames, int16_t value = 7) {
    Segment seg;
    for (size_t i = 0; i < frames; ++i) seg.frames.push_back(makeFrame(value, 480));
    seg.startTime = Clock::now();
    seg.endTime = seg.startTime + std::chrono::milliseconds(30 * (long long)frames);
    return seg;
}

class SegmentStoreTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("voicesplit_test_") + info->name());
        fs::remove_all(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    SegmentStore::Config config(bool compress) const {
        SegmentStore::Config c;
        c.outputDir = (dir / "out").string();
        c.sampleRate = 16000;
        c.compress = compress;
        return c;
    }
};

} // namespace

TEST(WavWriter, WritesCanonicalHeader) {
    const std::vector<Frame> frames{Frame{1, -2, 3}, Frame{4}};
    const auto wav = encodeWav(frames, 16000);

    ASSERT_EQ(wav.size(), 44u + 8u);
    EXPECT_EQ(std::string(wav.begin(), wav.begin() + 4), "RIFF");
    EXPECT_EQ(readU32(wav, 4), 36u + 8u);
    EXPECT_EQ(std::string(wav.begin() + 8, wav.begin() + 12), "WAVE");
    EXPECT_EQ(readU16(wav, 20), 1);
    EXPECT_EQ(readU16(wav, 22), 1);
    EXPECT_EQ(readU32(wav, 24), 16000u);
    EXPECT_EQ(readU32(wav, 28), 32000u);
    EXPECT_EQ(readU16(wav, 34), 16);
    EXPECT_EQ(std::string(wav.begin() + 36, wav.begin() + 40), "data");
    EXPECT_EQ(readU32(wav, 40), 8u);
    EXPECT_EQ((int16_t)readU16(wav, 46), -2);
    EXPECT_EQ((int16_t)readU16(wav, 50), 4);
}

TEST_F(SegmentStoreTest, WritesGzippedWav) {
    SegmentStore store(config(true));
    const Segment seg = makeSegment(10);

    ASSERT_TRUE(store.persist(seg));
    const fs::path path = store.lastPath();
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(path.filename().string(), store.fileNameFor(seg));
    EXPECT_NE(path.filename().string().find("_to_"), std::string::npos);
    EXPECT_EQ(path.extension().string(), ".gz");

    const auto wav = readGzip(path);
    ASSERT_EQ(wav.size(), 44u + 10u * 480u * 2u);
    EXPECT_EQ(readU32(wav, 40), 10u * 480u * 2u);
    EXPECT_EQ((int16_t)readU16(wav, 44), 7);
}

TEST_F(SegmentStoreTest, WritesPlainWavWhenUncompressed) {
    SegmentStore store(config(false));
    ASSERT_TRUE(store.persist(makeSegment(2)));

    const fs::path path = store.lastPath();
    EXPECT_EQ(path.extension().string(), ".wav");
    EXPECT_EQ(readPlain(path).size(), 44u + 2u * 480u * 2u);
}

TEST_F(SegmentStoreTest, SameSecondNamesDoNotOverwrite) {
    SegmentStore store(config(false));
    const Segment seg = makeSegment(1);

    ASSERT_TRUE(store.persist(seg));
    const std::string first = store.lastPath();
    ASSERT_TRUE(store.persist(seg));
    const std::string second = store.lastPath();

    EXPECT_NE(first, second);
    EXPECT_TRUE(fs::exists(first));
    EXPECT_TRUE(fs::exists(second));
}

TEST_F(SegmentStoreTest, LeavesNoPartialFiles) {
    SegmentStore store(config(true));
    ASSERT_TRUE(store.persist(makeSegment(3)));

    for (const auto& entry : fs::directory_iterator(dir / "out")) {
        EXPECT_NE(entry.path().extension().string(), ".part");
    }
}

TEST_F(SegmentStoreTest, EmptySegmentIsNotStored) {
    SegmentStore store(config(true));
    EXPECT_FALSE(store.persist(Segment{}));
    EXPECT_TRUE(fs::is_empty(dir / "out"));
}

TEST_F(SegmentStoreTest, UnwritableDirectoryReportsFailure) {
    fs::create_directories(dir);
    const fs::path blocker = dir / "blocker";
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    SegmentStore::Config c = config(true);
    c.outputDir = (blocker / "nested").string();
    SegmentStore store(c);

    bool ok = true;
    EXPECT_NO_THROW(ok = store.persist(makeSegment(2)));
    EXPECT_FALSE(ok);
}
