#include "assetcat/hasher.h"
#include "assetcat/errors.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

namespace fs = std::filesystem;
using namespace assetcat::hasher;

namespace {

fs::path temp_file(const std::vector<uint8_t>& data) {
    std::random_device rd;
    auto p = fs::temp_directory_path() / ("assetcat-hasher-" + std::to_string(rd()) + ".bin");
    std::ofstream out(p, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return p;
}

std::vector<uint8_t> pattern(size_t n, uint8_t seed) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>((i * 31 + seed) & 0xff);
    return v;
}

} // namespace

TEST(Hasher, PartialHashKnownValues) {
    // MD5("0") for an empty buffer; MD5("abc3") for "abc".
    std::vector<uint8_t> empty;
    EXPECT_EQ(partial_hash(empty), "cfcd208495d565ef66e7dff9f98764da");
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    EXPECT_EQ(partial_hash(abc), "8a8b3aea9e3ca257a31cf91db6d6ba12");
}

TEST(Hasher, FullHashKnownValues) {
    std::vector<uint8_t> empty;
    EXPECT_EQ(full_hash(empty), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    EXPECT_EQ(full_hash(abc), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Hasher, FileAndBufferFormsAgree) {
    // Sizes around the 64 KiB / 128 KiB boundaries.
    for (size_t n : {size_t{0}, size_t{10}, chunk_size, chunk_size + 1,
                     chunk_size * 2, chunk_size * 2 + 1, chunk_size * 5 + 17}) {
        auto data = pattern(n, 7);
        auto p = temp_file(data);
        EXPECT_EQ(partial_hash(p), partial_hash(data)) << n;
        EXPECT_EQ(full_hash(p), full_hash(data)) << n;
        fs::remove(p);
    }
}

TEST(Hasher, PartialHashIgnoresMiddleOfLargeFiles) {
    auto a = pattern(chunk_size * 4, 1);
    auto b = a;
    b[chunk_size * 2] ^= 0xff; // differs only in the unsampled middle
    EXPECT_EQ(partial_hash(a), partial_hash(b));
    EXPECT_NE(full_hash(a), full_hash(b));
}

TEST(Hasher, PartialHashCoversTailAndSize) {
    auto a = pattern(chunk_size * 3, 1);
    auto b = a;
    b.back() ^= 0x01;
    EXPECT_NE(partial_hash(a), partial_hash(b));

    auto c = a;
    c.push_back(0);
    EXPECT_NE(partial_hash(a), partial_hash(c));
}

TEST(Hasher, MissingFileThrowsIOError) {
    auto p = fs::temp_directory_path() / "assetcat-hasher-does-not-exist.bin";
    EXPECT_THROW(partial_hash(p), assetcat::IOError);
    EXPECT_THROW(full_hash(p), assetcat::IOError);
}

TEST(Hasher, StreamingFormsMatchBufferForms) {
    for (size_t n : {size_t{0}, size_t{5}, chunk_size, chunk_size + 3,
                     chunk_size * 2, chunk_size * 2 + 1, chunk_size * 7 + 11}) {
        auto data = pattern(n, 3);
        PartialHasher ph(n);
        FullHasher fh;
        // Odd-sized pieces straddle both sampled ranges.
        for (size_t at = 0; at < n;) {
            size_t step = std::min<size_t>(n - at, 4099);
            ph.update(data.data() + at, step);
            fh.update(data.data() + at, step);
            at += step;
        }
        EXPECT_EQ(ph.finish(), partial_hash(data)) << n;
        EXPECT_EQ(fh.finish(), full_hash(data)) << n;
    }
}

TEST(Hasher, StreamingPartialHashRejectsWrongLength) {
    auto data = pattern(100, 1);
    PartialHasher ph(99);
    ph.update(data.data(), data.size());
    EXPECT_THROW(ph.finish(), assetcat::IOError);
}
