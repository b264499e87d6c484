// tests/compression_test.cpp
// GZIP helpers: round trip, magic detection, malformed input.

#include <gtest/gtest.h>
#include "atlantis/compression.hpp"

#include <string>

using namespace atlantis;

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(CompressionTest, RoundTripRestoresInput) {
    auto input = bytes_of(R"({"id":"com.example.app-Google_Pixel","messageType":"traffic"})");

    auto compressed = gzip::compress(input);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_NE(*compressed, input);

    auto restored = gzip::decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, input);
}

TEST(CompressionTest, CompressedOutputCarriesGzipMagic) {
    auto compressed = gzip::compress(bytes_of("hello hello hello hello"));
    ASSERT_TRUE(compressed.has_value());
    ASSERT_GE(compressed->size(), 2u);
    EXPECT_EQ((*compressed)[0], 0x1F);
    EXPECT_EQ((*compressed)[1], 0x8B);
    EXPECT_TRUE(gzip::is_compressed(*compressed));
}

TEST(CompressionTest, EmptyInputPassesThrough) {
    std::vector<uint8_t> empty;
    auto compressed = gzip::compress(empty);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_TRUE(compressed->empty());

    auto decompressed = gzip::decompress(empty);
    ASSERT_TRUE(decompressed.has_value());
    EXPECT_TRUE(decompressed->empty());
}

TEST(CompressionTest, IsCompressedRejectsShortAndPlainBuffers) {
    EXPECT_FALSE(gzip::is_compressed(std::vector<uint8_t>{}));
    EXPECT_FALSE(gzip::is_compressed(std::vector<uint8_t>{0x1F}));
    EXPECT_FALSE(gzip::is_compressed(bytes_of("{}")));
    EXPECT_TRUE(gzip::is_compressed(std::vector<uint8_t>{0x1F, 0x8B}));
}

TEST(CompressionTest, DecompressRejectsGarbage) {
    EXPECT_FALSE(gzip::decompress(bytes_of("definitely not gzip")).has_value());
}

TEST(CompressionTest, DecompressRejectsTruncatedStream) {
    std::string text(4096, 'a');
    for (size_t i = 0; i < text.size(); i++) text[i] = static_cast<char>('a' + (i * 7) % 26);

    auto compressed = gzip::compress(bytes_of(text));
    ASSERT_TRUE(compressed.has_value());
    compressed->resize(compressed->size() / 2);

    EXPECT_FALSE(gzip::decompress(*compressed).has_value());
}

TEST(CompressionTest, LargeInputRoundTrips) {
    std::vector<uint8_t> input(3 * 1024 * 1024);
    for (size_t i = 0; i < input.size(); i++) input[i] = static_cast<uint8_t>(i % 251);

    auto compressed = gzip::compress(input);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_LT(compressed->size(), input.size());

    auto restored = gzip::decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, input);
}
