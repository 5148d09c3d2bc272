#include <gtest/gtest.h>
#include "encoding.h"
#include <string>
#include <vector>

namespace pyexec {
namespace {

TEST(EncodingTest, Base64KnownVectors) {
    EXPECT_EQ(Encoding::base64_encode(""), "");
    EXPECT_EQ(Encoding::base64_encode("f"), "Zg==");
    EXPECT_EQ(Encoding::base64_encode("fo"), "Zm8=");
    EXPECT_EQ(Encoding::base64_encode("foo"), "Zm9v");
    EXPECT_EQ(Encoding::base64_encode("foobar"), "Zm9vYmFy");
}

TEST(EncodingTest, Base64DecodeRestoresBinary) {
    std::string binary("\x89PNG\r\n\x1a\n\0\xff", 10);
    std::vector<unsigned char> decoded;

    ASSERT_TRUE(Encoding::base64_decode(Encoding::base64_encode(binary), decoded));
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), binary);
}

TEST(EncodingTest, Base64DecodeLargeInput) {
    // Given: Several hundred kilobytes, well past one BIO read
    std::string data(300 * 1024, '\0');
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = static_cast<char>(i * 31);
    }

    std::vector<unsigned char> decoded;
    ASSERT_TRUE(Encoding::base64_decode(Encoding::base64_encode(data), decoded));
    EXPECT_EQ(decoded.size(), data.size());
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), data);
}

TEST(EncodingTest, Base64RejectsMalformedInput) {
    std::vector<unsigned char> out;
    EXPECT_FALSE(Encoding::base64_decode("Zm9", out)) << "Length not a multiple of 4";
    EXPECT_FALSE(Encoding::base64_decode("Zm9*", out)) << "Character outside the alphabet";
    EXPECT_FALSE(Encoding::base64_decode("Z=9v", out)) << "Padding in the middle";
    EXPECT_FALSE(Encoding::base64_decode("Z===", out)) << "Too much padding";
    EXPECT_TRUE(Encoding::base64_decode("", out));
    EXPECT_TRUE(out.empty());
}

TEST(EncodingTest, Base64UrlHasNoPaddingOrUnsafeCharacters) {
    std::string data("\xfb\xff\xfe", 3);
    std::string encoded = Encoding::base64url_encode(data);

    EXPECT_EQ(encoded, "-__-");
    std::string decoded;
    ASSERT_TRUE(Encoding::base64url_decode(encoded, decoded));
    EXPECT_EQ(decoded, data);

    EXPECT_EQ(Encoding::base64url_encode("f"), "Zg");
    ASSERT_TRUE(Encoding::base64url_decode("Zg", decoded));
    EXPECT_EQ(decoded, "f");
}

TEST(EncodingTest, Base64UrlRejectsStandardAlphabet) {
    std::string decoded;
    EXPECT_FALSE(Encoding::base64url_decode("+/8=", decoded));
    EXPECT_FALSE(Encoding::base64url_decode("Z", decoded));
}

TEST(EncodingTest, Utf8PrefixStopsOnCharacterBoundary) {
    // "a" + U+00E9 (2 bytes) + U+20AC (3 bytes)
    std::string text = "a\xc3\xa9\xe2\x82\xac";

    EXPECT_EQ(Encoding::utf8_prefix_length(text, 100), text.size());
    EXPECT_EQ(Encoding::utf8_prefix_length(text, 1), 1u);
    EXPECT_EQ(Encoding::utf8_prefix_length(text, 2), 1u) << "Must not split the 2-byte character";
    EXPECT_EQ(Encoding::utf8_prefix_length(text, 3), 3u);
    EXPECT_EQ(Encoding::utf8_prefix_length(text, 5), 3u) << "Must not split the 3-byte character";
    EXPECT_EQ(Encoding::utf8_prefix_length(text, 0), 0u);
}

} // namespace
} // namespace pyexec
