#include <gtest/gtest.h>
#include "../src/core/JsonUtil.h"
#include "../src/core/Digest.h"
#include <chrono>
#include <string>

namespace bacnet_scan {
namespace jsonutil {

TEST(JsonUtilTest, EscapeLeavesPlainText) {
    EXPECT_EQ(escape(""), "");
    EXPECT_EQ(escape("network 5"), "network 5");
}

TEST(JsonUtilTest, EscapeQuotesAndBackslashes) {
    EXPECT_EQ(escape("AHU \"north\""), "AHU \\\"north\\\"");
    EXPECT_EQ(escape("a\\b"), "a\\\\b");
}

TEST(JsonUtilTest, EscapeControlCharacters) {
    EXPECT_EQ(escape("a\nb\tc"), "a\\nb\\tc");
    EXPECT_EQ(escape(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonUtilTest, TimeFormats) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1714564800));
    EXPECT_EQ(time_to_iso(tp), "2024-05-01T12:00:00Z");
    EXPECT_EQ(time_to_stamp(tp), "20240501T120000Z");
}

}

TEST(DigestTest, KnownVector) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex("").size(), 64u);
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
