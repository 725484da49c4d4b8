#include <gtest/gtest.h>

#include <protocol/crypto.hpp>

using namespace tvremote;

TEST(CryptoTest, Base64Encode_Padding) {
    EXPECT_EQ(crypto::base64_encode(std::string_view("")), "");
    EXPECT_EQ(crypto::base64_encode(std::string_view("f")), "Zg==");
    EXPECT_EQ(crypto::base64_encode(std::string_view("fo")), "Zm8=");
    EXPECT_EQ(crypto::base64_encode(std::string_view("foo")), "Zm9v");
    EXPECT_EQ(crypto::base64_encode(std::string_view("tvremote")), "dHZyZW1vdGU=");
}

TEST(CryptoTest, Base64Decode_StripsPadding) {
    auto one = crypto::base64_decode("Zg==");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(std::string(one->begin(), one->end()), "f");

    auto two = crypto::base64_decode("Zm8=");
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(std::string(two->begin(), two->end()), "fo");

    auto three = crypto::base64_decode("Zm9v");
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(std::string(three->begin(), three->end()), "foo");

    auto empty = crypto::base64_decode("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(CryptoTest, Base64Decode_RejectsMalformed) {
    EXPECT_FALSE(crypto::base64_decode("Zg=").has_value());
    EXPECT_FALSE(crypto::base64_decode("Z=g=").has_value());
    EXPECT_FALSE(crypto::base64_decode("Zm9v!A==").has_value());
    EXPECT_FALSE(crypto::base64_decode("Zm 9").has_value());
}
