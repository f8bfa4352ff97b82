#include <gtest/gtest.h>
#include "common/crypto.hpp"
#include "common/errors.hpp"
#include "test_util.hpp"

using crypto::CryptoEngine;
using crypto::Password;

namespace {

Password pw(const char* s) { return Password(std::string(s)); }

} // namespace

class CryptoTest : public ::testing::Test {
protected:
    CryptoEngine engine{testutil::TEST_ITERATIONS};
};

TEST_F(CryptoTest, SameTextTwiceGivesDifferentCiphertexts) {
    Password p = pw("password123");
    auto a = engine.encrypt("secret", p);
    auto b = engine.encrypt("secret", p);

    EXPECT_NE(a.salt, b.salt);
    EXPECT_NE(a.iv, b.iv);
    EXPECT_NE(a.ciphertext, b.ciphertext);
    EXPECT_NE(CryptoEngine::encode_for_transport(a), CryptoEngine::encode_for_transport(b));

    EXPECT_EQ(engine.decrypt(a, p), "secret");
    EXPECT_EQ(engine.decrypt(b, p), "secret");
}

TEST_F(CryptoTest, CiphertextIsPaddedToBlockSize) {
    Password p = pw("password123");
    EXPECT_EQ(engine.encrypt("", p).ciphertext.size(), 16u);
    EXPECT_EQ(engine.encrypt("0123456789abcdef", p).ciphertext.size(), 32u);
    EXPECT_EQ(engine.encrypt("short", p).ciphertext.size(), 16u);
}

TEST_F(CryptoTest, RoundTripUnicodeAndEmpty) {
    Password p = pw("correct horse");
    for (const std::string s : {std::string(""), std::string("line\n"),
                                std::string("caf\xC3\xA9 \xF0\x9F\x98\x80\n"),
                                std::string(5000, 'z')}) {
        EXPECT_EQ(engine.decrypt(engine.encrypt(s, p), p), s);
    }
}

TEST_F(CryptoTest, WrongPasswordRaisesDecryptionError) {
    Password right = pw("password123");
    Password wrong = pw("password124");
    for (int i = 0; i < 5; ++i) {
        auto blob = engine.encrypt("secret data that must stay secret\n", right);
        EXPECT_THROW(engine.decrypt(blob, wrong), DecryptionError);
    }
}

TEST_F(CryptoTest, BadCiphertextLengthIsFormatError) {
    Password p = pw("password123");
    auto blob = engine.encrypt("secret", p);
    blob.ciphertext.pop_back();
    EXPECT_THROW(engine.decrypt(blob, p), FormatError);
    blob.ciphertext.clear();
    EXPECT_THROW(engine.decrypt(blob, p), FormatError);
}

TEST_F(CryptoTest, TransportLayoutIsSaltIvCiphertext) {
    Password p = pw("password123");
    auto blob = engine.encrypt("hello", p);
    std::string text = CryptoEngine::encode_for_transport(blob);

    std::vector<u8> raw = base64::decode(text);
    ASSERT_EQ(raw.size(), 16u + 16u + blob.ciphertext.size());
    EXPECT_TRUE(std::equal(blob.salt.begin(), blob.salt.end(), raw.begin()));
    EXPECT_TRUE(std::equal(blob.iv.begin(), blob.iv.end(), raw.begin() + 16));

    auto back = CryptoEngine::decode_from_transport(text);
    EXPECT_EQ(back.salt, blob.salt);
    EXPECT_EQ(back.iv, blob.iv);
    EXPECT_EQ(back.ciphertext, blob.ciphertext);
    EXPECT_EQ(engine.decrypt(back, p), "hello");
}

TEST(CryptoTransport, ShortOrInvalidPayloadRejected) {
    // 31 bytes of zeros
    std::vector<u8> short_raw(31, 0);
    std::string short_text = base64::encode(short_raw.data(), short_raw.size());
    EXPECT_THROW(CryptoEngine::decode_from_transport(short_text), FormatError);
    EXPECT_THROW(CryptoEngine::decode_from_transport("not*base64"), FormatError);
    EXPECT_THROW(CryptoEngine::decode_from_transport("abc"), FormatError);
    EXPECT_THROW(CryptoEngine::decode_from_transport(""), FormatError);
}

TEST(Base64, KnownVectors) {
    auto enc = [](const std::string& s) {
        return base64::encode(reinterpret_cast<const u8*>(s.data()), s.size());
    };
    auto dec = [](const std::string& s) {
        std::vector<u8> v = base64::decode(s);
        return std::string(v.begin(), v.end());
    };
    EXPECT_EQ(enc(""), "");
    EXPECT_EQ(enc("f"), "Zg==");
    EXPECT_EQ(enc("fo"), "Zm8=");
    EXPECT_EQ(enc("foo"), "Zm9v");
    EXPECT_EQ(enc("foobar"), "Zm9vYmFy");
    EXPECT_EQ(dec("Zg=="), "f");
    EXPECT_EQ(dec("Zm8="), "fo");
    EXPECT_EQ(dec("Zm9v\nYmFy"), "foobar");
    EXPECT_THROW(base64::decode("Zm=v"), FormatError);
}

TEST(Password, MoveWipesSource) {
    Password a = pw("hunter22hunter");
    Password b(std::move(a));
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(b.str(), "hunter22hunter");
    b.clear();
    EXPECT_TRUE(b.empty());
}

TEST(Password, MinimumLengthInCodePoints) {
    EXPECT_THROW(crypto::validate_new_password(pw("short")), InputError);
    EXPECT_THROW(crypto::validate_new_password(pw("1234567")), InputError);
    EXPECT_NO_THROW(crypto::validate_new_password(pw("12345678")));
    // 8 two-byte characters
    EXPECT_NO_THROW(crypto::validate_new_password(
        pw("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9")));
    // 4 two-byte characters: 8 bytes but 4 characters
    EXPECT_THROW(crypto::validate_new_password(pw("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9")), InputError);
}

TEST(CryptoEngineConfig, RejectsNonPositiveIterations) {
    EXPECT_THROW(CryptoEngine(0), std::invalid_argument);
}
