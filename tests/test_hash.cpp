#include <gtest/gtest.h>
#include "common/hash.hpp"

TEST(Hash, Sha256KnownVectors) {
    EXPECT_EQ(hash::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hash::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Hash, ChunkHashIsDigestPrefix) {
    EXPECT_EQ(hash::chunk_hash("abc"), "ba7816bf8f01cfea");
    EXPECT_EQ(hash::chunk_hash("anything").size(), hash::CHUNK_HASH_CHARS);
    EXPECT_EQ(hash::file_hash("anything").size(), hash::FILE_HASH_CHARS);
}

TEST(Hash, StreamMatchesOneShot) {
    const std::string a = "first line\n", b = "second line\n", c = "third";
    hash::Sha256Stream s;
    s.update(a);
    s.update(b);
    s.update(c);
    s.update("", 0);
    EXPECT_EQ(s.hex_digest(), hash::file_hash(a + b + c));

    s.reset();
    EXPECT_EQ(s.hex_digest(), hash::sha256_hex(""));
}

TEST(Hash, SingleByteFlipChangesChunkHash) {
    std::string body = "The quick brown fox jumps over the lazy dog\n";
    const std::string original = hash::chunk_hash(body);
    for (size_t i = 0; i < body.size(); ++i) {
        std::string flipped = body;
        flipped[i] = (char)(flipped[i] ^ 0x01);
        EXPECT_NE(hash::chunk_hash(flipped), original) << "byte " << i;
    }
}

TEST(Hash, LowerHexValidation) {
    EXPECT_TRUE(hash::is_lower_hex("0123456789abcdef", 16));
    EXPECT_FALSE(hash::is_lower_hex("0123456789ABCDEF", 16));
    EXPECT_FALSE(hash::is_lower_hex("0123456789abcde", 16));
    EXPECT_FALSE(hash::is_lower_hex("0123456789abcdeg", 16));
}

TEST(Hash, Xxh3FingerprintDistinguishesPayloads) {
    EXPECT_EQ(hash::xxh3_128("payload"), hash::xxh3_128(std::string("payload")));
    EXPECT_NE(hash::xxh3_128("payload"), hash::xxh3_128("payloae"));
}
