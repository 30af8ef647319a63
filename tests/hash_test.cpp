/**
 * @file hash_test.cpp
 * @brief Unit tests for SHA-256 hashing and password verification
 *
 * Tests HashUtils class for SHA-256 hash computation,
 * hash comparison, hex string conversion and salted password hashes.
 *
 * (c) 2026 Wharf Project
 * Licensed under MIT License
 */

#include "wharf/HashUtils.h"
#include "wharf/config.h"
#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <vector>

using namespace Wharf;

//=============================================================================
// Test Fixtures
//=============================================================================

/**
 * @brief Test fixture for HashUtils tests
 */
class HashUtilsTest : public ::testing::Test {
protected:
    unsigned char testHash[HASH_SIZE];
    std::string testHexString;

    void SetUp() override {
        std::memset(testHash, 0, HASH_SIZE);

        // Known SHA-256 hash for "Hello, World!"
        testHexString = "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f";
    }
};

//=============================================================================
// Hash String Conversion Tests
//=============================================================================

/**
 * @test hashToString converts 32-byte hash to 64-character hex string
 */
TEST_F(HashUtilsTest, HashToStringConverts32BytesTo64HexChars) {
    std::string result = HashUtils::hashToString(testHash);

    EXPECT_EQ(result.length(), HASH_SIZE * 2);
    EXPECT_EQ(result, std::string(64, '0'));
}

/**
 * @test hashToString produces correct hex representation
 */
TEST_F(HashUtilsTest, HashToStringProducesCorrectHex) {
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        testHash[i] = static_cast<unsigned char>(i);
    }

    std::string result = HashUtils::hashToString(testHash);

    EXPECT_EQ(result.substr(0, 2), "00");
    EXPECT_EQ(result.substr(2, 2), "01");
    EXPECT_EQ(result.substr(62, 2), "1f");
}

/**
 * @test stringToHash accepts either case
 */
TEST_F(HashUtilsTest, StringToHashAcceptsBothCases) {
    unsigned char result[HASH_SIZE];

    ASSERT_TRUE(HashUtils::stringToHash("ff" + std::string(60, '0') + "FF", result));
    EXPECT_EQ(result[0], 0xFF);
    EXPECT_EQ(result[31], 0xFF);
}

/**
 * @test stringToHash rejects bad characters and wrong lengths
 */
TEST_F(HashUtilsTest, StringToHashRejectsInvalidInput) {
    unsigned char result[HASH_SIZE];
    EXPECT_FALSE(HashUtils::stringToHash("xyz" + std::string(61, '0'), result));
    EXPECT_FALSE(HashUtils::stringToHash(std::string(62, '0'), result));
    EXPECT_FALSE(HashUtils::stringToHash(std::string(66, '0'), result));
}

//=============================================================================
// Hash Comparison Tests
//=============================================================================

TEST_F(HashUtilsTest, CompareHashesDetectsFirstAndLastByteDifferences) {
    unsigned char hash1[HASH_SIZE];
    unsigned char hashFirstDiff[HASH_SIZE];
    unsigned char hashLastDiff[HASH_SIZE];
    std::memset(hash1, 0x42, HASH_SIZE);
    std::memset(hashFirstDiff, 0x42, HASH_SIZE);
    std::memset(hashLastDiff, 0x42, HASH_SIZE);

    hashFirstDiff[0] = 0x00;
    hashLastDiff[31] = 0x00;

    EXPECT_TRUE(HashUtils::compareHashes(hash1, hash1));
    EXPECT_FALSE(HashUtils::compareHashes(hash1, hashFirstDiff));
    EXPECT_FALSE(HashUtils::compareHashes(hash1, hashLastDiff));
    EXPECT_FALSE(HashUtils::compareHashes(hash1, nullptr));
}

//=============================================================================
// Buffer Hashing Tests
//=============================================================================

/**
 * @test computeBufferHash computes correct SHA-256 for empty buffer
 */
TEST_F(HashUtilsTest, ComputeBufferHashComputesEmptyBuffer) {
    std::vector<unsigned char> result = HashUtils::computeBufferHash(nullptr, 0);

    ASSERT_EQ(result.size(), HASH_SIZE);
    EXPECT_EQ(HashUtils::hashToString(result.data()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

/**
 * @test computeBufferHash computes correct SHA-256 for small buffer
 */
TEST_F(HashUtilsTest, ComputeBufferHashComputesSmallBuffer) {
    std::string testData = "Hello, World!";
    std::vector<unsigned char> result = HashUtils::computeBufferHash(
        reinterpret_cast<const uint8_t*>(testData.data()), testData.size());

    ASSERT_EQ(result.size(), HASH_SIZE);
    EXPECT_EQ(HashUtils::hashToString(result.data()), testHexString);
}

//=============================================================================
// Password Tests
//=============================================================================

/**
 * @test hashPassword is SHA-256 over salt then password
 */
TEST_F(HashUtilsTest, HashPasswordPrependsSalt) {
    EXPECT_EQ(HashUtils::hashPassword("a1b2", "secret"),
              "7aa963eee05fa1722b603b8b0668dd7fa777e3ee2f12cfc447808cd2a9587529");
}

TEST_F(HashUtilsTest, VerifyPasswordMatchesOnlyCorrectPassword) {
    const std::string stored = HashUtils::hashPassword("a1b2", "secret");

    EXPECT_TRUE(HashUtils::verifyPassword("a1b2", "secret", stored));
    EXPECT_FALSE(HashUtils::verifyPassword("a1b2", "Secret", stored));
    EXPECT_FALSE(HashUtils::verifyPassword("a1b3", "secret", stored));
    EXPECT_FALSE(HashUtils::verifyPassword("a1b2", "secret", "not-hex"));
}

TEST_F(HashUtilsTest, GenerateSaltProducesDistinctHex) {
    std::string salt1;
    std::string salt2;
    std::string errorMsg;

    ASSERT_TRUE(HashUtils::generateSalt(16, salt1, errorMsg)) << errorMsg;
    ASSERT_TRUE(HashUtils::generateSalt(16, salt2, errorMsg)) << errorMsg;

    EXPECT_EQ(salt1.size(), 32u);
    EXPECT_NE(salt1, salt2);
    EXPECT_EQ(salt1.find_first_not_of("0123456789abcdef"), std::string::npos);
}
