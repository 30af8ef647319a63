/**
 * @file HashUtils.cpp
 * @brief SHA-256 password hashing using the OpenSSL EVP API
 */

#include "wharf/HashUtils.h"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cctype>
#include <sstream>
#include <iomanip>

namespace Wharf {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string bytesToHex(const unsigned char* data, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(data[i]);
    }
    return oss.str();
}

}  // namespace

//=============================================================================
// Static Methods
//=============================================================================

std::vector<unsigned char> HashUtils::computeBufferHash(const uint8_t* data,
                                                         size_t size)
{
    std::vector<unsigned char> hash(HASH_SIZE);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return hash;  // Zeroed hash on error; never matches a stored one
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1) {
        if (data && size > 0) {
            EVP_DigestUpdate(ctx, data, size);
        }
        unsigned int hashLen = 0;
        EVP_DigestFinal_ex(ctx, hash.data(), &hashLen);
    }

    EVP_MD_CTX_free(ctx);
    return hash;
}

std::string HashUtils::hashToString(const unsigned char* hash)
{
    if (!hash) {
        return "";
    }
    return bytesToHex(hash, HASH_SIZE);
}

bool HashUtils::stringToHash(const std::string& hexString,
                              unsigned char* hash)
{
    if (!hash || hexString.length() != HASH_SIZE * 2) {
        return false;
    }

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        const int hi = hexValue(hexString[i * 2]);
        const int lo = hexValue(hexString[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        hash[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return true;
}

bool HashUtils::compareHashes(const unsigned char* hash1,
                               const unsigned char* hash2)
{
    if (!hash1 || !hash2) {
        return false;
    }

    int result = 0;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        result |= hash1[i] ^ hash2[i];
    }
    return result == 0;
}

std::string HashUtils::hashPassword(const std::string& salt,
                                    const std::string& password)
{
    const std::string material = salt + password;
    const std::vector<unsigned char> hash =
        computeBufferHash(reinterpret_cast<const uint8_t*>(material.data()), material.size());
    return hashToString(hash.data());
}

bool HashUtils::verifyPassword(const std::string& salt,
                               const std::string& password,
                               const std::string& storedHex)
{
    unsigned char expected[HASH_SIZE];
    if (!stringToHash(storedHex, expected)) {
        return false;
    }

    const std::string material = salt + password;
    const std::vector<unsigned char> actual =
        computeBufferHash(reinterpret_cast<const uint8_t*>(material.data()), material.size());
    return compareHashes(actual.data(), expected);
}

bool HashUtils::generateSalt(size_t bytes, std::string& salt, std::string& errorMsg)
{
    std::vector<unsigned char> buffer(bytes);
    if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(bytes)) != 1) {
        errorMsg = "RAND_bytes failed";
        return false;
    }
    salt = bytesToHex(buffer.data(), buffer.size());
    return true;
}

}  // namespace Wharf
