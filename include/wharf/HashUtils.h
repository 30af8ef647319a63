/**
 * @file HashUtils.h
 * @brief SHA-256 password hashing utilities
 */

#pragma once

#include "config.h"
#include <string>
#include <vector>
#include <cstdint>

namespace Wharf {

/**
 * @class HashUtils
 * @brief SHA-256 helpers used by UserStore to verify passwords
 *
 * Stored passwords are hex(SHA-256(salt || password)). The salt is a
 * per-user random hex string kept next to the hash in the configuration.
 *
 * Thread Safety:
 * - All methods are thread-safe (no shared state)
 * - Uses OpenSSL's EVP digest functions
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 hash of a memory buffer
     * @param data Pointer to the data to hash
     * @param size Size of the data in bytes
     * @return Vector containing the 32-byte hash
     */
    static std::vector<unsigned char> computeBufferHash(const uint8_t* data,
                                                        size_t size);

    /**
     * @brief Convert binary hash to hexadecimal string
     * @param hash Binary hash (must be HASH_SIZE bytes)
     * @return Lowercase hexadecimal string (64 characters)
     */
    static std::string hashToString(const unsigned char* hash);

    /**
     * @brief Convert hexadecimal string to binary hash
     * @param hexString Hexadecimal string (64 characters, any case)
     * @param hash Output buffer (must be at least HASH_SIZE bytes)
     * @return true if successful, false if invalid hex string
     */
    static bool stringToHash(const std::string& hexString,
                            unsigned char* hash);

    /**
     * @brief Compare two hashes for equality
     * @param hash1 First hash (HASH_SIZE bytes)
     * @param hash2 Second hash (HASH_SIZE bytes)
     * @return true if hashes are identical
     *
     * Constant-time comparison to prevent timing attacks.
     */
    static bool compareHashes(const unsigned char* hash1,
                             const unsigned char* hash2);

    /**
     * @brief Hash a password with its salt
     * @return hex(SHA-256(salt || password))
     */
    static std::string hashPassword(const std::string& salt,
                                    const std::string& password);

    /**
     * @brief Check a password against a stored hex hash
     * @param salt Per-user salt
     * @param password Password as sent by the client
     * @param storedHex Expected hex(SHA-256(salt || password))
     * @return true on match; false on mismatch or malformed storedHex
     */
    static bool verifyPassword(const std::string& salt,
                               const std::string& password,
                               const std::string& storedHex);

    /**
     * @brief Generate a random salt
     * @param bytes Number of random bytes (hex string is twice as long)
     * @param salt Output hex string
     * @param errorMsg Output error message if the RNG fails
     * @return true if successful
     */
    static bool generateSalt(size_t bytes, std::string& salt, std::string& errorMsg);
};

}  // namespace Wharf
