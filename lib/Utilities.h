#ifndef HL_LEDGER_UTILITIES_H
#define HL_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace hl {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in milliseconds since the epoch
 */
int64_t getCurrentTimeMillis();

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Parsed JSON object or error
 */
hl::Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Parse and validate a JSON request string.
 * The request must be an object with a string "type" field.
 */
hl::Roe<nlohmann::json> parseJsonRequest(const std::string &request);

/**
 * Compute SHA-256 hash using the OpenSSL EVP API
 * @param input Input string to hash
 * @return Lowercase hexadecimal representation of the digest
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Compute HMAC-SHA-256 using Libsodium
 * @param key Secret key (any length)
 * @param message Message to authenticate
 * @return Lowercase hexadecimal representation of the 32-byte tag
 */
std::string hmacSha256(const std::string &key, const std::string &message);

/**
 * Random string of base-36 characters ([0-9a-z]) from the Libsodium CSPRNG
 */
std::string randomBase36(size_t length);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

} // namespace utl
} // namespace hl

#endif // HL_LEDGER_UTILITIES_H
