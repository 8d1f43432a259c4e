#include "Utilities.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <openssl/evp.h>
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace hl {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

int64_t getCurrentTimeMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

hl::Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());
  configFile.close();

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return config;
}

hl::Roe<nlohmann::json> parseJsonRequest(const std::string &request) {
  nlohmann::json reqJson;
  try {
    reqJson = nlohmann::json::parse(request);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(1, "Failed to parse request JSON: " + std::string(e.what()));
  }

  if (!reqJson.is_object()) {
    return Error(2, "request must be a JSON object");
  }

  if (!reqJson.contains("type") || !reqJson["type"].is_string()) {
    return Error(3, "missing type field");
  }

  return reqJson;
}

std::string sha256(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  if (EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  EVP_MD_CTX_free(mdctx);

  return hexEncode(std::string(reinterpret_cast<const char *>(hash), hashLen));
}

std::string hmacSha256(const std::string &key, const std::string &message) {
  unsigned char tag[crypto_auth_hmacsha256_BYTES];
  crypto_auth_hmacsha256_state state;

  if (crypto_auth_hmacsha256_init(
          &state, reinterpret_cast<const unsigned char *>(key.data()),
          key.size()) != 0 ||
      crypto_auth_hmacsha256_update(
          &state, reinterpret_cast<const unsigned char *>(message.data()),
          message.size()) != 0 ||
      crypto_auth_hmacsha256_final(&state, tag) != 0) {
    throw std::runtime_error("HMAC-SHA-256 computation failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(tag), sizeof(tag)));
}

std::string randomBase36(size_t length) {
  static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result.push_back(alphabet[randombytes_uniform(36)]);
  }
  return result;
}

std::string hexEncode(const std::string &data) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned char c : data) {
    oss << std::setw(2) << static_cast<int>(c);
  }
  return oss.str();
}

} // namespace utl
} // namespace hl
