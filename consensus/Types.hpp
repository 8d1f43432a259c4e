#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace hl {
namespace consensus {

enum class ConsensusType { POW, POS, HYBRID };

struct Validator {
  constexpr static double INITIAL_REPUTATION = 100;

  std::string address;
  double stake{ 0 };
  double reputation{ INITIAL_REPUTATION };
  bool isActive{ true };
  int64_t lastValidation{ 0 }; // ms, 0 = never

  nlohmann::json toJson() const {
    nlohmann::json j;
    j["address"] = address;
    j["stake"] = stake;
    j["reputation"] = reputation;
    j["isActive"] = isActive;
    j["lastValidation"] = lastValidation;
    return j;
  }
};

} // namespace consensus
} // namespace hl
