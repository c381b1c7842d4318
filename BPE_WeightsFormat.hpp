#ifndef BPE_WEIGHTSFORMAT_HPP
#define BPE_WEIGHTSFORMAT_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace BPE {
  enum class WeightsFormat {
    NONE,
    TENSOR_V1,  // [{"data": [...], "shape": [...]}, ...] one record per parameter tensor
    NATIVE_V1   // {"weights": [[...], ...], "biases": [...]} one flat array per layer
  };

  const std::unordered_map<std::string, WeightsFormat> weightsFormatMap = {
    {"none", WeightsFormat::NONE},
    {"tensor-v1", WeightsFormat::TENSOR_V1},
    {"native-v1", WeightsFormat::NATIVE_V1},
  };

  // Weights as persisted on a Model. The format tag is authoritative; payloads are never sniffed.
  struct SerializedWeights {
    WeightsFormat format = WeightsFormat::NONE;
    nlohmann::ordered_json payload;

    bool empty() const { return this->format == WeightsFormat::NONE || this->payload.is_null(); }
  };

  class WeightsFormats
  {
    public:
      static WeightsFormat nameToType(const std::string& name);
      static std::string typeToName(const WeightsFormat& weightsFormat);
  };
}

//===================================================================================================================//

#endif // BPE_WEIGHTSFORMAT_HPP
