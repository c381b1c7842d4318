#include "BPE_WeightsFormat.hpp"
#include "BPE_Exceptions.hpp"

using namespace BPE;

//===================================================================================================================//

WeightsFormat WeightsFormats::nameToType(const std::string& name) {
  auto it = weightsFormatMap.find(name);

  if (it != weightsFormatMap.end()) {
    return it->second;
  }

  throw ConfigurationError("unknown weights format: " + name);
}

//===================================================================================================================//

std::string WeightsFormats::typeToName(const WeightsFormat& weightsFormat) {
  for (const auto& pair : weightsFormatMap) {
    if (pair.second == weightsFormat) {
      return pair.first;
    }
  }

  throw ConfigurationError("unknown weights format enum value");
}

//===================================================================================================================//
