#include "BPE_Mode.hpp"
#include "BPE_Exceptions.hpp"

using namespace BPE;

//===================================================================================================================//

ModeType Mode::nameToType(const std::string& name) {
  auto it = modeMap.find(name);

  if (it != modeMap.end()) {
    return it->second;
  }

  throw ConfigurationError("unknown mode '" + name + "'");
}

//===================================================================================================================//

std::string Mode::typeToName(const ModeType& modeType) {
  for (const auto& pair : modeMap) {
    if (pair.second == modeType) {
      return pair.first;
    }
  }

  return "unknown";
}

//===================================================================================================================//
