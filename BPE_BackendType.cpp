#include "BPE_BackendType.hpp"
#include "BPE_Exceptions.hpp"

using namespace BPE;

//===================================================================================================================//

BackendType Backends::nameToType(const std::string& name) {
  auto it = backendTypeMap.find(name);

  if (it != backendTypeMap.end()) {
    return it->second;
  }

  throw ConfigurationError("unknown backend type: " + name);
}

//===================================================================================================================//

std::string Backends::typeToName(const BackendType& backendType) {
  for (const auto& pair : backendTypeMap) {
    if (pair.second == backendType) {
      return pair.first;
    }
  }

  throw ConfigurationError("unknown backend type enum value");
}

//===================================================================================================================//
