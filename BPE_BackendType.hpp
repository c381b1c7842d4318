#ifndef BPE_BACKENDTYPE_HPP
#define BPE_BACKENDTYPE_HPP

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace BPE {
  enum class BackendType {
    TENSOR,
    NATIVE
  };

  const std::unordered_map<std::string, BackendType> backendTypeMap = {
    {"tensor", BackendType::TENSOR},
    {"native", BackendType::NATIVE},
  };

  enum class BackendState {
    UNLOADED,
    LOADED,
    TRAINED
  };

  class Backends
  {
    public:
      static BackendType nameToType(const std::string& name);
      static std::string typeToName(const BackendType& backendType);
  };
}

//===================================================================================================================//

#endif // BPE_BACKENDTYPE_HPP
