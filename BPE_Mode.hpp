#ifndef BPE_MODE_HPP
#define BPE_MODE_HPP

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace BPE {
  // Command-line modes of the bpe tool.
  enum class ModeType {
    PREDICT,
    FEEDBACK,
    TRAIN,
    METRICS,
    SETTINGS,
    FEATURES,
    UNKNOWN
  };

  const std::unordered_map<std::string, ModeType> modeMap = {
    {"predict", ModeType::PREDICT},
    {"feedback", ModeType::FEEDBACK},
    {"train", ModeType::TRAIN},
    {"metrics", ModeType::METRICS},
    {"settings", ModeType::SETTINGS},
    {"features", ModeType::FEATURES},
  };

  class Mode
  {
    public:
      static ModeType nameToType(const std::string& name);
      static std::string typeToName(const ModeType& modeType);
  };
}

//===================================================================================================================//

#endif // BPE_MODE_HPP
