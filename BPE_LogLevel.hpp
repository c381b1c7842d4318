#ifndef BPE_LOGLEVEL_HPP
#define BPE_LOGLEVEL_HPP

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace BPE {
  enum class LogLevel : int {
    QUIET   = 0,
    ERROR   = 1,
    WARNING = 2,
    INFO    = 3,
    DEBUG   = 4
  };

  const std::unordered_map<std::string, LogLevel> logLevelMap = {
    {"quiet", LogLevel::QUIET},
    {"error", LogLevel::ERROR},
    {"warning", LogLevel::WARNING},
    {"info", LogLevel::INFO},
    {"debug", LogLevel::DEBUG},
  };

  class LogLevels
  {
    public:
      static LogLevel nameToType(const std::string& name);
      static std::string typeToName(const LogLevel& logLevel);
  };
}

//===================================================================================================================//

#endif // BPE_LOGLEVEL_HPP
