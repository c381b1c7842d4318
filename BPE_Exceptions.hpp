#ifndef BPE_EXCEPTIONS_HPP
#define BPE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

//===================================================================================================================//

namespace BPE {
  class Exception : public std::runtime_error {
    public:
      explicit Exception(const std::string& message) : std::runtime_error(message) {}
  };

  // Mismatched feature lists, unknown enum names, invalid settings.
  class ConfigurationError : public Exception {
    public:
      explicit ConfigurationError(const std::string& message) : Exception("Configuration error: " + message) {}
  };

  class NotFoundError : public Exception {
    public:
      explicit NotFoundError(const std::string& message) : Exception("Not found: " + message) {}
  };

  class BackendError : public Exception {
    public:
      explicit BackendError(const std::string& message) : Exception("Backend error: " + message) {}
  };

  class TrainingCancelled : public Exception {
    public:
      TrainingCancelled() : Exception("cancelled") {}
  };

  class PersistenceError : public Exception {
    public:
      explicit PersistenceError(const std::string& message) : Exception("Persistence error: " + message) {}
  };
}

//===================================================================================================================//

#endif // BPE_EXCEPTIONS_HPP
