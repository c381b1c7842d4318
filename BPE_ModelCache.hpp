#ifndef BPE_MODELCACHE_HPP
#define BPE_MODELCACHE_HPP

#include "BPE_Backend.hpp"
#include "BPE_Records.hpp"

#include <QMutex>

#include <map>
#include <memory>
#include <string>
#include <utility>

//===================================================================================================================//

namespace BPE {
  // Loaded backends keyed by (model id, backend type). An entry is only served while its weights revision
  // matches the model's; invalidate() drops every entry of a model after its weights were swapped.
  class ModelCache
  {
    public:
      explicit ModelCache(LogLevel logLevel = LogLevel::ERROR);

      // Null when the model's weights cannot be loaded by this backend type.
      std::shared_ptr<const Backend> get(const Model& model, BackendType backendType);

      void invalidate(const std::string& modelId);
      void clear();

      ulong size() const;
      ulong getLoadCount() const;

    private:
      struct Entry {
        ulong weightsRevision;
        std::shared_ptr<const Backend> backend;
      };

      mutable QMutex mutex;
      std::map<std::pair<std::string, BackendType>, Entry> entries;
      ulong loadCount = 0;
      LogLevel logLevel;
  };
}

//===================================================================================================================//

#endif // BPE_MODELCACHE_HPP
