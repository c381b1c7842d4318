#ifndef BPE_BACKENDCHAIN_HPP
#define BPE_BACKENDCHAIN_HPP

#include "BPE_LogLevel.hpp"
#include "BPE_ModelCache.hpp"
#include "BPE_Records.hpp"
#include "BPE_Types.hpp"

#include <QThreadPool>

#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

//===================================================================================================================//

namespace BPE {
  using PredictFunction = std::function<double(const Model&, const Input&)>;

  // One named way of producing an ML score. A throw, or a call running past timeoutMs, is a failure.
  struct BackendStrategy {
    std::string name;
    double baseConfidence;
    ulong timeoutMs;  // 0 runs the call inline without a bound
    PredictFunction predict;
  };

  struct ChainResult {
    bool hasResult = false;
    double mlScore = 0;
    double mlConfidence = 0;
    std::string backendName;
    std::vector<std::string> failures;  // "<backend>: <reason>" for every strategy that failed before the result
  };

  // Ordered strategies tried in turn, stopping at the first success. Failures never escape run().
  class BackendChain
  {
    public:
      explicit BackendChain(LogLevel logLevel = LogLevel::ERROR);

      void addStrategy(BackendStrategy strategy);
      const std::vector<BackendStrategy>& getStrategies() const { return this->strategies; }

      ChainResult run(const Model& model, const Input& input, const std::string& entityId) const;

      // min(round(base + accuracy * 0.4 + min(feedbackCount * 2, 20)), 95), accuracy 50 when untrained.
      static double confidenceFor(double baseConfidence, const Model& model);

      // Tensor backend (bounded by primaryTimeoutMs), then native backend, both loaded through the cache.
      static BackendChain makeDefault(std::shared_ptr<ModelCache> modelCache, ulong primaryTimeoutMs,
                                      LogLevel logLevel = LogLevel::ERROR);

      static PredictFunction cachedBackend(std::shared_ptr<ModelCache> modelCache, BackendType backendType);

      static constexpr double tensorBaseConfidence = 40;
      static constexpr double nativeBaseConfidence = 30;

    private:
      std::vector<BackendStrategy> strategies;
      LogLevel logLevel;

      static QThreadPool& inferencePool();
      static double callWithTimeout(const BackendStrategy& strategy, const Model& model, const Input& input);
  };
}

//===================================================================================================================//

#endif // BPE_BACKENDCHAIN_HPP
