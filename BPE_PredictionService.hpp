#ifndef BPE_PREDICTIONSERVICE_HPP
#define BPE_PREDICTIONSERVICE_HPP

#include "BPE_BackendChain.hpp"
#include "BPE_EngineConfig.hpp"
#include "BPE_FeatureExtractor.hpp"
#include "BPE_ModelCache.hpp"
#include "BPE_ModelRegistry.hpp"
#include "BPE_Repository.hpp"
#include "BPE_StatisticalScorer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

//===================================================================================================================//

namespace BPE {
  // Statistical baseline, features, ML fallback chain, blend, persisted Prediction.
  // Safe to call from many threads at once provided the scorer and directory are.
  class PredictionService
  {
    public:
      PredictionService(std::shared_ptr<Repository> repository, ModelRegistry& modelRegistry, StatisticalScorer& scorer,
                        EntityDirectory& directory, const EngineConfig& engineConfig,
                        std::shared_ptr<ModelCache> modelCache = nullptr);

      Prediction predictBreach(const std::string& entityId, const std::string& organisationId, bool isTest = false);

      // At most batchPredictionLimit entities, results in input order.
      std::vector<Prediction> predictBatch(const std::vector<std::string>& entityIds, const std::string& organisationId);

      // Predicts up to min(limit, testPredictionLimit) entities of the organisation, flagged isTest.
      std::vector<Prediction> runTestPredictions(const std::string& organisationId, ulong limit);

      FeatureMap extractFeatures(const std::string& entityId, const std::string& organisationId) const;

      // The only permitted change to a stored Prediction.
      Prediction recordOutcome(const std::string& predictionId, const std::string& actualOutcome,
                               const std::optional<TimePoint>& actualBreachDate = std::nullopt,
                               const std::optional<bool>& wasAccurate = std::nullopt);

      std::vector<Prediction> listPredictions(const std::string& organisationId, ulong limit, bool includeTest) const;

      //-- Collaborators --//
      std::shared_ptr<ModelCache> getModelCache() const { return this->modelCache; }
      const BackendChain& getBackendChain() const { return this->backendChain; }
      void setBackendChain(BackendChain backendChain) { this->backendChain = std::move(backendChain); }

    private:
      std::shared_ptr<Repository> repository;
      ModelRegistry& modelRegistry;
      StatisticalScorer& scorer;
      EntityDirectory& directory;
      EngineConfig engineConfig;
      std::shared_ptr<ModelCache> modelCache;
      FeatureExtractor featureExtractor;
      BackendChain backendChain;

      std::vector<Prediction> predictAll(const std::vector<std::string>& entityIds, const std::string& organisationId, bool isTest);
  };
}

//===================================================================================================================//

#endif // BPE_PREDICTIONSERVICE_HPP
