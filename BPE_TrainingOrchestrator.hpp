#ifndef BPE_TRAININGORCHESTRATOR_HPP
#define BPE_TRAININGORCHESTRATOR_HPP

#include "BPE_Backend.hpp"
#include "BPE_EngineConfig.hpp"
#include "BPE_FeatureExtractor.hpp"
#include "BPE_ModelCache.hpp"
#include "BPE_ModelRegistry.hpp"
#include "BPE_Repository.hpp"
#include "BPE_StatisticalScorer.hpp"

#include <QFuture>
#include <QMutex>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

//===================================================================================================================//

namespace BPE {
  using BackendFactory = std::function<std::unique_ptr<Backend>(BackendType, const ModelConfig&)>;

  struct TrainingOutcome {
    bool success = false;
    bool alreadyRunning = false;  // Another run holds the model; nothing was started
    std::string modelId;
    std::string runId;
    std::string backendName;
    std::optional<double> accuracy;
    std::optional<double> loss;
    ulong numSamples = 0;
    ulong numFeedbackUsed = 0;
    bool bootstrapped = false;
    EpochHistory epochHistory;
    std::string errorMessage;
  };

  // Retrains the organisation's active model from unconsumed feedback, one run per model at a time.
  class TrainingOrchestrator
  {
    public:
      TrainingOrchestrator(std::shared_ptr<Repository> repository, ModelRegistry& modelRegistry, StatisticalScorer& scorer,
                           EntityDirectory& directory, const EngineConfig& engineConfig, std::shared_ptr<ModelCache> modelCache);

      // Cancels every background run and waits for it to finish.
      ~TrainingOrchestrator();

      // Blocks until the run is terminal.
      TrainingOutcome triggerTraining(const std::string& organisationId, const TrainingOverrides& overrides = TrainingOverrides(),
                                      PredictionType predictionType = PredictionType::BREACH_PROBABILITY);

      // Claims the model before returning, so cancelTraining works as soon as this returns.
      QFuture<TrainingOutcome> startTraining(const std::string& organisationId, const TrainingOverrides& overrides = TrainingOverrides(),
                                             PredictionType predictionType = PredictionType::BREACH_PROBABILITY);

      // Returns false when the model has no run in progress.
      bool cancelTraining(const std::string& modelId);
      bool isTraining(const std::string& modelId) const;

      void setBackendFactory(BackendFactory backendFactory) { this->backendFactory = std::move(backendFactory); }

    private:
      using CancelFlag = std::shared_ptr<std::atomic<bool>>;

      struct TrainingSet {
        Samples samples;
        std::vector<std::string> feedbackIds;  // Every fetched row, usable or not
        ulong numFromFeedback = 0;
        bool bootstrapped = false;
      };

      struct TrainedWeights {
        std::string backendName;
        SerializedWeights weights;
        TrainingResult result;
      };

      std::shared_ptr<Repository> repository;
      ModelRegistry& modelRegistry;
      StatisticalScorer& scorer;
      EntityDirectory& directory;
      EngineConfig engineConfig;
      std::shared_ptr<ModelCache> modelCache;
      FeatureExtractor featureExtractor;
      BackendFactory backendFactory;

      mutable QMutex mutex;
      std::unordered_map<std::string, CancelFlag> runningModels;
      std::vector<QFuture<TrainingOutcome>> backgroundRuns;

      CancelFlag claim(const std::string& modelId);
      void release(const std::string& modelId);

      TrainingOutcome runClaimed(const Model& model, const TrainingOverrides& overrides, const CancelFlag& cancelFlag);

      TrainingSet assembleTrainingSet(const Model& model);
      void bootstrap(const Model& model, TrainingSet& trainingSet);

      TrainedWeights trainWithFallback(const Model& model, const TrainingConfig& trainingConfig, const Samples& samples,
                                       const std::string& runId, const CancelFlag& cancelFlag);
      TrainedWeights trainBackend(BackendType backendType, const Model& model, const TrainingConfig& trainingConfig,
                                  const Samples& samples, const std::string& runId, const CancelFlag& cancelFlag, bool seedFromModel);

      TrainingOutcome alreadyRunning(const Model& model) const;
  };
}

//===================================================================================================================//

#endif // BPE_TRAININGORCHESTRATOR_HPP
