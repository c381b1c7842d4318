#ifndef BPE_REPOSITORY_HPP
#define BPE_REPOSITORY_HPP

#include "BPE_Records.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

//===================================================================================================================//

namespace BPE {
  template <typename R>
  using Mutator = std::function<void(R&)>;

  // Persistence boundary. Every method is atomic with respect to the others; records are returned by value.
  // Lists are newest first, except unused feedback which is handed to training oldest first.
  class Repository
  {
    public:
      virtual ~Repository() = default;

      //-- Models --//
      // Returns the active model for the pair, inserting the one built by factory if none exists.
      virtual Model getOrCreateActiveModel(const std::string& organisationId, PredictionType predictionType,
                                           const std::function<Model()>& factory) = 0;
      virtual std::optional<Model> findActiveModel(const std::string& organisationId, PredictionType predictionType) const = 0;
      virtual std::optional<Model> findModel(const std::string& modelId) const = 0;
      virtual Model updateModel(const std::string& modelId, const Mutator<Model>& mutator) = 0;

      //-- Predictions --//
      virtual void insertPrediction(const Prediction& prediction) = 0;
      virtual std::optional<Prediction> findPrediction(const std::string& predictionId) const = 0;
      virtual Prediction updatePrediction(const std::string& predictionId, const Mutator<Prediction>& mutator) = 0;
      virtual std::vector<Prediction> listPredictions(const std::string& organisationId, ulong limit, bool includeTest) const = 0;
      virtual ulong countPredictions(const std::string& modelId) const = 0;

      //-- Feedback --//
      // Inserts unless the prediction already has a feedback with the same submission content.
      // Returns the stored row and whether it was inserted.
      virtual std::pair<Feedback, bool> insertFeedbackUnique(const Feedback& feedback) = 0;
      virtual std::vector<Feedback> listFeedbackForModel(const std::string& modelId) const = 0;
      virtual std::vector<Feedback> listUnusedFeedback(const std::string& modelId, ulong limit) const = 0;

      //-- Training runs --//
      virtual void insertTrainingRun(const TrainingRun& trainingRun) = 0;
      virtual std::optional<TrainingRun> findTrainingRun(const std::string& runId) const = 0;
      virtual TrainingRun updateTrainingRun(const std::string& runId, const Mutator<TrainingRun>& mutator) = 0;
      virtual std::vector<TrainingRun> listTrainingRuns(const std::string& modelId, ulong limit) const = 0;

      //-- Training commit --//
      // Updates the model, marks the feedback used under the run's id and completes the run as one write.
      // Nothing changes unless the model, the open run and every feedback row exist.
      virtual Model commitTraining(const std::string& modelId, const Mutator<Model>& modelMutator,
                                   const std::vector<std::string>& feedbackIds, const std::string& runId,
                                   const Mutator<TrainingRun>& runMutator) = 0;
  };
}

//===================================================================================================================//

#endif // BPE_REPOSITORY_HPP
