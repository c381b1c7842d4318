#ifndef BPE_MEMORYREPOSITORY_HPP
#define BPE_MEMORYREPOSITORY_HPP

#include "BPE_Repository.hpp"

#include <QReadWriteLock>

#include <nlohmann/json.hpp>

//===================================================================================================================//

namespace BPE {
  // Tables held in insertion order behind one read-write lock. Snapshots are plain JSON documents.
  class MemoryRepository : public Repository
  {
    public:
      MemoryRepository() = default;

      //-- Models --//
      Model getOrCreateActiveModel(const std::string& organisationId, PredictionType predictionType,
                                   const std::function<Model()>& factory) override;
      std::optional<Model> findActiveModel(const std::string& organisationId, PredictionType predictionType) const override;
      std::optional<Model> findModel(const std::string& modelId) const override;
      Model updateModel(const std::string& modelId, const Mutator<Model>& mutator) override;

      //-- Predictions --//
      void insertPrediction(const Prediction& prediction) override;
      std::optional<Prediction> findPrediction(const std::string& predictionId) const override;
      Prediction updatePrediction(const std::string& predictionId, const Mutator<Prediction>& mutator) override;
      std::vector<Prediction> listPredictions(const std::string& organisationId, ulong limit, bool includeTest) const override;
      ulong countPredictions(const std::string& modelId) const override;

      //-- Feedback --//
      std::pair<Feedback, bool> insertFeedbackUnique(const Feedback& feedback) override;
      std::vector<Feedback> listFeedbackForModel(const std::string& modelId) const override;
      std::vector<Feedback> listUnusedFeedback(const std::string& modelId, ulong limit) const override;

      //-- Training runs --//
      void insertTrainingRun(const TrainingRun& trainingRun) override;
      std::optional<TrainingRun> findTrainingRun(const std::string& runId) const override;
      TrainingRun updateTrainingRun(const std::string& runId, const Mutator<TrainingRun>& mutator) override;
      std::vector<TrainingRun> listTrainingRuns(const std::string& modelId, ulong limit) const override;

      //-- Training commit --//
      Model commitTraining(const std::string& modelId, const Mutator<Model>& modelMutator, const std::vector<std::string>& feedbackIds,
                           const std::string& runId, const Mutator<TrainingRun>& runMutator) override;

      //-- Snapshots --//
      nlohmann::ordered_json toJson() const;
      void fromJson(const nlohmann::ordered_json& json);

      void save(const std::string& filePath) const;
      void load(const std::string& filePath);

    private:
      mutable QReadWriteLock lock;

      std::vector<Model> models;
      std::vector<Prediction> predictions;
      std::vector<Feedback> feedbacks;
      std::vector<TrainingRun> trainingRuns;
  };
}

//===================================================================================================================//

#endif // BPE_MEMORYREPOSITORY_HPP
