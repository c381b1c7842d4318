#include "BPE_FeedbackStore.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_Utils.hpp"

#include <QDebug>

#include <cmath>

using namespace BPE;

//===================================================================================================================//

FeedbackStore::FeedbackStore(std::shared_ptr<Repository> repository, ModelRegistry& modelRegistry, ulong minTrainingExamples,
                             LogLevel logLevel)
    : repository(std::move(repository)), modelRegistry(modelRegistry), minTrainingExamples(minTrainingExamples), logLevel(logLevel) {
}

//===================================================================================================================//

Feedback FeedbackStore::submitFeedback(const FeedbackRequest& request) {
  std::optional<Prediction> prediction = this->repository->findPrediction(request.predictionId);

  // Another organisation's prediction is reported exactly like a missing one
  if (!prediction || prediction->organisationId != request.organisationId) {
    throw NotFoundError("prediction " + request.predictionId);
  }

  if (request.correctedScore && !(std::isfinite(*request.correctedScore) && *request.correctedScore >= 0 && *request.correctedScore <= 100)) {
    throw ConfigurationError("corrected score must be within [0, 100]");
  }

  Feedback feedback;
  feedback.id = Utils::generateId();
  feedback.organisationId = request.organisationId;
  feedback.predictionId = request.predictionId;
  feedback.modelId = prediction->modelId;
  feedback.feedbackType = request.feedbackType;
  feedback.correctedScore = request.correctedScore;
  feedback.correctedCategory = request.correctedCategory;
  feedback.notes = request.notes;
  feedback.submittedBy = request.submittedBy;
  feedback.createdAt = Clock::now();

  std::pair<Feedback, bool> stored = this->repository->insertFeedbackUnique(feedback);

  if (!stored.second) {
    if (this->logLevel >= LogLevel::INFO) {
      qInfo() << "duplicate feedback ignored prediction=" << QString::fromStdString(request.predictionId)
              << "existing=" << QString::fromStdString(stored.first.id);
    }

    return stored.first;
  }

  this->modelRegistry.recordFeedback(prediction->modelId, request.feedbackType);

  if (this->logLevel >= LogLevel::INFO) {
    qInfo() << "feedback recorded id=" << QString::fromStdString(stored.first.id)
            << "prediction=" << QString::fromStdString(request.predictionId) << "model=" << QString::fromStdString(prediction->modelId)
            << "type=" << QString::fromStdString(Enums::toName(request.feedbackType));
  }

  return stored.first;
}

//===================================================================================================================//

ModelMetrics FeedbackStore::getModelMetrics(const std::string& organisationId, PredictionType predictionType) {
  Model model = this->modelRegistry.getOrCreate(organisationId, predictionType);

  ModelMetrics metrics;
  metrics.modelId = model.id;
  metrics.status = model.status;
  metrics.trainingAccuracy = model.trainingAccuracy;
  metrics.lastTrainedAt = model.lastTrainedAt;
  metrics.totalPredictions = this->repository->countPredictions(model.id);

  for (const Feedback& feedback : this->repository->listFeedbackForModel(model.id)) {
    metrics.feedbackStats.total++;

    switch (feedback.feedbackType) {
      case FeedbackType::CORRECT:
        metrics.feedbackStats.correct++;
        break;
      case FeedbackType::INCORRECT:
        metrics.feedbackStats.incorrect++;
        break;
      case FeedbackType::PARTIALLY_CORRECT:
        metrics.feedbackStats.partiallyCorrect++;
        break;
    }
  }

  metrics.correctPredictions = metrics.feedbackStats.correct;

  ulong judged = metrics.feedbackStats.correct + metrics.feedbackStats.incorrect;

  if (judged > 0) {
    metrics.accuracy = static_cast<double>(metrics.feedbackStats.correct) / static_cast<double>(judged);
  } else if (model.trainingAccuracy) {
    metrics.accuracy = *model.trainingAccuracy / 100.0;
  }

  metrics.trainingReady = metrics.feedbackStats.total >= this->minTrainingExamples;
  metrics.recentTrainingRuns = this->repository->listTrainingRuns(model.id, recentRunsLimit);

  return metrics;
}

//===================================================================================================================//
