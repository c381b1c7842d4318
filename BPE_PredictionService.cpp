#include "BPE_PredictionService.hpp"
#include "BPE_BlendingEngine.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_Utils.hpp"

#include <QDebug>
#include <QtConcurrent>

#include <algorithm>
#include <chrono>
#include <exception>
#include <numeric>

using namespace BPE;

//===================================================================================================================//

PredictionService::PredictionService(std::shared_ptr<Repository> repository, ModelRegistry& modelRegistry, StatisticalScorer& scorer,
                                     EntityDirectory& directory, const EngineConfig& engineConfig,
                                     std::shared_ptr<ModelCache> modelCache)
    : repository(std::move(repository)),
      modelRegistry(modelRegistry),
      scorer(scorer),
      directory(directory),
      engineConfig(engineConfig),
      modelCache(modelCache ? std::move(modelCache) : std::make_shared<ModelCache>(engineConfig.logLevel)),
      featureExtractor(scorer, directory, engineConfig.logLevel),
      backendChain(BackendChain::makeDefault(this->modelCache, engineConfig.primaryTimeoutMs, engineConfig.logLevel)) {
}

//===================================================================================================================//

Prediction PredictionService::predictBreach(const std::string& entityId, const std::string& organisationId, bool isTest) {
  Model model = this->modelRegistry.getOrCreate(organisationId, PredictionType::BREACH_PROBABILITY);
  TimePoint now = Clock::now();

  RiskBreakdown riskBreakdown = this->scorer.computeStatisticalScore(entityId, organisationId);
  double statisticalScore = riskBreakdown.overallScore;
  double statisticalConfidence = StatisticalScorer::confidenceFor(riskBreakdown);

  // Reuse the breakdown rather than scoring twice
  FeatureMap features = this->featureExtractor.extract(entityId, organisationId, riskBreakdown, now);

  std::optional<double> mlScore;
  std::optional<double> mlConfidence;
  std::optional<std::string> backendName;

  if (model.hasUsableWeights()) {
    Input input = FeatureExtractor::toVector(features, model.modelConfig.inputFeatures);
    ChainResult chainResult = this->backendChain.run(model, input, entityId);

    if (chainResult.hasResult) {
      mlScore = chainResult.mlScore;
      mlConfidence = chainResult.mlConfidence;
      backendName = chainResult.backendName;
    }
  }

  BlendResult blendResult = BlendingEngine::blend(statisticalScore, statisticalConfidence, mlScore, mlConfidence, now);

  Prediction prediction;
  prediction.id = Utils::generateId();
  prediction.organisationId = organisationId;
  prediction.modelId = model.id;
  prediction.entityId = entityId;
  prediction.predictionType = PredictionType::BREACH_PROBABILITY;
  prediction.statisticalScore = statisticalScore;
  prediction.statisticalConfidence = statisticalConfidence;
  prediction.mlScore = mlScore;
  prediction.mlConfidence = mlConfidence;
  prediction.backendName = backendName;
  prediction.combinedScore = blendResult.combinedScore;
  prediction.combinedConfidence = blendResult.combinedConfidence;
  prediction.riskCategory = blendResult.riskCategory;
  prediction.sourceLabel = blendResult.sourceLabel;
  prediction.daysToBreach = blendResult.daysToBreach;
  prediction.predictedBreachDate = blendResult.predictedBreachDate;
  prediction.inputFeatures = features;
  prediction.isTest = isTest;
  prediction.createdAt = now;
  prediction.expiresAt = now + std::chrono::hours(this->engineConfig.predictionTtlHours);

  this->repository->insertPrediction(prediction);
  this->modelRegistry.recordPrediction(model.id);

  if (this->engineConfig.logLevel >= LogLevel::INFO) {
    qInfo() << "prediction entity=" << QString::fromStdString(entityId) << "model=" << QString::fromStdString(model.id)
            << "score=" << prediction.combinedScore << "category=" << QString::fromStdString(Enums::toName(prediction.riskCategory))
            << "source=" << QString::fromStdString(Enums::toName(prediction.sourceLabel));
  }

  return prediction;
}

//===================================================================================================================//

std::vector<Prediction> PredictionService::predictBatch(const std::vector<std::string>& entityIds, const std::string& organisationId) {
  if (entityIds.empty()) {
    throw ConfigurationError("batch prediction needs at least one entity id");
  }

  ulong count = std::min<ulong>(entityIds.size(), this->engineConfig.batchPredictionLimit);
  std::vector<std::string> selected(entityIds.begin(), entityIds.begin() + count);

  return this->predictAll(selected, organisationId, false);
}

//===================================================================================================================//

std::vector<Prediction> PredictionService::runTestPredictions(const std::string& organisationId, ulong limit) {
  ulong count = std::min(limit, this->engineConfig.testPredictionLimit);

  if (count == 0) {
    return {};
  }

  std::vector<std::string> entityIds = this->directory.listEntities(organisationId, count);

  return this->predictAll(entityIds, organisationId, true);
}

//===================================================================================================================//

FeatureMap PredictionService::extractFeatures(const std::string& entityId, const std::string& organisationId) const {
  return this->featureExtractor.extract(entityId, organisationId);
}

//===================================================================================================================//

Prediction PredictionService::recordOutcome(const std::string& predictionId, const std::string& actualOutcome,
                                            const std::optional<TimePoint>& actualBreachDate, const std::optional<bool>& wasAccurate) {
  return this->repository->updatePrediction(predictionId, [&](Prediction& prediction) {
    prediction.actualOutcome = actualOutcome;
    prediction.actualBreachDate = actualBreachDate;
    prediction.wasAccurate = wasAccurate;
  });
}

//===================================================================================================================//

std::vector<Prediction> PredictionService::listPredictions(const std::string& organisationId, ulong limit, bool includeTest) const {
  return this->repository->listPredictions(organisationId, limit, includeTest);
}

//===================================================================================================================//

std::vector<Prediction> PredictionService::predictAll(const std::vector<std::string>& entityIds, const std::string& organisationId,
                                                      bool isTest) {
  // Create the model up front so parallel predictions all see the same one
  this->modelRegistry.getOrCreate(organisationId, PredictionType::BREACH_PROBABILITY);

  std::vector<Prediction> predictions(entityIds.size());
  std::vector<std::exception_ptr> errors(entityIds.size());

  std::vector<ulong> indices(entityIds.size());
  std::iota(indices.begin(), indices.end(), 0);

  QtConcurrent::blockingMap(indices, [&](ulong index) {
    try {
      predictions[index] = this->predictBreach(entityIds[index], organisationId, isTest);
    } catch (...) {
      errors[index] = std::current_exception();
    }
  });

  for (const std::exception_ptr& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  return predictions;
}

//===================================================================================================================//
