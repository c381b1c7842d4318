#include "BPE_Engine.hpp"
#include "BPE_Exceptions.hpp"

#include <QDebug>

using namespace BPE;

//===================================================================================================================//

Engine::Engine(StatisticalScorer& scorer, EntityDirectory& directory, const EngineConfig& engineConfig,
               std::shared_ptr<MemoryRepository> repository)
    : engineConfig(engineConfig),
      repository(repository ? std::move(repository) : std::make_shared<MemoryRepository>()),
      modelCache(std::make_shared<ModelCache>(engineConfig.logLevel)),
      modelRegistry(this->repository, engineConfig),
      predictionService(this->repository, this->modelRegistry, scorer, directory, engineConfig, this->modelCache),
      feedbackStore(this->repository, this->modelRegistry, engineConfig.minTrainingExamples, engineConfig.logLevel),
      trainingOrchestrator(this->repository, this->modelRegistry, scorer, directory, engineConfig, this->modelCache) {
}

//===================================================================================================================//

Prediction Engine::predictBreach(const std::string& entityId, const std::string& organisationId, bool isTest) {
  return this->predictionService.predictBreach(entityId, organisationId, isTest);
}

//===================================================================================================================//

std::vector<Prediction> Engine::predictBatch(const std::vector<std::string>& entityIds, const std::string& organisationId) {
  return this->predictionService.predictBatch(entityIds, organisationId);
}

//===================================================================================================================//

std::vector<Prediction> Engine::runTestPredictions(const std::string& organisationId, ulong limit) {
  return this->predictionService.runTestPredictions(organisationId, limit);
}

//===================================================================================================================//

FeatureMap Engine::extractFeatures(const std::string& entityId, const std::string& organisationId) const {
  return this->predictionService.extractFeatures(entityId, organisationId);
}

//===================================================================================================================//

Prediction Engine::recordOutcome(const std::string& predictionId, const std::string& actualOutcome,
                                 const std::optional<TimePoint>& actualBreachDate, const std::optional<bool>& wasAccurate) {
  return this->predictionService.recordOutcome(predictionId, actualOutcome, actualBreachDate, wasAccurate);
}

//===================================================================================================================//

std::vector<Prediction> Engine::listPredictions(const std::string& organisationId, ulong limit, bool includeTest) const {
  return this->predictionService.listPredictions(organisationId, limit, includeTest);
}

//===================================================================================================================//

Feedback Engine::submitFeedback(const FeedbackRequest& request) {
  return this->feedbackStore.submitFeedback(request);
}

//===================================================================================================================//

ModelMetrics Engine::getModelMetrics(const std::string& organisationId) {
  return this->feedbackStore.getModelMetrics(organisationId);
}

//===================================================================================================================//

TrainingOutcome Engine::triggerTraining(const std::string& organisationId, const TrainingOverrides& overrides) {
  return this->trainingOrchestrator.triggerTraining(organisationId, overrides);
}

//===================================================================================================================//

QFuture<TrainingOutcome> Engine::startTraining(const std::string& organisationId, const TrainingOverrides& overrides) {
  return this->trainingOrchestrator.startTraining(organisationId, overrides);
}

//===================================================================================================================//

bool Engine::cancelTraining(const std::string& modelId) {
  return this->trainingOrchestrator.cancelTraining(modelId);
}

//===================================================================================================================//

std::vector<TrainingRun> Engine::listTrainingRuns(const std::string& organisationId, ulong limit) const {
  std::optional<Model> model = this->modelRegistry.findActive(organisationId);

  if (!model) {
    return {};
  }

  return this->repository->listTrainingRuns(model->id, limit);
}

//===================================================================================================================//

TrainingRun Engine::getTrainingRun(const std::string& runId) const {
  std::optional<TrainingRun> trainingRun = this->repository->findTrainingRun(runId);

  if (!trainingRun) {
    throw NotFoundError("training run " + runId);
  }

  return *trainingRun;
}

//===================================================================================================================//

Model Engine::updateModelSettings(const std::string& organisationId, const ModelSettings& settings) {
  return this->modelRegistry.updateSettings(organisationId, settings);
}

//===================================================================================================================//

Model Engine::getModel(const std::string& organisationId) {
  return this->modelRegistry.getOrCreate(organisationId);
}

//===================================================================================================================//

void Engine::saveSnapshot(const std::string& filePath) const {
  this->repository->save(filePath);

  if (this->engineConfig.logLevel >= LogLevel::INFO) {
    qInfo() << "snapshot saved path=" << QString::fromStdString(filePath);
  }
}

//===================================================================================================================//

void Engine::loadSnapshot(const std::string& filePath) {
  this->repository->load(filePath);
  this->modelCache->clear();

  if (this->engineConfig.logLevel >= LogLevel::INFO) {
    qInfo() << "snapshot loaded path=" << QString::fromStdString(filePath);
  }
}

//===================================================================================================================//
