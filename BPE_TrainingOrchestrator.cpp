#include "BPE_TrainingOrchestrator.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_Utils.hpp"

#include <QDebug>
#include <QMutexLocker>
#include <QtConcurrent>

#include <algorithm>
#include <cmath>

using namespace BPE;

//===================================================================================================================//

namespace {
  // Frees the model's training slot however the run ends.
  class ClaimGuard
  {
    public:
      ClaimGuard(std::function<void()> onRelease) : onRelease(std::move(onRelease)) {}
      ~ClaimGuard() { this->onRelease(); }

    private:
      std::function<void()> onRelease;
  };
}

//===================================================================================================================//

TrainingOrchestrator::TrainingOrchestrator(std::shared_ptr<Repository> repository, ModelRegistry& modelRegistry,
                                           StatisticalScorer& scorer, EntityDirectory& directory, const EngineConfig& engineConfig,
                                           std::shared_ptr<ModelCache> modelCache)
    : repository(std::move(repository)),
      modelRegistry(modelRegistry),
      scorer(scorer),
      directory(directory),
      engineConfig(engineConfig),
      modelCache(std::move(modelCache)),
      featureExtractor(scorer, directory, engineConfig.logLevel) {
  LogLevel logLevel = engineConfig.logLevel;

  this->backendFactory = [logLevel](BackendType backendType, const ModelConfig& modelConfig) {
    return Backend::makeBackend(backendType, modelConfig, logLevel);
  };
}

//===================================================================================================================//

TrainingOrchestrator::~TrainingOrchestrator() {
  std::vector<QFuture<TrainingOutcome>> pending;

  {
    QMutexLocker locker(&this->mutex);

    for (auto& pair : this->runningModels) {
      pair.second->store(true);
    }

    pending.swap(this->backgroundRuns);
  }

  if (!pending.empty() && this->engineConfig.logLevel >= LogLevel::INFO) {
    qInfo() << "waiting for background training runs count=" << pending.size();
  }

  for (QFuture<TrainingOutcome>& future : pending) {
    future.waitForFinished();
  }
}

//===================================================================================================================//

TrainingOutcome TrainingOrchestrator::triggerTraining(const std::string& organisationId, const TrainingOverrides& overrides,
                                                      PredictionType predictionType) {
  Model model = this->modelRegistry.getOrCreate(organisationId, predictionType);
  CancelFlag cancelFlag = this->claim(model.id);

  if (!cancelFlag) {
    return this->alreadyRunning(model);
  }

  ClaimGuard guard([this, &model]() { this->release(model.id); });

  return this->runClaimed(model, overrides, cancelFlag);
}

//===================================================================================================================//

QFuture<TrainingOutcome> TrainingOrchestrator::startTraining(const std::string& organisationId, const TrainingOverrides& overrides,
                                                             PredictionType predictionType) {
  Model model = this->modelRegistry.getOrCreate(organisationId, predictionType);
  CancelFlag cancelFlag = this->claim(model.id);

  if (!cancelFlag) {
    TrainingOutcome outcome = this->alreadyRunning(model);

    return QtConcurrent::run([outcome]() { return outcome; });
  }

  QFuture<TrainingOutcome> future = QtConcurrent::run([this, model, overrides, cancelFlag]() {
    ClaimGuard guard([this, &model]() { this->release(model.id); });

    return this->runClaimed(model, overrides, cancelFlag);
  });

  QMutexLocker locker(&this->mutex);

  this->backgroundRuns.erase(std::remove_if(this->backgroundRuns.begin(), this->backgroundRuns.end(),
                                            [](const QFuture<TrainingOutcome>& run) { return run.isFinished(); }),
                             this->backgroundRuns.end());
  this->backgroundRuns.push_back(future);

  return future;
}

//===================================================================================================================//

bool TrainingOrchestrator::cancelTraining(const std::string& modelId) {
  QMutexLocker locker(&this->mutex);

  auto it = this->runningModels.find(modelId);

  if (it == this->runningModels.end()) {
    return false;
  }

  it->second->store(true);

  if (this->engineConfig.logLevel >= LogLevel::INFO) {
    qInfo() << "training cancellation requested model=" << QString::fromStdString(modelId);
  }

  return true;
}

//===================================================================================================================//

bool TrainingOrchestrator::isTraining(const std::string& modelId) const {
  QMutexLocker locker(&this->mutex);

  return this->runningModels.count(modelId) > 0;
}

//===================================================================================================================//

TrainingOrchestrator::CancelFlag TrainingOrchestrator::claim(const std::string& modelId) {
  QMutexLocker locker(&this->mutex);

  if (this->runningModels.count(modelId) > 0) {
    return nullptr;
  }

  CancelFlag cancelFlag = std::make_shared<std::atomic<bool>>(false);
  this->runningModels[modelId] = cancelFlag;

  return cancelFlag;
}

//===================================================================================================================//

void TrainingOrchestrator::release(const std::string& modelId) {
  QMutexLocker locker(&this->mutex);

  this->runningModels.erase(modelId);
}

//===================================================================================================================//

TrainingOutcome TrainingOrchestrator::runClaimed(const Model& model, const TrainingOverrides& overrides, const CancelFlag& cancelFlag) {
  TrainingConfig trainingConfig = overrides.applyTo(model.trainingConfig);

  TrainingRun trainingRun;
  trainingRun.id = Utils::generateId();
  trainingRun.organisationId = model.organisationId;
  trainingRun.modelId = model.id;
  trainingRun.status = ModelStatus::TRAINING;
  trainingRun.trainingConfig = trainingConfig;
  trainingRun.startedAt = Clock::now();

  this->repository->insertTrainingRun(trainingRun);

  TrainingOutcome outcome;
  outcome.modelId = model.id;
  outcome.runId = trainingRun.id;

  if (this->engineConfig.logLevel >= LogLevel::INFO) {
    qInfo() << "training started run=" << QString::fromStdString(trainingRun.id) << "model=" << QString::fromStdString(model.id)
            << "epochs=" << trainingConfig.epochs << "learningRate=" << trainingConfig.learningRate
            << "batchSize=" << trainingConfig.batchSize;
  }

  try {
    ModelRegistry::validateTrainingConfig(trainingConfig);

    TrainingSet trainingSet = this->assembleTrainingSet(model);

    if (trainingSet.samples.empty()) {
      throw Exception("no training examples available");
    }

    ulong numSamples = trainingSet.samples.size();

    this->repository->updateTrainingRun(trainingRun.id, [numSamples](TrainingRun& run) { run.trainingSamples = numSamples; });

    TrainedWeights trained = this->trainWithFallback(model, trainingConfig, trainingSet.samples, trainingRun.id, cancelFlag);
    const TrainingResult& result = trained.result;

    // Weights, consumed feedback and run completion land in one write; the cache entry goes stale right after.
    this->repository->commitTraining(
      model.id,
      [&](Model& target) { ModelRegistry::applyTrainedWeights(target, trained.weights, result, numSamples); },
      trainingSet.feedbackIds,
      trainingRun.id,
      [&](TrainingRun& run) {
        run.status = ModelStatus::ACTIVE;
        run.backendName = trained.backendName;
        run.currentEpoch = result.epochHistory.size();
        run.progress = 100;
        run.trainingSamples = result.numTrainingSamples;
        run.validationSamples = result.numValidationSamples;
        run.finalAccuracy = result.finalAccuracy;
        run.finalLoss = result.finalLoss;
        run.finalValidationAccuracy = result.finalValidationAccuracy;
        run.finalValidationLoss = result.finalValidationLoss;
        run.epochHistory = result.epochHistory;
        run.completedAt = Clock::now();
      });

    this->modelCache->invalidate(model.id);

    outcome.success = true;
    outcome.backendName = trained.backendName;
    outcome.accuracy = result.finalAccuracy;
    outcome.loss = result.finalLoss;
    outcome.numSamples = numSamples;
    outcome.numFeedbackUsed = trainingSet.numFromFeedback;
    outcome.bootstrapped = trainingSet.bootstrapped;
    outcome.epochHistory = result.epochHistory;

    if (this->engineConfig.logLevel >= LogLevel::INFO) {
      qInfo() << "training completed run=" << QString::fromStdString(trainingRun.id) << "model=" << QString::fromStdString(model.id)
              << "backend=" << QString::fromStdString(trained.backendName) << "accuracy=" << result.finalAccuracy
              << "loss=" << result.finalLoss << "samples=" << numSamples;
    }
  } catch (const std::exception& e) {
    std::string errorMessage = e.what();

    this->repository->updateTrainingRun(trainingRun.id, [&errorMessage](TrainingRun& run) {
      run.status = ModelStatus::FAILED;
      run.errorMessage = errorMessage;
      run.completedAt = Clock::now();
    });

    outcome.errorMessage = errorMessage;

    if (this->engineConfig.logLevel >= LogLevel::ERROR) {
      qCritical() << "training failed run=" << QString::fromStdString(trainingRun.id) << "model=" << QString::fromStdString(model.id)
                  << "error=" << QString::fromStdString(errorMessage);
    }
  }

  return outcome;
}

//===================================================================================================================//

TrainingOrchestrator::TrainingSet TrainingOrchestrator::assembleTrainingSet(const Model& model) {
  TrainingSet trainingSet;

  std::vector<Feedback> feedbacks = this->repository->listUnusedFeedback(model.id, this->engineConfig.feedbackLimit);

  for (const Feedback& feedback : feedbacks) {
    trainingSet.feedbackIds.push_back(feedback.id);

    std::optional<Prediction> prediction = this->repository->findPrediction(feedback.predictionId);

    if (!prediction) {
      if (this->engineConfig.logLevel >= LogLevel::WARNING) {
        qWarning() << "feedback skipped, prediction missing feedback=" << QString::fromStdString(feedback.id)
                   << "prediction=" << QString::fromStdString(feedback.predictionId);
      }

      continue;
    }

    double target;

    if (feedback.feedbackType == FeedbackType::CORRECT) {
      target = prediction->statisticalScore;
    } else if (feedback.correctedScore) {
      target = *feedback.correctedScore;
    } else {
      if (this->engineConfig.logLevel >= LogLevel::DEBUG) {
        qDebug() << "feedback skipped, no corrected score feedback=" << QString::fromStdString(feedback.id)
                 << "type=" << QString::fromStdString(Enums::toName(feedback.feedbackType));
      }

      continue;
    }

    try {
      Input input = FeatureExtractor::toVector(prediction->inputFeatures, model.modelConfig.inputFeatures);
      trainingSet.samples.push_back({input, target});
    } catch (const ConfigurationError& e) {
      if (this->engineConfig.logLevel >= LogLevel::WARNING) {
        qWarning() << "feedback skipped, stale feature snapshot feedback=" << QString::fromStdString(feedback.id)
                   << "prediction=" << QString::fromStdString(prediction->id) << "error=" << e.what();
      }
    }
  }

  trainingSet.numFromFeedback = trainingSet.samples.size();

  if (trainingSet.samples.size() < this->engineConfig.minTrainingExamples) {
    this->bootstrap(model, trainingSet);
  }

  if (this->engineConfig.logLevel >= LogLevel::INFO) {
    qInfo() << "training set assembled model=" << QString::fromStdString(model.id)
            << "fromFeedback=" << trainingSet.numFromFeedback << "total=" << trainingSet.samples.size()
            << "bootstrapped=" << trainingSet.bootstrapped;
  }

  return trainingSet;
}

//===================================================================================================================//

// Cold start: the statistical score of each sampled entity becomes its target.
void TrainingOrchestrator::bootstrap(const Model& model, TrainingSet& trainingSet) {
  std::vector<std::string> entityIds = this->directory.listEntities(model.organisationId, this->engineConfig.bootstrapEntityLimit);
  TimePoint now = Clock::now();

  for (const std::string& entityId : entityIds) {
    try {
      RiskBreakdown riskBreakdown = this->scorer.computeStatisticalScore(entityId, model.organisationId);
      FeatureMap features = this->featureExtractor.extract(entityId, model.organisationId, riskBreakdown, now);
      Input input = FeatureExtractor::toVector(features, model.modelConfig.inputFeatures);

      trainingSet.samples.push_back({input, riskBreakdown.overallScore});
      trainingSet.bootstrapped = true;
    } catch (const ConfigurationError&) {
      throw;
    } catch (const std::exception& e) {
      if (this->engineConfig.logLevel >= LogLevel::WARNING) {
        qWarning() << "bootstrap entity skipped entity=" << QString::fromStdString(entityId)
                   << "model=" << QString::fromStdString(model.id) << "error=" << e.what();
      }
    }
  }
}

//===================================================================================================================//

TrainingOrchestrator::TrainedWeights TrainingOrchestrator::trainWithFallback(const Model& model, const TrainingConfig& trainingConfig,
                                                                             const Samples& samples, const std::string& runId,
                                                                             const CancelFlag& cancelFlag) {
  try {
    return this->trainBackend(BackendType::TENSOR, model, trainingConfig, samples, runId, cancelFlag, true);
  } catch (const TrainingCancelled&) {
    throw;
  } catch (const std::exception& e) {
    if (this->engineConfig.logLevel >= LogLevel::WARNING) {
      qWarning() << "tensor training failed, retrying on native backend run=" << QString::fromStdString(runId)
                 << "model=" << QString::fromStdString(model.id) << "error=" << e.what();
    }
  }

  return this->trainBackend(BackendType::NATIVE, model, trainingConfig, samples, runId, cancelFlag, false);
}

//===================================================================================================================//

TrainingOrchestrator::TrainedWeights TrainingOrchestrator::trainBackend(BackendType backendType, const Model& model,
                                                                        const TrainingConfig& trainingConfig, const Samples& samples,
                                                                        const std::string& runId, const CancelFlag& cancelFlag,
                                                                        bool seedFromModel) {
  std::string backendName = Backends::typeToName(backendType);
  std::unique_ptr<Backend> backend = this->backendFactory(backendType, model.modelConfig);

  if (!backend) {
    throw BackendError("no " + backendName + " backend available");
  }

  // Weights of another format are simply not reused
  if (!(seedFromModel && backend->getWeightsFormat() == model.weights.format && backend->loadWeights(model.weights))) {
    backend->initialize();
  }

  ulong progressInterval = this->engineConfig.progressInterval;
  ulong epochs = trainingConfig.epochs;
  LogLevel logLevel = this->engineConfig.logLevel;

  TrainingHooks hooks;
  hooks.isCancelled = [cancelFlag]() { return cancelFlag->load(); };
  hooks.onEpoch = [&](const EpochRecord& record) {
    if (record.epoch % progressInterval != 0) {
      return;
    }

    ulong currentEpoch = record.epoch + 1;
    ulong progress = static_cast<ulong>(std::round(static_cast<double>(currentEpoch) / static_cast<double>(epochs) * 100.0));

    this->repository->updateTrainingRun(runId, [&](TrainingRun& run) {
      run.backendName = backendName;
      run.currentEpoch = currentEpoch;
      run.progress = progress;
    });

    if (logLevel >= LogLevel::DEBUG) {
      qDebug() << "training progress run=" << QString::fromStdString(runId) << "backend=" << QString::fromStdString(backendName)
               << "epoch=" << currentEpoch << "/" << epochs << "loss=" << record.loss << "accuracy=" << record.accuracy;
    }
  };

  TrainedWeights trained;
  trained.backendName = backendName;
  trained.result = backend->train(samples, trainingConfig, hooks);
  trained.weights = backend->exportWeights();

  if (!Utils::allFinite(trained.weights.payload)) {
    throw BackendError(backendName + " training produced non-finite weights");
  }

  return trained;
}

//===================================================================================================================//

TrainingOutcome TrainingOrchestrator::alreadyRunning(const Model& model) const {
  TrainingOutcome outcome;
  outcome.alreadyRunning = true;
  outcome.modelId = model.id;
  outcome.errorMessage = "training already in progress";

  if (this->engineConfig.logLevel >= LogLevel::WARNING) {
    qWarning() << "training request ignored, already running model=" << QString::fromStdString(model.id);
  }

  return outcome;
}

//===================================================================================================================//
