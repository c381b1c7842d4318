#include "BPE_ModelRegistry.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_Utils.hpp"

#include <QDebug>

#include <algorithm>
#include <cmath>

using namespace BPE;

//===================================================================================================================//

ModelRegistry::ModelRegistry(std::shared_ptr<Repository> repository, const EngineConfig& engineConfig)
    : repository(std::move(repository)), engineConfig(engineConfig) {
}

//===================================================================================================================//

Model ModelRegistry::getOrCreate(const std::string& organisationId, PredictionType predictionType) {
  return this->repository->getOrCreateActiveModel(organisationId, predictionType, [&]() {
    Model model = this->makeModel(organisationId, predictionType);

    if (this->engineConfig.logLevel >= LogLevel::INFO) {
      qInfo() << "created model id=" << QString::fromStdString(model.id) << "org=" << QString::fromStdString(organisationId)
              << "type=" << QString::fromStdString(Enums::toName(predictionType));
    }

    return model;
  });
}

//===================================================================================================================//

std::optional<Model> ModelRegistry::findActive(const std::string& organisationId, PredictionType predictionType) const {
  return this->repository->findActiveModel(organisationId, predictionType);
}

//===================================================================================================================//

Model ModelRegistry::get(const std::string& modelId) const {
  std::optional<Model> model = this->repository->findModel(modelId);

  if (!model) {
    throw NotFoundError("model " + modelId);
  }

  return *model;
}

//===================================================================================================================//

Model ModelRegistry::recordPrediction(const std::string& modelId) {
  return this->repository->updateModel(modelId, [](Model& model) { model.totalPredictions++; });
}

//===================================================================================================================//

Model ModelRegistry::recordFeedback(const std::string& modelId, FeedbackType feedbackType) {
  return this->repository->updateModel(modelId, [feedbackType](Model& model) {
    model.feedbackCount++;

    if (feedbackType == FeedbackType::CORRECT) {
      model.correctPredictions++;
    }
  });
}

//===================================================================================================================//

Model ModelRegistry::updateSettings(const std::string& organisationId, const ModelSettings& settings, PredictionType predictionType) {
  const TrainingOverrides& training = settings.training;

  // The defaults are valid, so any rejection comes from an override
  ModelRegistry::validateTrainingConfig(training.applyTo(TrainingConfig()));

  Model model = this->getOrCreate(organisationId, predictionType);

  if (settings.featureWeights) {
    const std::vector<std::string>& declared = model.modelConfig.inputFeatures;

    for (const auto& pair : *settings.featureWeights) {
      if (std::find(declared.begin(), declared.end(), pair.first) == declared.end()) {
        throw ConfigurationError("feature weight for undeclared feature '" + pair.first + "'");
      }

      if (!std::isfinite(pair.second) || pair.second < 0) {
        throw ConfigurationError("feature weight for '" + pair.first + "' must be a non-negative number");
      }
    }
  }

  Model updated = this->repository->updateModel(model.id, [&settings](Model& target) {
    target.trainingConfig = settings.training.applyTo(target.trainingConfig);

    if (settings.featureWeights) {
      target.featureWeights = *settings.featureWeights;
    }
  });

  if (this->engineConfig.logLevel >= LogLevel::INFO) {
    qInfo() << "model settings updated id=" << QString::fromStdString(updated.id)
            << "learningRate=" << updated.trainingConfig.learningRate << "epochs=" << updated.trainingConfig.epochs
            << "batchSize=" << updated.trainingConfig.batchSize;
  }

  return updated;
}

//===================================================================================================================//

void ModelRegistry::validateTrainingConfig(const TrainingConfig& trainingConfig) {
  if (!(trainingConfig.learningRate > 0 && std::isfinite(trainingConfig.learningRate))) {
    throw ConfigurationError("learning rate must be positive");
  }

  if (trainingConfig.epochs == 0) {
    throw ConfigurationError("epochs must be positive");
  }

  if (trainingConfig.batchSize == 0) {
    throw ConfigurationError("batch size must be positive");
  }

  if (!(trainingConfig.validationSplit >= 0 && trainingConfig.validationSplit < 1)) {
    throw ConfigurationError("validation split must be in [0, 1)");
  }
}

//===================================================================================================================//

void ModelRegistry::applyTrainedWeights(Model& model, const SerializedWeights& weights, const TrainingResult& trainingResult,
                                        ulong numSamples) {
  model.weights = weights;
  model.weightsRevision++;
  model.status = ModelStatus::ACTIVE;
  model.trainingAccuracy = trainingResult.finalAccuracy;
  model.trainingLoss = trainingResult.finalLoss;
  model.validationAccuracy = trainingResult.finalValidationAccuracy;
  model.validationLoss = trainingResult.finalValidationLoss;
  model.trainingProgress = 100;
  model.trainingSamples = numSamples;
  model.lastTrainedAt = Clock::now();
}

//===================================================================================================================//

Model ModelRegistry::makeModel(const std::string& organisationId, PredictionType predictionType) const {
  Model model;
  TimePoint now = Clock::now();

  model.id = Utils::generateId();
  model.organisationId = organisationId;
  model.name = "Breach Predictor v1";
  model.predictionType = predictionType;
  model.version = 1;
  model.status = ModelStatus::TRAINING;
  model.isActive = true;
  model.modelConfig = this->engineConfig.modelConfig;
  model.trainingConfig = this->engineConfig.trainingConfig;
  model.featureWeights = ModelConfig::defaultFeatureWeights();
  model.createdAt = now;
  model.updatedAt = now;

  return model;
}

//===================================================================================================================//
