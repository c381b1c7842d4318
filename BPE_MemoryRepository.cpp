#include "BPE_MemoryRepository.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_Utils.hpp"

#include <QReadLocker>
#include <QWriteLocker>

#include <algorithm>

using namespace BPE;

//===================================================================================================================//

namespace {
  template <typename R>
  typename std::vector<R>::iterator findById(std::vector<R>& records, const std::string& id) {
    return std::find_if(records.begin(), records.end(), [&id](const R& record) { return record.id == id; });
  }

  template <typename R>
  typename std::vector<R>::const_iterator findById(const std::vector<R>& records, const std::string& id) {
    return std::find_if(records.begin(), records.end(), [&id](const R& record) { return record.id == id; });
  }

  // Newest first, up to limit (0 means no limit).
  template <typename R, typename P>
  std::vector<R> newestFirst(const std::vector<R>& records, ulong limit, P predicate) {
    std::vector<R> result;

    for (auto it = records.rbegin(); it != records.rend(); ++it) {
      if (limit > 0 && result.size() >= limit) {
        break;
      }

      if (predicate(*it)) {
        result.push_back(*it);
      }
    }

    return result;
  }
}

//===================================================================================================================//

Model MemoryRepository::getOrCreateActiveModel(const std::string& organisationId, PredictionType predictionType,
                                               const std::function<Model()>& factory) {
  QWriteLocker locker(&this->lock);

  for (const Model& model : this->models) {
    if (model.organisationId == organisationId && model.predictionType == predictionType && model.isActive) {
      return model;
    }
  }

  Model model = factory();
  model.organisationId = organisationId;
  model.predictionType = predictionType;
  model.isActive = true;

  this->models.push_back(model);

  return model;
}

//===================================================================================================================//

std::optional<Model> MemoryRepository::findActiveModel(const std::string& organisationId, PredictionType predictionType) const {
  QReadLocker locker(&this->lock);

  for (const Model& model : this->models) {
    if (model.organisationId == organisationId && model.predictionType == predictionType && model.isActive) {
      return model;
    }
  }

  return std::nullopt;
}

//===================================================================================================================//

std::optional<Model> MemoryRepository::findModel(const std::string& modelId) const {
  QReadLocker locker(&this->lock);

  auto it = findById(this->models, modelId);

  if (it == this->models.end()) {
    return std::nullopt;
  }

  return *it;
}

//===================================================================================================================//

// The mutator works on a copy, so a throwing mutator leaves the stored row untouched.
Model MemoryRepository::updateModel(const std::string& modelId, const Mutator<Model>& mutator) {
  QWriteLocker locker(&this->lock);

  auto it = findById(this->models, modelId);

  if (it == this->models.end()) {
    throw NotFoundError("model " + modelId);
  }

  Model updated = *it;
  mutator(updated);
  updated.id = it->id;
  updated.updatedAt = Clock::now();

  *it = updated;

  return updated;
}

//===================================================================================================================//

void MemoryRepository::insertPrediction(const Prediction& prediction) {
  QWriteLocker locker(&this->lock);

  this->predictions.push_back(prediction);
}

//===================================================================================================================//

std::optional<Prediction> MemoryRepository::findPrediction(const std::string& predictionId) const {
  QReadLocker locker(&this->lock);

  auto it = findById(this->predictions, predictionId);

  if (it == this->predictions.end()) {
    return std::nullopt;
  }

  return *it;
}

//===================================================================================================================//

Prediction MemoryRepository::updatePrediction(const std::string& predictionId, const Mutator<Prediction>& mutator) {
  QWriteLocker locker(&this->lock);

  auto it = findById(this->predictions, predictionId);

  if (it == this->predictions.end()) {
    throw NotFoundError("prediction " + predictionId);
  }

  Prediction updated = *it;
  mutator(updated);
  updated.id = it->id;

  *it = updated;

  return updated;
}

//===================================================================================================================//

std::vector<Prediction> MemoryRepository::listPredictions(const std::string& organisationId, ulong limit, bool includeTest) const {
  QReadLocker locker(&this->lock);

  return newestFirst(this->predictions, limit, [&](const Prediction& prediction) {
    return prediction.organisationId == organisationId && (includeTest || !prediction.isTest);
  });
}

//===================================================================================================================//

ulong MemoryRepository::countPredictions(const std::string& modelId) const {
  QReadLocker locker(&this->lock);

  return std::count_if(this->predictions.begin(), this->predictions.end(),
                       [&modelId](const Prediction& prediction) { return prediction.modelId == modelId; });
}

//===================================================================================================================//

std::pair<Feedback, bool> MemoryRepository::insertFeedbackUnique(const Feedback& feedback) {
  QWriteLocker locker(&this->lock);

  for (const Feedback& existing : this->feedbacks) {
    if (existing.sameSubmission(feedback)) {
      return {existing, false};
    }
  }

  this->feedbacks.push_back(feedback);

  return {feedback, true};
}

//===================================================================================================================//

std::vector<Feedback> MemoryRepository::listFeedbackForModel(const std::string& modelId) const {
  QReadLocker locker(&this->lock);

  return newestFirst(this->feedbacks, 0, [&modelId](const Feedback& feedback) { return feedback.modelId == modelId; });
}

//===================================================================================================================//

std::vector<Feedback> MemoryRepository::listUnusedFeedback(const std::string& modelId, ulong limit) const {
  QReadLocker locker(&this->lock);

  std::vector<Feedback> result;

  for (const Feedback& feedback : this->feedbacks) {
    if (result.size() >= limit) {
      break;
    }

    if (feedback.modelId == modelId && !feedback.usedForTraining) {
      result.push_back(feedback);
    }
  }

  return result;
}

//===================================================================================================================//

void MemoryRepository::insertTrainingRun(const TrainingRun& trainingRun) {
  QWriteLocker locker(&this->lock);

  this->trainingRuns.push_back(trainingRun);
}

//===================================================================================================================//

std::optional<TrainingRun> MemoryRepository::findTrainingRun(const std::string& runId) const {
  QReadLocker locker(&this->lock);

  auto it = findById(this->trainingRuns, runId);

  if (it == this->trainingRuns.end()) {
    return std::nullopt;
  }

  return *it;
}

//===================================================================================================================//

TrainingRun MemoryRepository::updateTrainingRun(const std::string& runId, const Mutator<TrainingRun>& mutator) {
  QWriteLocker locker(&this->lock);

  auto it = findById(this->trainingRuns, runId);

  if (it == this->trainingRuns.end()) {
    throw NotFoundError("training run " + runId);
  }

  // A completed run is never reopened
  if (it->isTerminal()) {
    throw Exception("training run " + runId + " is already " + Enums::toName(it->status));
  }

  TrainingRun updated = *it;
  mutator(updated);
  updated.id = it->id;

  *it = updated;

  return updated;
}

//===================================================================================================================//

std::vector<TrainingRun> MemoryRepository::listTrainingRuns(const std::string& modelId, ulong limit) const {
  QReadLocker locker(&this->lock);

  return newestFirst(this->trainingRuns, limit, [&modelId](const TrainingRun& trainingRun) { return trainingRun.modelId == modelId; });
}

//===================================================================================================================//

Model MemoryRepository::commitTraining(const std::string& modelId, const Mutator<Model>& modelMutator,
                                       const std::vector<std::string>& feedbackIds, const std::string& runId,
                                       const Mutator<TrainingRun>& runMutator) {
  QWriteLocker locker(&this->lock);

  auto modelIt = findById(this->models, modelId);

  if (modelIt == this->models.end()) {
    throw NotFoundError("model " + modelId);
  }

  auto runIt = findById(this->trainingRuns, runId);

  if (runIt == this->trainingRuns.end()) {
    throw NotFoundError("training run " + runId);
  }

  if (runIt->isTerminal()) {
    throw Exception("training run " + runId + " is already " + Enums::toName(runIt->status));
  }

  std::vector<std::vector<Feedback>::iterator> feedbackIts;

  for (const std::string& feedbackId : feedbackIds) {
    auto it = findById(this->feedbacks, feedbackId);

    if (it == this->feedbacks.end()) {
      throw NotFoundError("feedback " + feedbackId);
    }

    feedbackIts.push_back(it);
  }

  // Mutators run on copies; the tables change only after both return
  Model model = *modelIt;
  modelMutator(model);
  model.id = modelIt->id;
  model.updatedAt = Clock::now();

  TrainingRun trainingRun = *runIt;
  runMutator(trainingRun);
  trainingRun.id = runIt->id;

  *modelIt = model;
  *runIt = trainingRun;

  for (auto& it : feedbackIts) {
    it->usedForTraining = true;
    it->trainingBatchId = runId;
  }

  return model;
}

//===================================================================================================================//

nlohmann::ordered_json MemoryRepository::toJson() const {
  QReadLocker locker(&this->lock);

  nlohmann::ordered_json json;
  json["models"] = nlohmann::ordered_json::array();
  json["predictions"] = nlohmann::ordered_json::array();
  json["feedback"] = nlohmann::ordered_json::array();
  json["trainingRuns"] = nlohmann::ordered_json::array();

  for (const Model& model : this->models) {
    json["models"].push_back(Utils::getModelJson(model));
  }

  for (const Prediction& prediction : this->predictions) {
    json["predictions"].push_back(Utils::getPredictionJson(prediction));
  }

  for (const Feedback& feedback : this->feedbacks) {
    json["feedback"].push_back(Utils::getFeedbackJson(feedback));
  }

  for (const TrainingRun& trainingRun : this->trainingRuns) {
    json["trainingRuns"].push_back(Utils::getTrainingRunJson(trainingRun));
  }

  return json;
}

//===================================================================================================================//

void MemoryRepository::fromJson(const nlohmann::ordered_json& json) {
  std::vector<Model> loadedModels;
  std::vector<Prediction> loadedPredictions;
  std::vector<Feedback> loadedFeedbacks;
  std::vector<TrainingRun> loadedTrainingRuns;

  try {
    for (const nlohmann::ordered_json& modelJson : json.value("models", nlohmann::ordered_json::array())) {
      loadedModels.push_back(Utils::loadModel(modelJson));
    }

    for (const nlohmann::ordered_json& predictionJson : json.value("predictions", nlohmann::ordered_json::array())) {
      loadedPredictions.push_back(Utils::loadPrediction(predictionJson));
    }

    for (const nlohmann::ordered_json& feedbackJson : json.value("feedback", nlohmann::ordered_json::array())) {
      loadedFeedbacks.push_back(Utils::loadFeedback(feedbackJson));
    }

    for (const nlohmann::ordered_json& trainingRunJson : json.value("trainingRuns", nlohmann::ordered_json::array())) {
      loadedTrainingRuns.push_back(Utils::loadTrainingRun(trainingRunJson));
    }
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError(std::string("malformed repository snapshot: ") + e.what());
  } catch (const ConfigurationError& e) {
    throw PersistenceError(std::string("repository snapshot holds an invalid value: ") + e.what());
  }

  QWriteLocker locker(&this->lock);

  this->models = std::move(loadedModels);
  this->predictions = std::move(loadedPredictions);
  this->feedbacks = std::move(loadedFeedbacks);
  this->trainingRuns = std::move(loadedTrainingRuns);
}

//===================================================================================================================//

void MemoryRepository::save(const std::string& filePath) const {
  Utils::writeFile(filePath, this->toJson().dump(4));
}

//===================================================================================================================//

void MemoryRepository::load(const std::string& filePath) {
  std::string jsonString = Utils::readFile(filePath);

  nlohmann::ordered_json json;

  try {
    json = nlohmann::ordered_json::parse(jsonString);
  } catch (const nlohmann::json::parse_error& e) {
    throw PersistenceError("snapshot " + filePath + " is not valid JSON: " + e.what());
  }

  this->fromJson(json);
}

//===================================================================================================================//
