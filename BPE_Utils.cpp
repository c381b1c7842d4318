#include "BPE_Utils.hpp"
#include "BPE_ActvFunc.hpp"
#include "BPE_Exceptions.hpp"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>

using namespace BPE;

//===================================================================================================================//

namespace {
  template <typename T>
  nlohmann::ordered_json optionalJson(const std::optional<T>& value) {
    return value ? nlohmann::ordered_json(*value) : nlohmann::ordered_json(nullptr);
  }

  nlohmann::ordered_json optionalTimeJson(const std::optional<TimePoint>& value) {
    return value ? nlohmann::ordered_json(Utils::formatISO8601(*value)) : nlohmann::ordered_json(nullptr);
  }

  template <typename T>
  std::optional<T> loadOptional(const nlohmann::ordered_json& json, const char* key) {
    if (!json.contains(key) || json.at(key).is_null()) {
      return std::nullopt;
    }

    return json.at(key).get<T>();
  }

  std::optional<TimePoint> loadOptionalTime(const nlohmann::ordered_json& json, const char* key) {
    std::optional<std::string> text = loadOptional<std::string>(json, key);

    if (!text) {
      return std::nullopt;
    }

    return Utils::parseISO8601(*text);
  }

  TimePoint loadTime(const nlohmann::ordered_json& json, const char* key) {
    return Utils::parseISO8601(json.at(key).get<std::string>());
  }
}

//===================================================================================================================//

std::string Utils::readFile(const std::string& filePath) {
  QFile file(QString::fromStdString(filePath));

  if (!file.open(QIODevice::ReadOnly)) {
    throw PersistenceError("failed to open file for reading: " + filePath);
  }

  QByteArray fileData = file.readAll();

  return fileData.toStdString();
}

//===================================================================================================================//

void Utils::writeFile(const std::string& filePath, const std::string& contents) {
  QFile file(QString::fromStdString(filePath));

  if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    throw PersistenceError("failed to open file for writing: " + filePath);
  }

  qint64 written = file.write(contents.c_str(), static_cast<qint64>(contents.size()));
  file.close();

  if (written != static_cast<qint64>(contents.size())) {
    throw PersistenceError("short write to file: " + filePath);
  }
}

//===================================================================================================================//

bool Utils::fileExists(const std::string& filePath) {
  QFileInfo fileInfo(QString::fromStdString(filePath));

  return fileInfo.exists() && fileInfo.isFile();
}

//===================================================================================================================//

EngineConfig Utils::loadEngineConfig(const std::string& configFilePath) {
  std::string jsonString = Utils::readFile(configFilePath);

  nlohmann::ordered_json json;

  try {
    json = nlohmann::ordered_json::parse(jsonString);
  } catch (const nlohmann::json::parse_error& e) {
    qCritical() << "Config file JSON parse error: " << e.what();
    throw ConfigurationError("config file " + configFilePath + " is not valid JSON");
  }

  return Utils::loadEngineConfigJson(json);
}

//===================================================================================================================//

// Missing keys keep their defaults; unknown keys are ignored.
EngineConfig Utils::loadEngineConfigJson(const nlohmann::ordered_json& json) {
  EngineConfig engineConfig;

  if (!json.is_object()) {
    throw ConfigurationError("engine configuration must be a JSON object");
  }

  try {
    if (json.contains("logLevel")) {
      engineConfig.logLevel = LogLevels::nameToType(json.at("logLevel").get<std::string>());
    }

    if (json.contains("trainingConfig")) {
      engineConfig.trainingConfig = Utils::loadTrainingConfig(json.at("trainingConfig"), engineConfig.trainingConfig);
    }

    if (json.contains("modelConfig")) {
      engineConfig.modelConfig = Utils::loadModelConfig(json.at("modelConfig"), engineConfig.modelConfig);
    }

    engineConfig.primaryTimeoutMs = json.value("primaryTimeoutMs", engineConfig.primaryTimeoutMs);
    engineConfig.feedbackLimit = json.value("feedbackLimit", engineConfig.feedbackLimit);
    engineConfig.minTrainingExamples = json.value("minTrainingExamples", engineConfig.minTrainingExamples);
    engineConfig.bootstrapEntityLimit = json.value("bootstrapEntityLimit", engineConfig.bootstrapEntityLimit);
    engineConfig.progressInterval = json.value("progressInterval", engineConfig.progressInterval);
    engineConfig.predictionTtlHours = json.value("predictionTtlHours", engineConfig.predictionTtlHours);
    engineConfig.batchPredictionLimit = json.value("batchPredictionLimit", engineConfig.batchPredictionLimit);
    engineConfig.testPredictionLimit = json.value("testPredictionLimit", engineConfig.testPredictionLimit);
  } catch (const nlohmann::json::type_error& e) {
    throw ConfigurationError(std::string("engine configuration has a value of the wrong type: ") + e.what());
  }

  if (engineConfig.progressInterval == 0) {
    throw ConfigurationError("progressInterval must be positive");
  }

  if (engineConfig.primaryTimeoutMs == 0) {
    throw ConfigurationError("primaryTimeoutMs must be positive");
  }

  return engineConfig;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getEngineConfigJson(const EngineConfig& engineConfig) {
  nlohmann::ordered_json json;

  json["logLevel"] = LogLevels::typeToName(engineConfig.logLevel);
  json["trainingConfig"] = Utils::getTrainingConfigJson(engineConfig.trainingConfig);
  json["modelConfig"] = Utils::getModelConfigJson(engineConfig.modelConfig);
  json["primaryTimeoutMs"] = engineConfig.primaryTimeoutMs;
  json["feedbackLimit"] = engineConfig.feedbackLimit;
  json["minTrainingExamples"] = engineConfig.minTrainingExamples;
  json["bootstrapEntityLimit"] = engineConfig.bootstrapEntityLimit;
  json["progressInterval"] = engineConfig.progressInterval;
  json["predictionTtlHours"] = engineConfig.predictionTtlHours;
  json["batchPredictionLimit"] = engineConfig.batchPredictionLimit;
  json["testPredictionLimit"] = engineConfig.testPredictionLimit;

  return json;
}

//===================================================================================================================//

std::string Utils::formatISO8601(TimePoint timePoint) {
  std::time_t time = Clock::to_time_t(timePoint);
  std::tm localTime;
  localtime_r(&time, &localTime);

  long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count() % 1000;

  if (millis < 0) {
    millis += 1000;
  }

  std::ostringstream oss;
  oss << std::put_time(&localTime, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;

  // Add UTC offset in ISO 8601 format (e.g., +01:00)
  // %z gives +0100, we need to insert the colon
  char tzOffset[8];
  std::strftime(tzOffset, sizeof(tzOffset), "%z", &localTime);

  std::string offset(tzOffset);

  if (offset.length() >= 5) {
    offset.insert(3, ":");
  }

  oss << offset;

  return oss.str();
}

//===================================================================================================================//

TimePoint Utils::parseISO8601(const std::string& text) {
  QDateTime dateTime = QDateTime::fromString(QString::fromStdString(text), Qt::ISODateWithMs);

  if (!dateTime.isValid()) {
    throw PersistenceError("invalid ISO 8601 timestamp: " + text);
  }

  return TimePoint(std::chrono::milliseconds(dateTime.toMSecsSinceEpoch()));
}

//===================================================================================================================//

std::string Utils::generateId() {
  return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getModelJson(const Model& model) {
  nlohmann::ordered_json json;

  json["id"] = model.id;
  json["organisationId"] = model.organisationId;
  json["name"] = model.name;
  json["predictionType"] = Enums::toName(model.predictionType);
  json["version"] = model.version;
  json["status"] = Enums::toName(model.status);
  json["isActive"] = model.isActive;
  json["modelConfig"] = Utils::getModelConfigJson(model.modelConfig);
  json["trainingConfig"] = Utils::getTrainingConfigJson(model.trainingConfig);
  json["featureWeights"] = Utils::getFeatureMapJson(model.featureWeights);
  json["totalPredictions"] = model.totalPredictions;
  json["correctPredictions"] = model.correctPredictions;
  json["feedbackCount"] = model.feedbackCount;
  json["lastTrainedAt"] = optionalTimeJson(model.lastTrainedAt);
  json["trainingAccuracy"] = optionalJson(model.trainingAccuracy);
  json["validationAccuracy"] = optionalJson(model.validationAccuracy);
  json["trainingLoss"] = optionalJson(model.trainingLoss);
  json["validationLoss"] = optionalJson(model.validationLoss);
  json["trainingProgress"] = model.trainingProgress;
  json["trainingSamples"] = model.trainingSamples;
  json["createdAt"] = Utils::formatISO8601(model.createdAt);
  json["updatedAt"] = Utils::formatISO8601(model.updatedAt);
  json["weightsRevision"] = model.weightsRevision;

  // Weights last, they dominate the document
  json["weights"] = Utils::getWeightsJson(model.weights);

  return json;
}

//===================================================================================================================//

Model Utils::loadModel(const nlohmann::ordered_json& json) {
  Model model;

  model.id = json.at("id").get<std::string>();
  model.organisationId = json.at("organisationId").get<std::string>();
  model.name = json.value("name", std::string());
  model.predictionType = Enums::predictionTypeFromName(json.at("predictionType").get<std::string>());
  model.version = json.value("version", 1UL);
  model.status = Enums::modelStatusFromName(json.at("status").get<std::string>());
  model.isActive = json.value("isActive", true);
  model.modelConfig = Utils::loadModelConfig(json.at("modelConfig"), ModelConfig::defaults());
  model.trainingConfig = Utils::loadTrainingConfig(json.value("trainingConfig", nlohmann::ordered_json::object()), TrainingConfig());
  model.featureWeights = Utils::loadFeatureMap(json.value("featureWeights", nlohmann::ordered_json::object()));
  model.totalPredictions = json.value("totalPredictions", 0UL);
  model.correctPredictions = json.value("correctPredictions", 0UL);
  model.feedbackCount = json.value("feedbackCount", 0UL);
  model.lastTrainedAt = loadOptionalTime(json, "lastTrainedAt");
  model.trainingAccuracy = loadOptional<double>(json, "trainingAccuracy");
  model.validationAccuracy = loadOptional<double>(json, "validationAccuracy");
  model.trainingLoss = loadOptional<double>(json, "trainingLoss");
  model.validationLoss = loadOptional<double>(json, "validationLoss");
  model.trainingProgress = json.value("trainingProgress", 0UL);
  model.trainingSamples = json.value("trainingSamples", 0UL);
  model.createdAt = loadTime(json, "createdAt");
  model.updatedAt = loadTime(json, "updatedAt");
  model.weightsRevision = json.value("weightsRevision", 0UL);
  model.weights = Utils::loadWeights(json.value("weights", nlohmann::ordered_json()));

  return model;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getPredictionJson(const Prediction& prediction) {
  nlohmann::ordered_json json;

  json["id"] = prediction.id;
  json["organisationId"] = prediction.organisationId;
  json["modelId"] = prediction.modelId;
  json["entityId"] = prediction.entityId;
  json["predictionType"] = Enums::toName(prediction.predictionType);
  json["statisticalScore"] = prediction.statisticalScore;
  json["statisticalConfidence"] = prediction.statisticalConfidence;
  json["mlScore"] = optionalJson(prediction.mlScore);
  json["mlConfidence"] = optionalJson(prediction.mlConfidence);
  json["backendName"] = optionalJson(prediction.backendName);
  json["combinedScore"] = prediction.combinedScore;
  json["combinedConfidence"] = prediction.combinedConfidence;
  json["riskCategory"] = Enums::toName(prediction.riskCategory);
  json["sourceLabel"] = Enums::toName(prediction.sourceLabel);
  json["daysToBreach"] = optionalJson(prediction.daysToBreach);
  json["predictedBreachDate"] = optionalTimeJson(prediction.predictedBreachDate);
  json["inputFeatures"] = Utils::getFeatureMapJson(prediction.inputFeatures);
  json["actualOutcome"] = optionalJson(prediction.actualOutcome);
  json["actualBreachDate"] = optionalTimeJson(prediction.actualBreachDate);
  json["wasAccurate"] = optionalJson(prediction.wasAccurate);
  json["isTest"] = prediction.isTest;
  json["createdAt"] = Utils::formatISO8601(prediction.createdAt);
  json["expiresAt"] = Utils::formatISO8601(prediction.expiresAt);

  return json;
}

//===================================================================================================================//

Prediction Utils::loadPrediction(const nlohmann::ordered_json& json) {
  Prediction prediction;

  prediction.id = json.at("id").get<std::string>();
  prediction.organisationId = json.at("organisationId").get<std::string>();
  prediction.modelId = json.at("modelId").get<std::string>();
  prediction.entityId = json.at("entityId").get<std::string>();
  prediction.predictionType = Enums::predictionTypeFromName(json.at("predictionType").get<std::string>());
  prediction.statisticalScore = json.at("statisticalScore").get<double>();
  prediction.statisticalConfidence = json.at("statisticalConfidence").get<double>();
  prediction.mlScore = loadOptional<double>(json, "mlScore");
  prediction.mlConfidence = loadOptional<double>(json, "mlConfidence");
  prediction.backendName = loadOptional<std::string>(json, "backendName");
  prediction.combinedScore = json.at("combinedScore").get<int>();
  prediction.combinedConfidence = json.at("combinedConfidence").get<int>();
  prediction.riskCategory = Enums::riskCategoryFromName(json.at("riskCategory").get<std::string>());
  prediction.sourceLabel = Enums::sourceLabelFromName(json.at("sourceLabel").get<std::string>());
  prediction.daysToBreach = loadOptional<int>(json, "daysToBreach");
  prediction.predictedBreachDate = loadOptionalTime(json, "predictedBreachDate");
  prediction.inputFeatures = Utils::loadFeatureMap(json.value("inputFeatures", nlohmann::ordered_json::object()));
  prediction.actualOutcome = loadOptional<std::string>(json, "actualOutcome");
  prediction.actualBreachDate = loadOptionalTime(json, "actualBreachDate");
  prediction.wasAccurate = loadOptional<bool>(json, "wasAccurate");
  prediction.isTest = json.value("isTest", false);
  prediction.createdAt = loadTime(json, "createdAt");
  prediction.expiresAt = loadTime(json, "expiresAt");

  return prediction;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getFeedbackJson(const Feedback& feedback) {
  nlohmann::ordered_json json;

  json["id"] = feedback.id;
  json["organisationId"] = feedback.organisationId;
  json["predictionId"] = feedback.predictionId;
  json["modelId"] = feedback.modelId;
  json["feedbackType"] = Enums::toName(feedback.feedbackType);
  json["correctedScore"] = optionalJson(feedback.correctedScore);
  json["correctedCategory"] = feedback.correctedCategory ? nlohmann::ordered_json(Enums::toName(*feedback.correctedCategory))
                                                         : nlohmann::ordered_json(nullptr);
  json["notes"] = feedback.notes;
  json["submittedBy"] = feedback.submittedBy;
  json["usedForTraining"] = feedback.usedForTraining;
  json["trainingBatchId"] = optionalJson(feedback.trainingBatchId);
  json["createdAt"] = Utils::formatISO8601(feedback.createdAt);

  return json;
}

//===================================================================================================================//

Feedback Utils::loadFeedback(const nlohmann::ordered_json& json) {
  Feedback feedback;

  feedback.id = json.at("id").get<std::string>();
  feedback.organisationId = json.at("organisationId").get<std::string>();
  feedback.predictionId = json.at("predictionId").get<std::string>();
  feedback.modelId = json.at("modelId").get<std::string>();
  feedback.feedbackType = Enums::feedbackTypeFromName(json.at("feedbackType").get<std::string>());
  feedback.correctedScore = loadOptional<double>(json, "correctedScore");

  std::optional<std::string> correctedCategory = loadOptional<std::string>(json, "correctedCategory");

  if (correctedCategory) {
    feedback.correctedCategory = Enums::riskCategoryFromName(*correctedCategory);
  }

  feedback.notes = json.value("notes", std::string());
  feedback.submittedBy = json.value("submittedBy", std::string());
  feedback.usedForTraining = json.value("usedForTraining", false);
  feedback.trainingBatchId = loadOptional<std::string>(json, "trainingBatchId");
  feedback.createdAt = loadTime(json, "createdAt");

  return feedback;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getTrainingRunJson(const TrainingRun& trainingRun) {
  nlohmann::ordered_json json;

  json["id"] = trainingRun.id;
  json["organisationId"] = trainingRun.organisationId;
  json["modelId"] = trainingRun.modelId;
  json["status"] = Enums::toName(trainingRun.status);
  json["trainingConfig"] = Utils::getTrainingConfigJson(trainingRun.trainingConfig);
  json["backendName"] = optionalJson(trainingRun.backendName);
  json["currentEpoch"] = trainingRun.currentEpoch;
  json["progress"] = trainingRun.progress;
  json["trainingSamples"] = trainingRun.trainingSamples;
  json["validationSamples"] = trainingRun.validationSamples;
  json["finalAccuracy"] = optionalJson(trainingRun.finalAccuracy);
  json["finalLoss"] = optionalJson(trainingRun.finalLoss);
  json["finalValidationAccuracy"] = optionalJson(trainingRun.finalValidationAccuracy);
  json["finalValidationLoss"] = optionalJson(trainingRun.finalValidationLoss);
  json["epochHistory"] = Utils::getEpochHistoryJson(trainingRun.epochHistory);
  json["startedAt"] = Utils::formatISO8601(trainingRun.startedAt);
  json["completedAt"] = optionalTimeJson(trainingRun.completedAt);
  json["errorMessage"] = optionalJson(trainingRun.errorMessage);

  return json;
}

//===================================================================================================================//

TrainingRun Utils::loadTrainingRun(const nlohmann::ordered_json& json) {
  TrainingRun trainingRun;

  trainingRun.id = json.at("id").get<std::string>();
  trainingRun.organisationId = json.at("organisationId").get<std::string>();
  trainingRun.modelId = json.at("modelId").get<std::string>();
  trainingRun.status = Enums::modelStatusFromName(json.at("status").get<std::string>());
  trainingRun.trainingConfig = Utils::loadTrainingConfig(json.value("trainingConfig", nlohmann::ordered_json::object()), TrainingConfig());
  trainingRun.backendName = loadOptional<std::string>(json, "backendName");
  trainingRun.currentEpoch = json.value("currentEpoch", 0UL);
  trainingRun.progress = json.value("progress", 0UL);
  trainingRun.trainingSamples = json.value("trainingSamples", 0UL);
  trainingRun.validationSamples = json.value("validationSamples", 0UL);
  trainingRun.finalAccuracy = loadOptional<double>(json, "finalAccuracy");
  trainingRun.finalLoss = loadOptional<double>(json, "finalLoss");
  trainingRun.finalValidationAccuracy = loadOptional<double>(json, "finalValidationAccuracy");
  trainingRun.finalValidationLoss = loadOptional<double>(json, "finalValidationLoss");
  trainingRun.epochHistory = Utils::loadEpochHistory(json.value("epochHistory", nlohmann::ordered_json::array()));
  trainingRun.startedAt = loadTime(json, "startedAt");
  trainingRun.completedAt = loadOptionalTime(json, "completedAt");
  trainingRun.errorMessage = loadOptional<std::string>(json, "errorMessage");

  return trainingRun;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getModelConfigJson(const ModelConfig& modelConfig) {
  nlohmann::ordered_json json;

  json["inputFeatures"] = modelConfig.inputFeatures;
  json["hiddenLayers"] = modelConfig.hiddenLayers;
  json["tensorHiddenLayers"] = modelConfig.tensorHiddenLayers;
  json["activation"] = ActvFunc::typeToName(modelConfig.outputActivation);

  return json;
}

//===================================================================================================================//

ModelConfig Utils::loadModelConfig(const nlohmann::ordered_json& json, const ModelConfig& defaults) {
  ModelConfig modelConfig = defaults;

  if (json.contains("inputFeatures")) {
    modelConfig.inputFeatures = json.at("inputFeatures").get<std::vector<std::string>>();
  }

  if (json.contains("hiddenLayers")) {
    modelConfig.hiddenLayers = json.at("hiddenLayers").get<std::vector<ulong>>();
  }

  if (json.contains("tensorHiddenLayers")) {
    modelConfig.tensorHiddenLayers = json.at("tensorHiddenLayers").get<std::vector<ulong>>();
  }

  if (json.contains("activation")) {
    modelConfig.outputActivation = ActvFunc::nameToType(json.at("activation").get<std::string>());
  }

  std::set<std::string> uniqueFeatures(modelConfig.inputFeatures.begin(), modelConfig.inputFeatures.end());

  if (modelConfig.inputFeatures.empty() || uniqueFeatures.size() != modelConfig.inputFeatures.size()) {
    throw ConfigurationError("modelConfig.inputFeatures must be a non-empty list of distinct names");
  }

  for (const std::vector<ulong>* hidden : {&modelConfig.hiddenLayers, &modelConfig.tensorHiddenLayers}) {
    if (hidden->empty()) {
      throw ConfigurationError("hidden layer list must not be empty");
    }

    for (ulong size : *hidden) {
      if (size == 0) {
        throw ConfigurationError("hidden layer sizes must be positive");
      }
    }
  }

  return modelConfig;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getTrainingConfigJson(const TrainingConfig& trainingConfig) {
  nlohmann::ordered_json json;

  json["learningRate"] = trainingConfig.learningRate;
  json["epochs"] = trainingConfig.epochs;
  json["batchSize"] = trainingConfig.batchSize;
  json["validationSplit"] = trainingConfig.validationSplit;

  return json;
}

//===================================================================================================================//

TrainingConfig Utils::loadTrainingConfig(const nlohmann::ordered_json& json, const TrainingConfig& defaults) {
  TrainingConfig trainingConfig = defaults;

  trainingConfig.learningRate = json.value("learningRate", defaults.learningRate);
  trainingConfig.epochs = json.value("epochs", defaults.epochs);
  trainingConfig.batchSize = json.value("batchSize", defaults.batchSize);
  trainingConfig.validationSplit = json.value("validationSplit", defaults.validationSplit);

  if (trainingConfig.learningRate <= 0 || trainingConfig.epochs == 0 || trainingConfig.batchSize == 0) {
    throw ConfigurationError("learningRate, epochs and batchSize must be positive");
  }

  if (trainingConfig.validationSplit < 0 || trainingConfig.validationSplit >= 1) {
    throw ConfigurationError("validationSplit must be in [0, 1)");
  }

  return trainingConfig;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getWeightsJson(const SerializedWeights& weights) {
  if (weights.format == WeightsFormat::NONE) {
    return nullptr;
  }

  nlohmann::ordered_json json;

  json["format"] = WeightsFormats::typeToName(weights.format);
  json["payload"] = weights.payload;

  return json;
}

//===================================================================================================================//

// Untagged or unknown-tag weights load as NONE. The payload is never inspected to guess a format.
SerializedWeights Utils::loadWeights(const nlohmann::ordered_json& json) {
  SerializedWeights weights;

  if (!json.is_object() || !json.contains("format")) {
    if (!json.is_null()) {
      qWarning() << "weights without a format tag treated as no usable model";
    }

    return weights;
  }

  std::string formatName = json.at("format").get<std::string>();
  auto it = weightsFormatMap.find(formatName);

  if (it == weightsFormatMap.end()) {
    qWarning() << "unknown weights format" << QString::fromStdString(formatName) << "treated as no usable model";

    return weights;
  }

  weights.format = it->second;
  weights.payload = json.value("payload", nlohmann::ordered_json());

  return weights;
}

//===================================================================================================================//

bool Utils::allFinite(const nlohmann::ordered_json& json) {
  if (json.is_number_float()) {
    return std::isfinite(json.get<double>());
  }

  if (json.is_structured()) {
    for (const auto& value : json) {
      if (!Utils::allFinite(value)) {
        return false;
      }
    }
  }

  return true;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getEpochHistoryJson(const EpochHistory& epochHistory) {
  nlohmann::ordered_json json = nlohmann::ordered_json::array();

  for (const EpochRecord& record : epochHistory) {
    nlohmann::ordered_json recordJson;

    recordJson["epoch"] = record.epoch;
    recordJson["loss"] = record.loss;
    recordJson["accuracy"] = record.accuracy;

    if (record.validationLoss) {
      recordJson["validationLoss"] = *record.validationLoss;
    }

    if (record.validationAccuracy) {
      recordJson["validationAccuracy"] = *record.validationAccuracy;
    }

    json.push_back(recordJson);
  }

  return json;
}

//===================================================================================================================//

EpochHistory Utils::loadEpochHistory(const nlohmann::ordered_json& json) {
  EpochHistory epochHistory;

  for (const nlohmann::ordered_json& recordJson : json) {
    EpochRecord record;

    record.epoch = recordJson.at("epoch").get<ulong>();
    record.loss = recordJson.at("loss").get<double>();
    record.accuracy = recordJson.at("accuracy").get<double>();
    record.validationLoss = loadOptional<double>(recordJson, "validationLoss");
    record.validationAccuracy = loadOptional<double>(recordJson, "validationAccuracy");

    epochHistory.push_back(record);
  }

  return epochHistory;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::getFeatureMapJson(const FeatureMap& featureMap) {
  nlohmann::ordered_json json = nlohmann::ordered_json::object();

  for (const auto& pair : featureMap) {
    json[pair.first] = pair.second;
  }

  return json;
}

//===================================================================================================================//

FeatureMap Utils::loadFeatureMap(const nlohmann::ordered_json& json) {
  FeatureMap featureMap;

  for (auto it = json.begin(); it != json.end(); ++it) {
    featureMap.emplace_back(it.key(), it.value().get<double>());
  }

  return featureMap;
}

//===================================================================================================================//
