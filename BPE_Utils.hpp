#ifndef BPE_UTILS_HPP
#define BPE_UTILS_HPP

#include "BPE_EngineConfig.hpp"
#include "BPE_Records.hpp"

#include <nlohmann/json.hpp>

#include <string>

//===================================================================================================================//

namespace BPE {
  class Utils
  {
    public:
      //-- Files --//
      static std::string readFile(const std::string& filePath);
      static void writeFile(const std::string& filePath, const std::string& contents);
      static bool fileExists(const std::string& filePath);

      //-- Engine configuration --//
      static EngineConfig loadEngineConfig(const std::string& configFilePath);
      static EngineConfig loadEngineConfigJson(const nlohmann::ordered_json& json);
      static nlohmann::ordered_json getEngineConfigJson(const EngineConfig& engineConfig);

      //-- Time and identifiers --//
      static std::string formatISO8601(TimePoint timePoint = Clock::now());
      static TimePoint parseISO8601(const std::string& text);
      static std::string generateId();

      //-- Records --//
      static nlohmann::ordered_json getModelJson(const Model& model);
      static Model loadModel(const nlohmann::ordered_json& json);

      static nlohmann::ordered_json getPredictionJson(const Prediction& prediction);
      static Prediction loadPrediction(const nlohmann::ordered_json& json);

      static nlohmann::ordered_json getFeedbackJson(const Feedback& feedback);
      static Feedback loadFeedback(const nlohmann::ordered_json& json);

      static nlohmann::ordered_json getTrainingRunJson(const TrainingRun& trainingRun);
      static TrainingRun loadTrainingRun(const nlohmann::ordered_json& json);

      //-- Components --//
      static nlohmann::ordered_json getModelConfigJson(const ModelConfig& modelConfig);
      static ModelConfig loadModelConfig(const nlohmann::ordered_json& json, const ModelConfig& defaults);

      static nlohmann::ordered_json getTrainingConfigJson(const TrainingConfig& trainingConfig);
      static TrainingConfig loadTrainingConfig(const nlohmann::ordered_json& json, const TrainingConfig& defaults);

      static nlohmann::ordered_json getWeightsJson(const SerializedWeights& weights);
      static SerializedWeights loadWeights(const nlohmann::ordered_json& json);
      static bool allFinite(const nlohmann::ordered_json& json);  // Every number in the document, at any depth

      static nlohmann::ordered_json getEpochHistoryJson(const EpochHistory& epochHistory);
      static EpochHistory loadEpochHistory(const nlohmann::ordered_json& json);

      static nlohmann::ordered_json getFeatureMapJson(const FeatureMap& featureMap);
      static FeatureMap loadFeatureMap(const nlohmann::ordered_json& json);
  };
}

//===================================================================================================================//

#endif // BPE_UTILS_HPP
