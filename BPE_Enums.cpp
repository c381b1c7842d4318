#include "BPE_Enums.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_LogLevel.hpp"

using namespace BPE;

//===================================================================================================================//

namespace {
  template <typename E>
  E lookupType(const std::unordered_map<std::string, E>& map, const std::string& name, const char* what) {
    auto it = map.find(name);

    if (it == map.end()) {
      throw ConfigurationError(std::string("unknown ") + what + ": " + name);
    }

    return it->second;
  }

  template <typename E>
  std::string lookupName(const std::unordered_map<std::string, E>& map, E value, const char* what) {
    for (const auto& pair : map) {
      if (pair.second == value) {
        return pair.first;
      }
    }

    throw ConfigurationError(std::string("unknown ") + what + " enum value");
  }
}

//===================================================================================================================//

PredictionType Enums::predictionTypeFromName(const std::string& name) {
  return lookupType(predictionTypeMap, name, "prediction type");
}

std::string Enums::toName(PredictionType predictionType) {
  return lookupName(predictionTypeMap, predictionType, "prediction type");
}

//===================================================================================================================//

ModelStatus Enums::modelStatusFromName(const std::string& name) {
  return lookupType(modelStatusMap, name, "model status");
}

std::string Enums::toName(ModelStatus modelStatus) {
  return lookupName(modelStatusMap, modelStatus, "model status");
}

//===================================================================================================================//

FeedbackType Enums::feedbackTypeFromName(const std::string& name) {
  return lookupType(feedbackTypeMap, name, "feedback type");
}

std::string Enums::toName(FeedbackType feedbackType) {
  return lookupName(feedbackTypeMap, feedbackType, "feedback type");
}

//===================================================================================================================//

RiskCategory Enums::riskCategoryFromName(const std::string& name) {
  return lookupType(riskCategoryMap, name, "risk category");
}

std::string Enums::toName(RiskCategory riskCategory) {
  return lookupName(riskCategoryMap, riskCategory, "risk category");
}

//===================================================================================================================//

SourceLabel Enums::sourceLabelFromName(const std::string& name) {
  return lookupType(sourceLabelMap, name, "source label");
}

std::string Enums::toName(SourceLabel sourceLabel) {
  return lookupName(sourceLabelMap, sourceLabel, "source label");
}

//===================================================================================================================//

LogLevel LogLevels::nameToType(const std::string& name) {
  return lookupType(logLevelMap, name, "log level");
}

std::string LogLevels::typeToName(const LogLevel& logLevel) {
  return lookupName(logLevelMap, logLevel, "log level");
}

//===================================================================================================================//
