#ifndef BPE_ENUMS_HPP
#define BPE_ENUMS_HPP

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace BPE {
  enum class PredictionType {
    BREACH_PROBABILITY,
    DAYS_TO_BREACH,
    RISK_CATEGORY
  };

  const std::unordered_map<std::string, PredictionType> predictionTypeMap = {
    {"BREACH_PROBABILITY", PredictionType::BREACH_PROBABILITY},
    {"DAYS_TO_BREACH", PredictionType::DAYS_TO_BREACH},
    {"RISK_CATEGORY", PredictionType::RISK_CATEGORY},
  };

  // Shared by Model and TrainingRun.
  enum class ModelStatus {
    TRAINING,
    ACTIVE,
    INACTIVE,
    FAILED
  };

  const std::unordered_map<std::string, ModelStatus> modelStatusMap = {
    {"TRAINING", ModelStatus::TRAINING},
    {"ACTIVE", ModelStatus::ACTIVE},
    {"INACTIVE", ModelStatus::INACTIVE},
    {"FAILED", ModelStatus::FAILED},
  };

  enum class FeedbackType {
    CORRECT,
    INCORRECT,
    PARTIALLY_CORRECT
  };

  const std::unordered_map<std::string, FeedbackType> feedbackTypeMap = {
    {"CORRECT", FeedbackType::CORRECT},
    {"INCORRECT", FeedbackType::INCORRECT},
    {"PARTIALLY_CORRECT", FeedbackType::PARTIALLY_CORRECT},
  };

  enum class RiskCategory {
    CRITICAL,
    HIGH,
    MEDIUM,
    LOW
  };

  const std::unordered_map<std::string, RiskCategory> riskCategoryMap = {
    {"CRITICAL", RiskCategory::CRITICAL},
    {"HIGH", RiskCategory::HIGH},
    {"MEDIUM", RiskCategory::MEDIUM},
    {"LOW", RiskCategory::LOW},
  };

  enum class SourceLabel {
    STATISTICAL,
    ML_ENHANCED
  };

  const std::unordered_map<std::string, SourceLabel> sourceLabelMap = {
    {"Statistical", SourceLabel::STATISTICAL},
    {"ML-Enhanced", SourceLabel::ML_ENHANCED},
  };

  class Enums
  {
    public:
      static PredictionType predictionTypeFromName(const std::string& name);
      static std::string toName(PredictionType predictionType);

      static ModelStatus modelStatusFromName(const std::string& name);
      static std::string toName(ModelStatus modelStatus);

      static FeedbackType feedbackTypeFromName(const std::string& name);
      static std::string toName(FeedbackType feedbackType);

      static RiskCategory riskCategoryFromName(const std::string& name);
      static std::string toName(RiskCategory riskCategory);

      static SourceLabel sourceLabelFromName(const std::string& name);
      static std::string toName(SourceLabel sourceLabel);
  };
}

//===================================================================================================================//

#endif // BPE_ENUMS_HPP
