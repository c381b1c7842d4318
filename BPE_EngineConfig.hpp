#ifndef BPE_ENGINECONFIG_HPP
#define BPE_ENGINECONFIG_HPP

#include "BPE_LogLevel.hpp"
#include "BPE_ModelConfig.hpp"
#include "BPE_TrainingConfig.hpp"

#include <sys/types.h>

//===================================================================================================================//

namespace BPE {
  struct EngineConfig {
    LogLevel logLevel = LogLevel::ERROR;

    // Defaults for newly created models
    TrainingConfig trainingConfig;
    ModelConfig modelConfig = ModelConfig::defaults();

    ulong primaryTimeoutMs = 2000;

    //-- Training set assembly --//
    ulong feedbackLimit = 1000;
    ulong minTrainingExamples = 10;
    ulong bootstrapEntityLimit = 100;
    ulong progressInterval = 10;  // Epochs between TrainingRun progress writes

    //-- Predictions --//
    ulong predictionTtlHours = 24;
    ulong batchPredictionLimit = 50;
    ulong testPredictionLimit = 50;
  };
}

//===================================================================================================================//

#endif // BPE_ENGINECONFIG_HPP
