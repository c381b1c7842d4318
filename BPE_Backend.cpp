#include "BPE_Backend.hpp"
#include "BPE_BackendNative.hpp"
#include "BPE_BackendTensor.hpp"
#include "BPE_Exceptions.hpp"

#include <cmath>

using namespace BPE;

//===================================================================================================================//

Backend::Backend(BackendType backendType, const ModelConfig& modelConfig, LogLevel logLevel)
    : backendType(backendType), modelConfig(modelConfig), logLevel(logLevel) {
  if (modelConfig.inputFeatures.empty()) {
    throw ConfigurationError("model declares no input features");
  }

  if (modelConfig.outputSize != 1 || modelConfig.outputActivation != ActvFuncType::SIGMOID) {
    throw ConfigurationError("only a single sigmoid output unit is supported");
  }
}

//===================================================================================================================//

std::unique_ptr<Backend> Backend::makeBackend(BackendType backendType, const ModelConfig& modelConfig, LogLevel logLevel) {
  switch (backendType) {
    case BackendType::TENSOR:
      return std::make_unique<BackendTensor>(modelConfig, logLevel);
    case BackendType::NATIVE:
      return std::make_unique<BackendNative>(modelConfig, logLevel);
  }

  throw ConfigurationError("unknown backend type enum value");
}

//===================================================================================================================//

TestResult Backend::test(const Samples& samples) const {
  this->requireReady("test");

  TestResult result;
  result.numSamples = samples.size();

  if (samples.empty()) {
    return result;
  }

  double totalLoss = 0;

  for (const Sample& sample : samples) {
    double predicted01 = this->predict(sample.input) / 100.0;
    double diff = sample.target / 100.0 - predicted01;
    totalLoss += diff * diff;

    if (Backend::isCorrect(predicted01, sample.target)) {
      result.numCorrect++;
    }
  }

  result.averageLoss = totalLoss / static_cast<double>(samples.size());
  result.accuracy = static_cast<double>(result.numCorrect) / static_cast<double>(samples.size()) * 100.0;

  return result;
}

//===================================================================================================================//

WeightsFormat Backend::getWeightsFormat() const {
  return (this->backendType == BackendType::TENSOR) ? WeightsFormat::TENSOR_V1 : WeightsFormat::NATIVE_V1;
}

//===================================================================================================================//

void Backend::requireReady(const char* operation) const {
  if (this->state == BackendState::UNLOADED) {
    throw BackendError(std::string(operation) + " called on an unloaded " + Backends::typeToName(this->backendType) + " backend");
  }
}

//===================================================================================================================//

void Backend::checkInput(const Input& input) const {
  if (input.size() != this->modelConfig.inputFeatures.size()) {
    throw BackendError("input has " + std::to_string(input.size()) + " values, model expects " +
                       std::to_string(this->modelConfig.inputFeatures.size()));
  }
}

//===================================================================================================================//

void Backend::checkSamples(const Samples& samples) const {
  if (samples.empty()) {
    throw BackendError("no training samples");
  }

  for (const Sample& sample : samples) {
    this->checkInput(sample.input);
  }
}

//===================================================================================================================//
