#include "BPE_BackendNative.hpp"
#include "BPE_ActvFunc.hpp"
#include "BPE_Exceptions.hpp"

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

using namespace BPE;

//===================================================================================================================//

BackendNative::BackendNative(const ModelConfig& modelConfig, LogLevel logLevel)
    : Backend(BackendType::NATIVE, modelConfig, logLevel) {
  this->layerSizes = modelConfig.layerSizes(modelConfig.hiddenLayers);
}

//===================================================================================================================//

bool BackendNative::loadWeights(const SerializedWeights& serialized) {
  if (serialized.format != WeightsFormat::NATIVE_V1) {
    if (this->logLevel >= LogLevel::WARNING) {
      qWarning() << "native backend: refusing weights in format" << QString::fromStdString(WeightsFormats::typeToName(serialized.format));
    }

    return false;
  }

  ulong numLayers = this->numWeightLayers();
  std::vector<Matrix2D<double>> loadedWeights;
  std::vector<double> loadedBiases(numLayers, 0.0);

  try {
    const nlohmann::ordered_json& weightsJson = serialized.payload.at("weights");

    if (!weightsJson.is_array() || weightsJson.size() != numLayers) {
      throw BackendError("expected " + std::to_string(numLayers) + " weight layers");
    }

    for (ulong l = 0; l < numLayers; l++) {
      std::vector<double> flat = weightsJson.at(l).get<std::vector<double>>();
      ulong fanIn = this->layerSizes[l];
      ulong fanOut = this->layerSizes[l + 1];

      if (flat.size() != fanIn * fanOut) {
        throw BackendError("layer " + std::to_string(l) + " has " + std::to_string(flat.size()) +
                           " weights, expected " + std::to_string(fanIn * fanOut));
      }

      for (double value : flat) {
        if (!std::isfinite(value)) {
          throw BackendError("layer " + std::to_string(l) + " contains a non-finite weight");
        }
      }

      loadedWeights.emplace_back(fanIn, fanOut, std::move(flat));
    }

    // Weights persisted without biases load with zero biases.
    if (serialized.payload.contains("biases")) {
      std::vector<double> biasValues = serialized.payload.at("biases").get<std::vector<double>>();

      if (biasValues.size() != numLayers) {
        throw BackendError("expected " + std::to_string(numLayers) + " biases");
      }

      loadedBiases = biasValues;
    }
  } catch (const nlohmann::json::exception& e) {
    if (this->logLevel >= LogLevel::WARNING) {
      qWarning() << "native backend: malformed weights payload:" << e.what();
    }

    return false;
  } catch (const BackendError& e) {
    if (this->logLevel >= LogLevel::WARNING) {
      qWarning() << "native backend: incompatible weights:" << e.what();
    }

    return false;
  }

  this->weights = std::move(loadedWeights);
  this->biases = std::move(loadedBiases);
  this->state = BackendState::LOADED;

  return true;
}

//===================================================================================================================//

SerializedWeights BackendNative::exportWeights() const {
  this->requireReady("exportWeights");

  nlohmann::ordered_json weightsJson = nlohmann::ordered_json::array();

  for (const Matrix2D<double>& layerWeights : this->weights) {
    weightsJson.push_back(layerWeights.values());
  }

  SerializedWeights serialized;
  serialized.format = WeightsFormat::NATIVE_V1;
  serialized.payload["weights"] = weightsJson;
  serialized.payload["biases"] = this->biases;

  return serialized;
}

//===================================================================================================================//

void BackendNative::initialize() {
  ulong numLayers = this->numWeightLayers();

  this->weights.clear();
  this->biases.assign(numLayers, 0.0);

  std::uniform_real_distribution<double> unit(-1.0, 1.0);
  std::uniform_real_distribution<double> biasDist(0.0, 0.1);

  for (ulong l = 0; l < numLayers; l++) {
    ulong fanIn = this->layerSizes[l];
    ulong fanOut = this->layerSizes[l + 1];

    // He-style scale for ReLU layers
    double scale = std::sqrt(2.0 / static_cast<double>(fanIn));

    Matrix2D<double> layerWeights(fanIn, fanOut);

    for (ulong i = 0; i < fanIn; i++) {
      for (ulong j = 0; j < fanOut; j++) {
        layerWeights.at(i, j) = unit(this->rng) * scale;
      }
    }

    this->weights.push_back(std::move(layerWeights));
    this->biases[l] = biasDist(this->rng);
  }

  this->state = BackendState::LOADED;
}

//===================================================================================================================//

double BackendNative::predict(const Input& input) const {
  this->requireReady("predict");
  this->checkInput(input);

  Tensor2D actvs;
  Tensor2D zs;
  this->propagate(input, actvs, zs);

  return actvs.back()[0] * 100.0;
}

//===================================================================================================================//

// Per-example SGD over the whole set, reshuffled every epoch. batchSize and validationSplit are not used here.
TrainingResult BackendNative::train(const Samples& samples, const TrainingConfig& trainingConfig, const TrainingHooks& hooks) {
  this->requireReady("train");
  this->checkSamples(samples);

  if (!(trainingConfig.learningRate > 0 && std::isfinite(trainingConfig.learningRate))) {
    throw BackendError("learning rate must be positive");
  }

  ulong numSamples = samples.size();
  double learningRate = trainingConfig.learningRate;

  TrainingResult result;
  result.numTrainingSamples = numSamples;

  std::vector<ulong> sampleIndices(numSamples);
  std::iota(sampleIndices.begin(), sampleIndices.end(), 0);

  Tensor2D actvs;
  Tensor2D zs;
  Tensor2D deltas;

  for (ulong e = 0; e < trainingConfig.epochs; e++) {
    if (this->cancelled(hooks)) {
      throw TrainingCancelled();
    }

    std::shuffle(sampleIndices.begin(), sampleIndices.end(), this->rng);

    double totalLoss = 0;
    ulong numCorrect = 0;

    for (ulong s : sampleIndices) {
      const Sample& sample = samples[s];

      this->propagate(sample.input, actvs, zs);

      double prediction = actvs.back()[0];
      double target = sample.target / 100.0;
      double outputError = target - prediction;

      totalLoss += outputError * outputError;

      if (Backend::isCorrect(prediction, sample.target)) {
        numCorrect++;
      }

      this->backpropagate(outputError, zs, deltas);
      this->update(actvs, deltas, learningRate);
    }

    EpochRecord record;
    record.epoch = e;
    record.loss = totalLoss / static_cast<double>(numSamples);
    record.accuracy = static_cast<double>(numCorrect) / static_cast<double>(numSamples) * 100.0;

    if (!std::isfinite(record.loss)) {
      throw BackendError("training diverged at epoch " + std::to_string(e));
    }

    result.epochHistory.push_back(record);

    if (hooks.onEpoch) {
      hooks.onEpoch(record);
    }
  }

  if (!result.epochHistory.empty()) {
    result.finalLoss = result.epochHistory.back().loss;
    result.finalAccuracy = result.epochHistory.back().accuracy;
  }

  this->state = BackendState::TRAINED;

  if (this->logLevel >= LogLevel::INFO) {
    qInfo() << "native backend: training completed samples=" << numSamples << "finalLoss=" << result.finalLoss
            << "finalAccuracy=" << result.finalAccuracy;
  }

  return result;
}

//===================================================================================================================//

void BackendNative::propagate(const Input& input, Tensor2D& actvs, Tensor2D& zs) const {
  ulong numLayers = this->numWeightLayers();

  actvs.resize(numLayers + 1);
  zs.resize(numLayers + 1);

  actvs[0] = input;
  zs[0] = input;

  for (ulong l = 0; l < numLayers; l++) {
    const Matrix2D<double>& layerWeights = this->weights[l];
    ulong fanIn = layerWeights.rows();
    ulong fanOut = layerWeights.cols();

    ActvFuncType actvFuncType = (l == numLayers - 1) ? this->modelConfig.outputActivation : ActvFuncType::RELU;

    zs[l + 1].assign(fanOut, 0.0);
    actvs[l + 1].assign(fanOut, 0.0);

    for (ulong j = 0; j < fanOut; j++) {
      double z = this->biases[l];

      for (ulong i = 0; i < fanIn; i++) {
        z += actvs[l][i] * layerWeights(i, j);
      }

      zs[l + 1][j] = z;
      actvs[l + 1][j] = ActvFunc::calculate(z, actvFuncType);
    }
  }
}

//===================================================================================================================//

// deltas[l] holds the error terms of the outputs of weight layer l.
void BackendNative::backpropagate(double outputError, const Tensor2D& zs, Tensor2D& deltas) const {
  ulong numLayers = this->numWeightLayers();

  deltas.resize(numLayers);
  deltas[numLayers - 1] = {outputError * ActvFunc::calculate(zs[numLayers][0], this->modelConfig.outputActivation, true)};

  for (ulong l = numLayers - 1; l-- > 0;) {
    const Matrix2D<double>& nextWeights = this->weights[l + 1];
    ulong numNeurons = nextWeights.rows();
    ulong nextNumNeurons = nextWeights.cols();

    deltas[l].assign(numNeurons, 0.0);

    for (ulong i = 0; i < numNeurons; i++) {
      double errorSum = 0;

      for (ulong j = 0; j < nextNumNeurons; j++) {
        errorSum += deltas[l + 1][j] * nextWeights(i, j);
      }

      deltas[l][i] = errorSum * ActvFunc::calculate(zs[l + 1][i], ActvFuncType::RELU, true);
    }
  }
}

//===================================================================================================================//

// Error is target - prediction, so adding the gradient term descends the squared error.
void BackendNative::update(const Tensor2D& actvs, const Tensor2D& deltas, double learningRate) {
  ulong numLayers = this->numWeightLayers();

  for (ulong l = 0; l < numLayers; l++) {
    Matrix2D<double>& layerWeights = this->weights[l];
    ulong fanIn = layerWeights.rows();
    ulong fanOut = layerWeights.cols();

    for (ulong i = 0; i < fanIn; i++) {
      for (ulong j = 0; j < fanOut; j++) {
        layerWeights(i, j) += learningRate * actvs[l][i] * deltas[l][j];
      }
    }

    for (ulong j = 0; j < fanOut; j++) {
      this->biases[l] += learningRate * deltas[l][j] * 0.1;
    }
  }
}

//===================================================================================================================//
