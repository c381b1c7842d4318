#include "BPE_BackendTensor.hpp"
#include "BPE_Exceptions.hpp"

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>
#include <random>

using namespace BPE;

//===================================================================================================================//

const std::vector<double> BackendTensor::dropoutRates = {0.2, 0.1};

//===================================================================================================================//

BackendTensor::BackendTensor(const ModelConfig& modelConfig, LogLevel logLevel)
    : Backend(BackendType::TENSOR, modelConfig, logLevel) {
  this->layerSizes = modelConfig.layerSizes(modelConfig.tensorHiddenLayers);
  this->buildNet();
}

//===================================================================================================================//

void BackendTensor::buildNet() {
  ulong numLayers = this->layerSizes.size() - 1;

  this->net = torch::nn::Sequential();

  for (ulong l = 0; l < numLayers; l++) {
    auto fanIn = static_cast<int64_t>(this->layerSizes[l]);
    auto fanOut = static_cast<int64_t>(this->layerSizes[l + 1]);

    this->net->push_back(torch::nn::Linear(torch::nn::LinearOptions(fanIn, fanOut)));

    // Binary cross-entropy needs a probability, so the output unit is always a sigmoid
    if (l == numLayers - 1) {
      this->net->push_back(torch::nn::Sigmoid());
      break;
    }

    this->net->push_back(torch::nn::ReLU());

    if (l < dropoutRates.size() && dropoutRates[l] > 0) {
      this->net->push_back(torch::nn::Dropout(torch::nn::DropoutOptions(dropoutRates[l])));
    }
  }

  this->net->to(torch::kFloat64);
  this->net->eval();
}

//===================================================================================================================//

// Records alternate kernel and bias per Linear, in named_parameters() order. Kernels are stored [fanIn, fanOut]
// row-major; torch keeps Linear weights as [fanOut, fanIn].
bool BackendTensor::loadWeights(const SerializedWeights& serialized) {
  if (serialized.format != WeightsFormat::TENSOR_V1) {
    if (this->logLevel >= LogLevel::WARNING) {
      qWarning() << "tensor backend: refusing weights in format" << QString::fromStdString(WeightsFormats::typeToName(serialized.format));
    }

    return false;
  }

  auto params = this->net->named_parameters();
  std::vector<torch::Tensor> values;

  try {
    const nlohmann::ordered_json& records = serialized.payload;

    if (!records.is_array() || records.size() != params.size()) {
      throw BackendError("expected " + std::to_string(params.size()) + " tensor records");
    }

    ulong r = 0;

    for (const auto& item : params) {
      const torch::Tensor& param = item.value();
      bool isKernel = (param.dim() == 2);

      std::vector<double> data = records.at(r).at("data").get<std::vector<double>>();
      std::vector<ulong> shape = records.at(r).at("shape").get<std::vector<ulong>>();

      std::vector<ulong> expected = isKernel ? std::vector<ulong>{static_cast<ulong>(param.size(1)), static_cast<ulong>(param.size(0))}
                                             : std::vector<ulong>{static_cast<ulong>(param.size(0))};

      if (shape != expected) {
        throw BackendError("record " + std::to_string(r) + " (" + item.key() + ") has an unexpected shape");
      }

      ulong numValues = std::accumulate(shape.begin(), shape.end(), 1UL, std::multiplies<ulong>());

      if (data.size() != numValues) {
        throw BackendError("record " + std::to_string(r) + " holds " + std::to_string(data.size()) +
                           " values, shape needs " + std::to_string(numValues));
      }

      if (!std::all_of(data.begin(), data.end(), [](double value) { return std::isfinite(value); })) {
        throw BackendError("record " + std::to_string(r) + " contains a non-finite value");
      }

      torch::Tensor tensor = torch::tensor(data, torch::dtype(torch::kFloat64));

      if (isKernel) {
        tensor = tensor.view({static_cast<int64_t>(shape[0]), static_cast<int64_t>(shape[1])}).t().contiguous();
      }

      values.push_back(tensor);
      r++;
    }
  } catch (const nlohmann::json::exception& e) {
    if (this->logLevel >= LogLevel::WARNING) {
      qWarning() << "tensor backend: malformed weights payload:" << e.what();
    }

    return false;
  } catch (const BackendError& e) {
    if (this->logLevel >= LogLevel::WARNING) {
      qWarning() << "tensor backend: incompatible weights:" << e.what();
    }

    return false;
  }

  torch::NoGradGuard noGrad;
  ulong r = 0;

  for (auto& item : params) {
    item.value().copy_(values[r++]);
  }

  this->net->eval();
  this->state = BackendState::LOADED;

  return true;
}

//===================================================================================================================//

SerializedWeights BackendTensor::exportWeights() const {
  this->requireReady("exportWeights");

  nlohmann::ordered_json records = nlohmann::ordered_json::array();

  for (const auto& item : this->net->named_parameters()) {
    torch::Tensor value = item.value().detach();
    nlohmann::ordered_json shape = nlohmann::ordered_json::array();

    if (value.dim() == 2) {
      value = value.t();
      shape = {static_cast<ulong>(value.size(0)), static_cast<ulong>(value.size(1))};
    } else {
      shape.push_back(static_cast<ulong>(value.size(0)));
    }

    value = value.contiguous().to(torch::kFloat64);
    const double* begin = value.data_ptr<double>();

    records.push_back({
      {"data", std::vector<double>(begin, begin + value.numel())},
      {"shape", shape}
    });
  }

  SerializedWeights serialized;
  serialized.format = WeightsFormat::TENSOR_V1;
  serialized.payload = records;

  return serialized;
}

//===================================================================================================================//

// He-normal kernels, zero biases. Drawn from the backend's own generator so seed() reproduces them.
void BackendTensor::initialize() {
  torch::NoGradGuard noGrad;

  for (auto& item : this->net->named_parameters()) {
    torch::Tensor& param = item.value();

    if (param.dim() != 2) {
      param.zero_();
      continue;
    }

    std::normal_distribution<double> dist(0.0, std::sqrt(2.0 / static_cast<double>(param.size(1))));
    std::vector<double> values(static_cast<size_t>(param.numel()));

    for (double& value : values) {
      value = dist(this->rng);
    }

    param.copy_(torch::tensor(values, torch::dtype(torch::kFloat64)).view(param.sizes()));
  }

  this->net->eval();
  this->state = BackendState::LOADED;
}

//===================================================================================================================//

double BackendTensor::predict(const Input& input) const {
  this->requireReady("predict");
  this->checkInput(input);

  torch::NoGradGuard noGrad;

  torch::Tensor row = torch::tensor(input, torch::dtype(torch::kFloat64)).view({1, static_cast<int64_t>(input.size())});

  return this->net->forward(row).item<double>() * 100.0;
}

//===================================================================================================================//

TrainingResult BackendTensor::train(const Samples& samples, const TrainingConfig& trainingConfig, const TrainingHooks& hooks) {
  this->requireReady("train");
  this->checkSamples(samples);

  if (!(trainingConfig.learningRate > 0 && std::isfinite(trainingConfig.learningRate))) {
    throw BackendError("learning rate must be positive");
  }

  ulong numSamples = samples.size();
  ulong numTraining = numSamples;

  // The trailing fraction is held out, before any shuffling.
  if (trainingConfig.validationSplit > 0 && trainingConfig.validationSplit < 1) {
    numTraining = static_cast<ulong>(std::floor(static_cast<double>(numSamples) * (1.0 - trainingConfig.validationSplit)));

    if (numTraining == 0) {
      numTraining = numSamples;
    }
  }

  ulong numValidation = numSamples - numTraining;
  ulong batchSize = std::max<ulong>(1, trainingConfig.batchSize);

  std::vector<ulong> trainingIndices(numTraining);
  std::iota(trainingIndices.begin(), trainingIndices.end(), 0);

  std::vector<ulong> validationIndices(numValidation);
  std::iota(validationIndices.begin(), validationIndices.end(), numTraining);

  torch::Tensor validationInputs;
  torch::Tensor validationTargets;

  if (numValidation > 0) {
    validationInputs = this->toTensor(samples, validationIndices, 0, numValidation, validationTargets);
  }

  // Dropout masks come from torch's generator
  torch::manual_seed(this->rng());

  torch::optim::Adam optimizer(this->net->parameters(), torch::optim::AdamOptions(trainingConfig.learningRate)
                                                          .betas(std::make_tuple(adamBeta1, adamBeta2))
                                                          .eps(adamEpsilon));

  TrainingResult result;
  result.numTrainingSamples = numTraining;
  result.numValidationSamples = numValidation;

  for (ulong e = 0; e < trainingConfig.epochs; e++) {
    if (this->cancelled(hooks)) {
      this->net->eval();
      throw TrainingCancelled();
    }

    std::shuffle(trainingIndices.begin(), trainingIndices.end(), this->rng);

    this->net->train();

    double totalLoss = 0;
    ulong numCorrect = 0;

    for (ulong begin = 0; begin < numTraining; begin += batchSize) {
      ulong end = std::min(begin + batchSize, numTraining);

      torch::Tensor targets;
      torch::Tensor inputs = this->toTensor(samples, trainingIndices, begin, end, targets);

      optimizer.zero_grad();

      torch::Tensor output = this->net->forward(inputs);
      torch::Tensor loss = torch::nn::functional::binary_cross_entropy(output, targets);

      loss.backward();
      optimizer.step();

      totalLoss += loss.item<double>() * static_cast<double>(end - begin);
      numCorrect += countCorrect(output.detach(), targets);
    }

    this->net->eval();

    EpochRecord record;
    record.epoch = e;
    record.loss = totalLoss / static_cast<double>(numTraining);
    record.accuracy = static_cast<double>(numCorrect) / static_cast<double>(numTraining) * 100.0;

    if (!std::isfinite(record.loss)) {
      throw BackendError("training diverged at epoch " + std::to_string(e));
    }

    if (numValidation > 0) {
      torch::NoGradGuard noGrad;

      torch::Tensor validationOutput = this->net->forward(validationInputs);
      record.validationLoss = torch::nn::functional::binary_cross_entropy(validationOutput, validationTargets).item<double>();
      record.validationAccuracy = static_cast<double>(countCorrect(validationOutput, validationTargets)) /
                                  static_cast<double>(numValidation) * 100.0;
    }

    result.epochHistory.push_back(record);

    if (this->logLevel >= LogLevel::DEBUG) {
      qDebug() << "tensor backend: epoch=" << e << "loss=" << record.loss << "accuracy=" << record.accuracy;
    }

    if (hooks.onEpoch) {
      hooks.onEpoch(record);
    }
  }

  if (!result.epochHistory.empty()) {
    const EpochRecord& last = result.epochHistory.back();
    result.finalLoss = last.loss;
    result.finalAccuracy = last.accuracy;
    result.finalValidationLoss = last.validationLoss;
    result.finalValidationAccuracy = last.validationAccuracy;
  }

  this->state = BackendState::TRAINED;

  if (this->logLevel >= LogLevel::INFO) {
    qInfo() << "tensor backend: training completed samples=" << numTraining << "validation=" << numValidation
            << "finalLoss=" << result.finalLoss << "finalAccuracy=" << result.finalAccuracy;
  }

  return result;
}

//===================================================================================================================//

torch::Tensor BackendTensor::toTensor(const Samples& samples, const std::vector<ulong>& indices, ulong begin, ulong end,
                                      torch::Tensor& targets) const {
  ulong numRows = end - begin;
  ulong numCols = this->layerSizes.front();

  std::vector<double> inputValues;
  std::vector<double> targetValues;
  inputValues.reserve(numRows * numCols);
  targetValues.reserve(numRows);

  for (ulong r = begin; r < end; r++) {
    const Sample& sample = samples[indices[r]];

    inputValues.insert(inputValues.end(), sample.input.begin(), sample.input.end());
    targetValues.push_back(sample.target / 100.0);
  }

  targets = torch::tensor(targetValues, torch::dtype(torch::kFloat64)).view({static_cast<int64_t>(numRows), 1});

  return torch::tensor(inputValues, torch::dtype(torch::kFloat64)).view({static_cast<int64_t>(numRows), static_cast<int64_t>(numCols)});
}

//===================================================================================================================//

ulong BackendTensor::countCorrect(const torch::Tensor& output, const torch::Tensor& targets) {
  auto outputs = output.accessor<double, 2>();
  auto expected = targets.accessor<double, 2>();
  ulong numCorrect = 0;

  for (int64_t r = 0; r < output.size(0); r++) {
    if (Backend::isCorrect(outputs[r][0], expected[r][0] * 100.0)) {
      numCorrect++;
    }
  }

  return numCorrect;
}

//===================================================================================================================//
