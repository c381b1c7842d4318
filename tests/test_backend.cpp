#include "test_helpers.hpp"

//===================================================================================================================//

// Two features, one hidden layer of two neurons, in both backends.
static BPE::ModelConfig makeTinyConfig() {
  BPE::ModelConfig modelConfig;
  modelConfig.inputFeatures = {"a", "b"};
  modelConfig.hiddenLayers = {2};
  modelConfig.tensorHiddenLayers = {2};

  return modelConfig;
}

static BPE::SerializedWeights makeTinyNativeWeights() {
  BPE::SerializedWeights weights;
  weights.format = BPE::WeightsFormat::NATIVE_V1;
  weights.payload = {
    {"weights", {std::vector<double>{0.5, -0.5, 0.25, 0.25}, std::vector<double>{1.0, 1.0}}},
    {"biases", std::vector<double>{0.1, 0.0}}
  };

  return weights;
}

static BPE::SerializedWeights makeTinyTensorWeights() {
  nlohmann::ordered_json records = nlohmann::ordered_json::array();
  records.push_back({{"data", std::vector<double>{0.5, -0.5, 0.25, 0.25}}, {"shape", std::vector<ulong>{2, 2}}});
  records.push_back({{"data", std::vector<double>{0.1, 0.1}}, {"shape", std::vector<ulong>{2}}});
  records.push_back({{"data", std::vector<double>{1.0, 1.0}}, {"shape", std::vector<ulong>{2, 1}}});
  records.push_back({{"data", std::vector<double>{0.0}}, {"shape", std::vector<ulong>{1}}});

  BPE::SerializedWeights weights;
  weights.format = BPE::WeightsFormat::TENSOR_V1;
  weights.payload = records;

  return weights;
}

static double sigmoid(double x) {
  return 1.0 / (1.0 + std::exp(-x));
}

//===================================================================================================================//

static void testNativeForward() {
  std::cout << "--- testNativeForward ---" << std::endl;

  BPE::BackendNative backend(makeTinyConfig());
  CHECK(backend.loadWeights(makeTinyNativeWeights()), "tiny native weights load");

  // Hidden z = (0.85, -0.15) -> relu (0.85, 0), output z = 0.85
  CHECK_NEAR(backend.predict({1.0, 1.0}), sigmoid(0.85) * 100.0, 1e-9, "forward pass matches hand computation");

  // Hidden z = (0.1, 0.1), output z = 0.2
  CHECK_NEAR(backend.predict({0.0, 0.0}), sigmoid(0.2) * 100.0, 1e-9, "bias only path");
}

//===================================================================================================================//

static void testNativeSgdStep() {
  std::cout << "--- testNativeSgdStep ---" << std::endl;

  BPE::BackendNative backend(makeTinyConfig());
  backend.loadWeights(makeTinyNativeWeights());

  BPE::TrainingConfig trainingConfig;
  trainingConfig.epochs = 1;
  trainingConfig.learningRate = 0.5;

  backend.train({{{1.0, 1.0}, 100.0}}, trainingConfig);

  double p = sigmoid(0.85);
  double outputDelta = (1.0 - p) * p * (1.0 - p);

  const auto& weights = backend.getWeights();
  const auto& biases = backend.getBiases();

  // Only the active hidden neuron receives a delta
  CHECK_NEAR(weights[0].at(0, 0), 0.5 + 0.5 * outputDelta, 1e-12, "w0(0,0) updated");
  CHECK_NEAR(weights[0].at(1, 0), 0.25 + 0.5 * outputDelta, 1e-12, "w0(1,0) updated");
  CHECK_NEAR(weights[0].at(0, 1), -0.5, 1e-12, "w0(0,1) untouched behind inactive relu");
  CHECK_NEAR(weights[0].at(1, 1), 0.25, 1e-12, "w0(1,1) untouched behind inactive relu");
  CHECK_NEAR(weights[1].at(0, 0), 1.0 + 0.5 * 0.85 * outputDelta, 1e-12, "w1(0,0) scaled by hidden activation");
  CHECK_NEAR(weights[1].at(1, 0), 1.0, 1e-12, "w1(1,0) untouched, zero activation");
  CHECK_NEAR(biases[0], 0.1 + 0.5 * outputDelta * 0.1, 1e-12, "hidden bias damped by 0.1");
  CHECK_NEAR(biases[1], 0.5 * outputDelta * 0.1, 1e-12, "output bias damped by 0.1");
  CHECK(backend.getState() == BPE::BackendState::TRAINED, "state TRAINED after train");
}

//===================================================================================================================//

static void testTensorForward() {
  std::cout << "--- testTensorForward ---" << std::endl;

  BPE::BackendTensor backend(makeTinyConfig());
  CHECK(backend.loadWeights(makeTinyTensorWeights()), "tiny tensor weights load");

  CHECK_NEAR(backend.predict({1.0, 1.0}), sigmoid(0.85) * 100.0, 1e-9, "tensor forward matches native");

  // No dropout at inference
  double first = backend.predict({0.3, 0.9});
  bool stable = true;

  for (int i = 0; i < 20; i++) {
    stable = stable && backend.predict({0.3, 0.9}) == first;
  }

  CHECK(stable, "inference is deterministic");
}

//===================================================================================================================//

static void testUnloadedBackend() {
  std::cout << "--- testUnloadedBackend ---" << std::endl;

  BPE::ModelConfig modelConfig = BPE::ModelConfig::defaults();
  BPE::Input input(modelConfig.inputFeatures.size(), 0.5);

  for (BPE::BackendType backendType : {BPE::BackendType::TENSOR, BPE::BackendType::NATIVE}) {
    std::unique_ptr<BPE::Backend> backend = BPE::Backend::makeBackend(backendType, modelConfig);
    std::string name = BPE::Backends::typeToName(backendType);

    CHECK(backend->getState() == BPE::BackendState::UNLOADED, name + " starts UNLOADED");
    CHECK_THROWS_AS(backend->predict(input), BPE::BackendError, name + " predict on UNLOADED throws");
    CHECK_THROWS_AS(backend->train({{input, 50.0}}, BPE::TrainingConfig()), BPE::BackendError, name + " train on UNLOADED throws");
    CHECK_THROWS_AS(backend->exportWeights(), BPE::BackendError, name + " export on UNLOADED throws");

    backend->initialize();
    CHECK(backend->getState() == BPE::BackendState::LOADED, name + " LOADED after initialize");
    CHECK_THROWS_AS(backend->predict(BPE::Input(3, 0.5)), BPE::BackendError, name + " wrong input length throws");
  }

  BPE::ModelConfig noFeatures = modelConfig;
  noFeatures.inputFeatures.clear();
  CHECK_THROWS_AS(BPE::BackendNative backend(noFeatures), BPE::ConfigurationError, "no features rejected");
}

//===================================================================================================================//

static void testFormatRefusal() {
  std::cout << "--- testFormatRefusal ---" << std::endl;

  BPE::BackendNative native(makeTinyConfig());
  BPE::BackendTensor tensor(makeTinyConfig());

  CHECK(!native.loadWeights(makeTinyTensorWeights()), "native refuses tensor-v1");
  CHECK(!tensor.loadWeights(makeTinyNativeWeights()), "tensor refuses native-v1");
  CHECK(!native.loadWeights(BPE::SerializedWeights()), "native refuses untagged weights");
  CHECK(native.getState() == BPE::BackendState::UNLOADED, "refusal leaves native UNLOADED");

  BPE::SerializedWeights wrongSize = makeTinyNativeWeights();
  wrongSize.payload["weights"][0] = std::vector<double>{0.5, 0.5, 0.5};
  CHECK(!native.loadWeights(wrongSize), "native refuses mismatched layer size");

  BPE::SerializedWeights wrongLayers = makeTinyNativeWeights();
  wrongLayers.payload["weights"].erase(1);
  CHECK(!native.loadWeights(wrongLayers), "native refuses missing layer");

  BPE::SerializedWeights malformed;
  malformed.format = BPE::WeightsFormat::NATIVE_V1;
  malformed.payload = "garbage";
  CHECK(!native.loadWeights(malformed), "native refuses malformed payload");

  BPE::SerializedWeights wrongShape = makeTinyTensorWeights();
  wrongShape.payload[0]["shape"] = std::vector<ulong>{1, 4};
  CHECK(!tensor.loadWeights(wrongShape), "tensor refuses transposed shape");

  BPE::SerializedWeights shortRecords = makeTinyTensorWeights();
  shortRecords.payload.erase(3);
  CHECK(!tensor.loadWeights(shortRecords), "tensor refuses missing record");

  BPE::SerializedWeights noBiases = makeTinyNativeWeights();
  noBiases.payload.erase("biases");
  CHECK(native.loadWeights(noBiases), "native accepts weights without biases");
  CHECK_NEAR(native.predict({0.0, 0.0}), 50.0, 1e-9, "missing biases load as zero");
}

//===================================================================================================================//

static void testDeterminismAndExport() {
  std::cout << "--- testDeterminismAndExport ---" << std::endl;

  BPE::ModelConfig modelConfig = BPE::ModelConfig::defaults();
  BPE::Samples samples = makeSeparableSamples(5, modelConfig.inputFeatures.size(), 7);

  for (BPE::BackendType backendType : {BPE::BackendType::TENSOR, BPE::BackendType::NATIVE}) {
    std::string name = BPE::Backends::typeToName(backendType);

    std::unique_ptr<BPE::Backend> backend = BPE::Backend::makeBackend(backendType, modelConfig);
    backend->seed(11);
    backend->initialize();

    std::unique_ptr<BPE::Backend> restored = BPE::Backend::makeBackend(backendType, modelConfig);
    CHECK(restored->loadWeights(backend->exportWeights()), name + " loads its own export");
    CHECK(restored->exportWeights().format == backend->getWeightsFormat(), name + " export is tagged with its format");

    for (const BPE::Sample& sample : samples) {
      double score = backend->predict(sample.input);

      CHECK(score >= 0.0 && score <= 100.0, name + " score within [0, 100]");
      CHECK(score == backend->predict(sample.input), name + " same input, same score");
      CHECK_NEAR(restored->predict(sample.input), score, 1e-9, name + " restored backend predicts the same");
    }
  }
}

//===================================================================================================================//

static void testTensorExportShapes() {
  std::cout << "--- testTensorExportShapes ---" << std::endl;

  BPE::BackendTensor backend(BPE::ModelConfig::defaults());
  backend.initialize();

  BPE::SerializedWeights weights = backend.exportWeights();
  const nlohmann::ordered_json& records = weights.payload;

  CHECK(records.size() == 6, "six tensor records");
  CHECK(records[0]["shape"] == nlohmann::ordered_json({11, 64}), "kernel 1 [11, 64]");
  CHECK(records[1]["shape"] == nlohmann::ordered_json::array({64}), "bias 1 [64]");
  CHECK(records[2]["shape"] == nlohmann::ordered_json({64, 32}), "kernel 2 [64, 32]");
  CHECK(records[4]["shape"] == nlohmann::ordered_json({32, 1}), "kernel 3 [32, 1]");
  CHECK(records[5]["shape"] == nlohmann::ordered_json::array({1}), "bias 3 [1]");
  CHECK(records[0]["data"].size() == 11 * 64, "kernel 1 data size");

  bool zeroBias = true;

  for (const auto& value : records[1]["data"]) {
    zeroBias = zeroBias && value.get<double>() == 0.0;
  }

  CHECK(zeroBias, "biases initialised to zero");
}

//===================================================================================================================//

static void testAccuracyTolerance() {
  std::cout << "--- testAccuracyTolerance ---" << std::endl;

  CHECK(BPE::Backend::isCorrect(0.80, 90.0), "10 points off is correct");
  CHECK(!BPE::Backend::isCorrect(0.75, 90.0), "15 points off is not");
  CHECK(BPE::Backend::isCorrect(0.10, 10.0), "exact is correct");
}

//===================================================================================================================//

// Training on a separable set must beat the randomly initialised weights on the same data.
static void testLearnsSeparableData(BPE::BackendType backendType, const BPE::TrainingConfig& trainingConfig) {
  std::string name = BPE::Backends::typeToName(backendType);
  std::cout << "--- testLearnsSeparableData (" << name << ") ---" << std::endl;

  BPE::ModelConfig modelConfig = BPE::ModelConfig::defaults();
  BPE::Samples samples = makeSeparableSamples(60, modelConfig.inputFeatures.size(), 42);

  std::unique_ptr<BPE::Backend> backend = BPE::Backend::makeBackend(backendType, modelConfig);
  backend->seed(100);
  backend->initialize();

  double untrainedAccuracy = backend->test(samples).accuracy;
  BPE::TrainingResult result = backend->train(samples, trainingConfig);
  double trainedAccuracy = backend->test(samples).accuracy;

  std::cout << "  untrained=" << untrainedAccuracy << "% final=" << result.finalAccuracy << "% tested=" << trainedAccuracy << "%"
            << std::endl;

  CHECK(trainedAccuracy > untrainedAccuracy, name + " trained accuracy beats untrained");
  CHECK(result.epochHistory.back().loss < result.epochHistory.front().loss, name + " loss falls over training");
}

//===================================================================================================================//

static void testRejectsBadLearningRate() {
  std::cout << "--- testRejectsBadLearningRate ---" << std::endl;

  BPE::ModelConfig modelConfig = BPE::ModelConfig::defaults();
  BPE::Samples samples = makeSeparableSamples(10, modelConfig.inputFeatures.size(), 5);

  for (BPE::BackendType backendType : {BPE::BackendType::TENSOR, BPE::BackendType::NATIVE}) {
    std::string name = BPE::Backends::typeToName(backendType);
    std::unique_ptr<BPE::Backend> backend = BPE::Backend::makeBackend(backendType, modelConfig);
    backend->seed(1);
    backend->initialize();
    BPE::SerializedWeights before = backend->exportWeights();

    BPE::TrainingConfig trainingConfig;
    trainingConfig.epochs = 2;
    trainingConfig.learningRate = 0;
    CHECK_THROWS_AS(backend->train(samples, trainingConfig), BPE::BackendError, name + " rejects learning rate 0");

    trainingConfig.learningRate = std::nan("");
    CHECK_THROWS_AS(backend->train(samples, trainingConfig), BPE::BackendError, name + " rejects NaN learning rate");
    CHECK(backend->exportWeights().payload == before.payload, name + " weights untouched");
  }
}

//===================================================================================================================//

static void testTrainingHooks() {
  std::cout << "--- testTrainingHooks ---" << std::endl;

  BPE::ModelConfig modelConfig = BPE::ModelConfig::defaults();
  BPE::Samples samples = makeSeparableSamples(20, modelConfig.inputFeatures.size(), 3);

  BPE::TrainingConfig trainingConfig;
  trainingConfig.epochs = 6;
  trainingConfig.batchSize = 4;
  trainingConfig.validationSplit = 0.2;

  for (BPE::BackendType backendType : {BPE::BackendType::TENSOR, BPE::BackendType::NATIVE}) {
    std::string name = BPE::Backends::typeToName(backendType);
    std::unique_ptr<BPE::Backend> backend = BPE::Backend::makeBackend(backendType, modelConfig);
    backend->initialize();

    std::vector<ulong> epochs;
    BPE::TrainingHooks hooks;
    hooks.onEpoch = [&epochs](const BPE::EpochRecord& record) { epochs.push_back(record.epoch); };

    BPE::TrainingResult result = backend->train(samples, trainingConfig, hooks);

    CHECK(epochs == std::vector<ulong>({0, 1, 2, 3, 4, 5}), name + " reports every epoch in order");
    CHECK(result.epochHistory.size() == 6, name + " history holds every epoch");
    CHECK(result.finalLoss == result.epochHistory.back().loss, name + " final loss is the last epoch's");

    if (backendType == BPE::BackendType::TENSOR) {
      CHECK(result.numTrainingSamples == 16 && result.numValidationSamples == 4, "tensor holds out the trailing 20%");
      CHECK(result.finalValidationLoss.has_value(), "tensor reports validation loss");
    } else {
      CHECK(result.numTrainingSamples == 20 && result.numValidationSamples == 0, "native trains on every sample");
      CHECK(!result.finalValidationLoss.has_value(), "native reports no validation loss");
    }

    // Cancelled after the third epoch
    std::unique_ptr<BPE::Backend> cancelled = BPE::Backend::makeBackend(backendType, modelConfig);
    cancelled->initialize();

    ulong completed = 0;
    BPE::TrainingHooks cancelHooks;
    cancelHooks.onEpoch = [&completed](const BPE::EpochRecord&) { completed++; };
    cancelHooks.isCancelled = [&completed]() { return completed >= 3; };

    CHECK_THROWS_AS(cancelled->train(samples, trainingConfig, cancelHooks), BPE::TrainingCancelled, name + " cancellation throws");
    CHECK(completed == 3, name + " stops between epochs");
    CHECK(cancelled->getState() == BPE::BackendState::LOADED, name + " cancelled backend is not TRAINED");
  }
}

//===================================================================================================================//

void runBackendTests() {
  testNativeForward();
  testNativeSgdStep();
  testTensorForward();
  testUnloadedBackend();
  testFormatRefusal();
  testDeterminismAndExport();
  testTensorExportShapes();
  testAccuracyTolerance();

  BPE::TrainingConfig nativeConfig;
  nativeConfig.epochs = 150;
  nativeConfig.learningRate = 0.1;
  testLearnsSeparableData(BPE::BackendType::NATIVE, nativeConfig);

  BPE::TrainingConfig tensorConfig;
  tensorConfig.epochs = 150;
  tensorConfig.learningRate = 0.01;
  tensorConfig.batchSize = 8;
  tensorConfig.validationSplit = 0.0;
  testLearnsSeparableData(BPE::BackendType::TENSOR, tensorConfig);

  testRejectsBadLearningRate();
  testTrainingHooks();
}
