#include "test_helpers.hpp"

#include <QThread>

//===================================================================================================================//

namespace {
  // Prediction service over an in-memory repository, without the engine facade.
  struct PredictionFixture {
    FakeEntities entities;
    BPE::EngineConfig engineConfig = makeEngineConfig();
    std::shared_ptr<BPE::MemoryRepository> repository = std::make_shared<BPE::MemoryRepository>();
    std::shared_ptr<BPE::ModelCache> modelCache = std::make_shared<BPE::ModelCache>(BPE::LogLevel::QUIET);
    BPE::ModelRegistry modelRegistry{this->repository, this->engineConfig};
    BPE::PredictionService service{this->repository, this->modelRegistry, this->entities, this->entities, this->engineConfig,
                                   this->modelCache};

    // Flips the organisation's model to ACTIVE with all-zero native weights.
    BPE::Model activate(const std::string& organisationId) {
      BPE::Model model = this->modelRegistry.getOrCreate(organisationId);

      return this->repository->updateModel(model.id, [](BPE::Model& target) {
        target.status = BPE::ModelStatus::ACTIVE;
        target.weights = makeZeroNativeWeights(target.modelConfig);
        target.weightsRevision++;
      });
    }
  };
}

//===================================================================================================================//

static void testStatisticalOnlyPrediction() {
  std::cout << "--- testStatisticalOnlyPrediction ---" << std::endl;

  PredictionFixture fixture;
  fixture.entities.add("site-1", "org-1", makeBreakdown(72, 60));

  BPE::Prediction prediction = fixture.service.predictBreach("site-1", "org-1");

  CHECK(!prediction.mlScore.has_value(), "no ML score without a trained model");
  CHECK(!prediction.backendName.has_value(), "no backend name");
  CHECK(prediction.sourceLabel == BPE::SourceLabel::STATISTICAL, "Statistical");
  CHECK(prediction.combinedScore == 72, "combined score equals the statistical score");
  CHECK(prediction.combinedConfidence == 85, "statistical confidence");
  CHECK(prediction.riskCategory == BPE::RiskCategory::HIGH, "72 is HIGH");
  CHECK(prediction.daysToBreach == std::optional<int>(84), "(100 - 72) * 3 days");
  CHECK(prediction.inputFeatures.size() == 11, "features recorded");
  CHECK(prediction.expiresAt - prediction.createdAt == std::chrono::hours(24), "expires after the TTL");
  CHECK(fixture.entities.scoreCalls == 1, "breakdown computed once per prediction");

  std::optional<BPE::Prediction> stored = fixture.repository->findPrediction(prediction.id);
  CHECK(stored && stored->combinedScore == 72, "prediction persisted");

  BPE::Model model = fixture.modelRegistry.getOrCreate("org-1");
  CHECK(model.id == prediction.modelId, "model created on first prediction");
  CHECK(model.status == BPE::ModelStatus::TRAINING, "new model is not yet usable");
  CHECK(model.totalPredictions == 1, "prediction counted");

  CHECK_THROWS_AS(fixture.service.predictBreach("site-1", "org-2"), BPE::NotFoundError, "other organisation's entity");
}

//===================================================================================================================//

static void testDefaultChainUsesNative() {
  std::cout << "--- testDefaultChainUsesNative ---" << std::endl;

  PredictionFixture fixture;
  fixture.entities.add("site-1", "org-1", makeBreakdown(80, 60));
  fixture.activate("org-1");

  BPE::Prediction prediction = fixture.service.predictBreach("site-1", "org-1");

  // Native weights cannot load into the tensor backend; the chain falls through to native at exactly 50
  CHECK(prediction.backendName == std::optional<std::string>("native"), "native backend answered");
  CHECK(prediction.mlScore == std::optional<double>(50), "zero weights score 50");
  CHECK(prediction.mlConfidence == std::optional<double>(50), "30 + 50 * 0.4 confidence");
  CHECK(prediction.sourceLabel == BPE::SourceLabel::ML_ENHANCED, "ML-Enhanced");

  // (80 * 85 + 50 * 50) / 135 = 68.9
  CHECK(prediction.combinedScore == 69, "blended score");
  CHECK(prediction.combinedConfidence == 68, "blended confidence round(67.5)");
  CHECK(prediction.riskCategory == BPE::RiskCategory::MEDIUM, "69 is MEDIUM");
}

//===================================================================================================================//

static void testFallbackChain() {
  std::cout << "--- testFallbackChain ---" << std::endl;

  PredictionFixture fixture;
  fixture.entities.add("site-1", "org-1", makeBreakdown(60, 60));
  fixture.activate("org-1");

  BPE::BackendChain chain(BPE::LogLevel::QUIET);
  chain.addStrategy(makeThrowingStrategy("tensor", 40));
  chain.addStrategy(makeFixedStrategy("native", 77.4, 30));
  fixture.service.setBackendChain(chain);

  BPE::Prediction prediction = fixture.service.predictBreach("site-1", "org-1");
  CHECK(prediction.backendName == std::optional<std::string>("native"), "second strategy answered");
  CHECK(prediction.mlScore == std::optional<double>(77), "score rounded");
  CHECK(prediction.sourceLabel == BPE::SourceLabel::ML_ENHANCED, "ML-Enhanced after fallback");

  BPE::BackendChain broken(BPE::LogLevel::QUIET);
  broken.addStrategy(makeThrowingStrategy("tensor", 40));
  broken.addStrategy(makeThrowingStrategy("native", 30));
  fixture.service.setBackendChain(broken);

  BPE::Prediction statistical = fixture.service.predictBreach("site-1", "org-1");
  CHECK(!statistical.mlScore.has_value(), "every backend failing leaves no ML score");
  CHECK(statistical.sourceLabel == BPE::SourceLabel::STATISTICAL, "Statistical when the chain is exhausted");
  CHECK(statistical.combinedScore == 60, "statistical score used");

  BPE::BackendChain clamped(BPE::LogLevel::QUIET);
  clamped.addStrategy(makeFixedStrategy("native", 140, 30));
  fixture.service.setBackendChain(clamped);
  CHECK(fixture.service.predictBreach("site-1", "org-1").mlScore == std::optional<double>(100), "score clamped to 100");
}

//===================================================================================================================//

static void testChainRun() {
  std::cout << "--- testChainRun ---" << std::endl;

  BPE::Model model;
  model.id = "m-1";
  model.trainingAccuracy = 80;
  model.feedbackCount = 4;

  BPE::BackendChain chain(BPE::LogLevel::QUIET);
  chain.addStrategy(makeThrowingStrategy("first", 40));
  chain.addStrategy(makeFixedStrategy("second", 55, 30));
  chain.addStrategy(makeFixedStrategy("third", 99, 30));

  BPE::ChainResult result = chain.run(model, {0.5}, "site-1");
  CHECK(result.hasResult && result.backendName == "second", "stops at the first success");
  CHECK(result.failures.size() == 1, "one failure recorded");
  CHECK(result.mlConfidence == 70, "30 + 80 * 0.4 + 4 * 2");

  CHECK(BPE::BackendChain::confidenceFor(40, model) == 80, "tensor confidence");

  model.trainingAccuracy = 100;
  model.feedbackCount = 50;
  CHECK(BPE::BackendChain::confidenceFor(40, model) == 95, "confidence capped at 95");

  BPE::BackendChain empty(BPE::LogLevel::QUIET);
  CHECK(!empty.run(model, {0.5}, "site-1").hasResult, "empty chain has no result");

  BPE::BackendStrategy noFunction = {"null", 10, 0, BPE::PredictFunction()};
  CHECK_THROWS_AS(chain.addStrategy(noFunction), BPE::ConfigurationError, "strategy without a function");
}

//===================================================================================================================//

static void testTimeout() {
  std::cout << "--- testTimeout ---" << std::endl;

  BPE::Model model;
  model.id = "m-1";

  BPE::BackendStrategy slow = {"slow", 40, 50, [](const BPE::Model&, const BPE::Input&) {
    QThread::msleep(500);
    return 90.0;
  }};

  BPE::BackendChain chain(BPE::LogLevel::QUIET);
  chain.addStrategy(slow);
  chain.addStrategy(makeFixedStrategy("fallback", 20, 30));

  BPE::ChainResult result = chain.run(model, {0.5}, "site-1");
  CHECK(result.hasResult && result.backendName == "fallback", "slow strategy abandoned after its timeout");
  CHECK(result.failures.size() == 1 && result.failures[0].find("timed out") != std::string::npos, "timeout reported");

  BPE::BackendChain bounded(BPE::LogLevel::QUIET);
  bounded.addStrategy(makeFixedStrategy("quick", 33, 40, 1000));
  BPE::ChainResult quick = bounded.run(model, {0.5}, "site-1");
  CHECK(quick.hasResult && quick.mlScore == 33, "bounded call within its timeout succeeds");
}

//===================================================================================================================//

static void testModelCache() {
  std::cout << "--- testModelCache ---" << std::endl;

  PredictionFixture fixture;
  fixture.entities.add("site-1", "org-1", makeBreakdown(50));
  BPE::Model model = fixture.activate("org-1");

  BPE::BackendChain chain(BPE::LogLevel::QUIET);
  chain.addStrategy({"native", 30, 0, BPE::BackendChain::cachedBackend(fixture.modelCache, BPE::BackendType::NATIVE)});
  fixture.service.setBackendChain(chain);

  fixture.service.predictBreach("site-1", "org-1");
  fixture.service.predictBreach("site-1", "org-1");
  CHECK(fixture.modelCache->getLoadCount() == 1, "loaded backend reused");
  CHECK(fixture.modelCache->size() == 1, "one cached backend");

  fixture.modelCache->invalidate(model.id);
  CHECK(fixture.modelCache->size() == 0, "invalidate drops the model's backends");

  fixture.service.predictBreach("site-1", "org-1");
  CHECK(fixture.modelCache->getLoadCount() == 2, "reloaded after invalidation");

  // A new weights revision is never served from a stale entry
  fixture.repository->updateModel(model.id, [](BPE::Model& target) { target.weightsRevision++; });
  fixture.service.predictBreach("site-1", "org-1");
  CHECK(fixture.modelCache->getLoadCount() == 3, "reloaded after a revision bump");

  CHECK(fixture.modelCache->get(fixture.modelRegistry.get(model.id), BPE::BackendType::TENSOR) == nullptr,
        "tensor backend cannot load native weights");
}

//===================================================================================================================//

static void testBatchPredictions() {
  std::cout << "--- testBatchPredictions ---" << std::endl;

  PredictionFixture fixture;
  fixture.engineConfig.batchPredictionLimit = 4;
  BPE::PredictionService service(fixture.repository, fixture.modelRegistry, fixture.entities, fixture.entities, fixture.engineConfig,
                                 fixture.modelCache);

  addPortfolio(fixture.entities, "org-1", 6);

  std::vector<std::string> ids = {"entity-5", "entity-0", "entity-3", "entity-1", "entity-2", "entity-4"};
  std::vector<BPE::Prediction> predictions = service.predictBatch(ids, "org-1");

  CHECK(predictions.size() == 4, "batch truncated to the limit");

  bool ordered = true;
  for (ulong i = 0; i < predictions.size(); i++) ordered = ordered && predictions[i].entityId == ids[i];
  CHECK(ordered, "results in input order");

  CHECK(predictions[0].combinedScore == 100 && predictions[1].combinedScore == 0, "each entity scored on its own breakdown");
  CHECK(fixture.modelRegistry.getOrCreate("org-1").totalPredictions == 4, "every prediction counted once");
  CHECK(fixture.repository->listPredictions("org-1", 0, true).size() == 4, "every prediction stored");

  CHECK_THROWS_AS(service.predictBatch({}, "org-1"), BPE::ConfigurationError, "empty batch rejected");
  CHECK_THROWS_AS(service.predictBatch({"entity-0", "missing"}, "org-1"), BPE::NotFoundError, "unknown entity fails the batch");
}

//===================================================================================================================//

static void testTestPredictions() {
  std::cout << "--- testTestPredictions ---" << std::endl;

  PredictionFixture fixture;
  addPortfolio(fixture.entities, "org-1", 8);
  addPortfolio(fixture.entities, "org-2", 3);

  std::vector<BPE::Prediction> predictions = fixture.service.runTestPredictions("org-1", 5);
  CHECK(predictions.size() == 5, "limited to the requested count");

  bool flagged = true;
  for (const BPE::Prediction& prediction : predictions) flagged = flagged && prediction.isTest && prediction.organisationId == "org-1";
  CHECK(flagged, "flagged as test predictions of the organisation");

  CHECK(fixture.service.listPredictions("org-1", 50, false).empty(), "test predictions hidden by default");
  CHECK(fixture.service.listPredictions("org-1", 50, true).size() == 5, "test predictions listed on request");
  CHECK(fixture.service.runTestPredictions("org-1", 0).empty(), "zero limit runs nothing");
  CHECK(fixture.service.runTestPredictions("org-3", 5).empty(), "organisation without entities");
}

//===================================================================================================================//

static void testRecordOutcome() {
  std::cout << "--- testRecordOutcome ---" << std::endl;

  PredictionFixture fixture;
  fixture.entities.add("site-1", "org-1", makeBreakdown(45));

  BPE::Prediction prediction = fixture.service.predictBreach("site-1", "org-1");
  BPE::TimePoint breachDate = std::chrono::time_point_cast<std::chrono::milliseconds>(BPE::Clock::now());

  BPE::Prediction updated = fixture.service.recordOutcome(prediction.id, "BREACHED", breachDate, true);
  CHECK(updated.actualOutcome == std::optional<std::string>("BREACHED"), "outcome recorded");
  CHECK(updated.wasAccurate == std::optional<bool>(true), "accuracy recorded");
  CHECK(updated.combinedScore == prediction.combinedScore, "prediction itself unchanged");
  CHECK(fixture.repository->findPrediction(prediction.id)->actualBreachDate == breachDate, "outcome persisted");

  CHECK_THROWS_AS(fixture.service.recordOutcome("missing", "BREACHED"), BPE::NotFoundError, "unknown prediction");
}

//===================================================================================================================//

static void testExtractFeatures() {
  std::cout << "--- testExtractFeatures ---" << std::endl;

  PredictionFixture fixture;
  fixture.entities.add("site-1", "org-1", makeBreakdown(45, 20));

  BPE::FeatureMap features = fixture.service.extractFeatures("site-1", "org-1");
  CHECK(features.size() == 11 && features[0].first == "expiryRiskScore", "features in declared order");
  CHECK_NEAR(features[0].second, 0.2, 1e-12, "normalised sub-score");
  CHECK(fixture.repository->listPredictions("org-1", 0, true).empty(), "extraction stores nothing");
}

//===================================================================================================================//

void runPredictionTests() {
  testStatisticalOnlyPrediction();
  testDefaultChainUsesNative();
  testFallbackChain();
  testChainRun();
  testTimeout();
  testModelCache();
  testBatchPredictions();
  testTestPredictions();
  testRecordOutcome();
  testExtractFeatures();
}
