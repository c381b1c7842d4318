#include "test_helpers.hpp"

//===================================================================================================================//

static BPE::FeedbackRequest makeRequest(const BPE::Prediction& prediction, BPE::FeedbackType feedbackType,
                                        std::optional<double> correctedScore = std::nullopt) {
  BPE::FeedbackRequest request;
  request.predictionId = prediction.id;
  request.organisationId = prediction.organisationId;
  request.feedbackType = feedbackType;
  request.correctedScore = correctedScore;
  request.submittedBy = "inspector";

  return request;
}

//===================================================================================================================//

static void testSubmitFeedback() {
  std::cout << "--- testSubmitFeedback ---" << std::endl;

  FakeEntities entities;
  entities.add("site-1", "org-1", makeBreakdown(64));
  BPE::Engine engine(entities, entities, makeEngineConfig());

  BPE::Prediction prediction = engine.predictBreach("site-1", "org-1");

  BPE::FeedbackRequest request = makeRequest(prediction, BPE::FeedbackType::INCORRECT, 85.0);
  request.correctedCategory = BPE::RiskCategory::CRITICAL;
  request.notes = "gas certificate lapsed";

  BPE::Feedback feedback = engine.submitFeedback(request);
  CHECK(!feedback.id.empty(), "feedback id assigned");
  CHECK(feedback.modelId == prediction.modelId, "attached to the predicting model");
  CHECK(feedback.correctedScore == std::optional<double>(85), "corrected score stored");
  CHECK(feedback.correctedCategory == std::optional<BPE::RiskCategory>(BPE::RiskCategory::CRITICAL), "corrected category stored");
  CHECK(!feedback.usedForTraining, "not yet used for training");

  BPE::Model model = engine.getModel("org-1");
  CHECK(model.feedbackCount == 1, "feedback counted");
  CHECK(model.correctPredictions == 0, "INCORRECT does not count as correct");
}

//===================================================================================================================//

static void testFeedbackIdempotence() {
  std::cout << "--- testFeedbackIdempotence ---" << std::endl;

  FakeEntities entities;
  entities.add("site-1", "org-1", makeBreakdown(64));
  BPE::Engine engine(entities, entities, makeEngineConfig());

  BPE::Prediction prediction = engine.predictBreach("site-1", "org-1");
  BPE::FeedbackRequest request = makeRequest(prediction, BPE::FeedbackType::CORRECT);

  BPE::Feedback first = engine.submitFeedback(request);
  BPE::Feedback second = engine.submitFeedback(request);

  CHECK(first.id == second.id, "resubmission returns the stored feedback");
  CHECK(engine.getModel("org-1").correctPredictions == 1, "correct prediction counted once");
  CHECK(engine.getModel("org-1").feedbackCount == 1, "feedback counted once");
  CHECK(engine.getModelMetrics("org-1").feedbackStats.total == 1, "one feedback row");

  // Different content is a new submission
  request.notes = "confirmed on site";
  BPE::Feedback third = engine.submitFeedback(request);
  CHECK(third.id != first.id, "changed notes make a new row");
  CHECK(engine.getModel("org-1").correctPredictions == 2, "second distinct submission counted");
}

//===================================================================================================================//

static void testFeedbackValidation() {
  std::cout << "--- testFeedbackValidation ---" << std::endl;

  FakeEntities entities;
  entities.add("site-1", "org-1", makeBreakdown(64));
  entities.add("site-2", "org-2", makeBreakdown(30));
  BPE::Engine engine(entities, entities, makeEngineConfig());

  BPE::Prediction prediction = engine.predictBreach("site-1", "org-1");

  BPE::FeedbackRequest otherOrg = makeRequest(prediction, BPE::FeedbackType::CORRECT);
  otherOrg.organisationId = "org-2";
  CHECK_THROWS_AS(engine.submitFeedback(otherOrg), BPE::NotFoundError, "another organisation's prediction is not found");

  BPE::FeedbackRequest missing = makeRequest(prediction, BPE::FeedbackType::CORRECT);
  missing.predictionId = "no-such-prediction";
  CHECK_THROWS_AS(engine.submitFeedback(missing), BPE::NotFoundError, "unknown prediction");

  CHECK_THROWS_AS(engine.submitFeedback(makeRequest(prediction, BPE::FeedbackType::INCORRECT, 101.0)), BPE::ConfigurationError,
                  "score above 100 rejected");
  CHECK_THROWS_AS(engine.submitFeedback(makeRequest(prediction, BPE::FeedbackType::INCORRECT, -1.0)), BPE::ConfigurationError,
                  "negative score rejected");

  CHECK(engine.getModel("org-1").feedbackCount == 0, "rejected feedback leaves counters alone");
}

//===================================================================================================================//

static void testModelMetrics() {
  std::cout << "--- testModelMetrics ---" << std::endl;

  FakeEntities entities;
  addPortfolio(entities, "org-1", 12);
  BPE::Engine engine(entities, entities, makeEngineConfig());

  // Fresh organisation: a model is created, nothing is known yet
  BPE::ModelMetrics empty = engine.getModelMetrics("org-1");
  CHECK(!empty.modelId.empty(), "model created on demand");
  CHECK(empty.status == BPE::ModelStatus::TRAINING, "new model status");
  CHECK(!empty.accuracy.has_value(), "no accuracy without feedback or training");
  CHECK(!empty.trainingReady, "not ready for training");
  CHECK(empty.recentTrainingRuns.empty(), "no training runs");

  std::vector<BPE::Prediction> predictions = engine.runTestPredictions("org-1", 12);
  CHECK(predictions.size() == 12, "twelve predictions");

  // 6 correct, 2 incorrect, 1 partially correct: 9 rows, one short of training readiness
  for (ulong i = 0; i < 9; i++) {
    BPE::FeedbackType feedbackType = i < 6 ? BPE::FeedbackType::CORRECT
                                   : i < 8 ? BPE::FeedbackType::INCORRECT
                                           : BPE::FeedbackType::PARTIALLY_CORRECT;
    std::optional<double> correctedScore;
    if (feedbackType != BPE::FeedbackType::CORRECT) correctedScore = 50;

    engine.submitFeedback(makeRequest(predictions[i], feedbackType, correctedScore));
  }

  BPE::ModelMetrics metrics = engine.getModelMetrics("org-1");
  CHECK(metrics.totalPredictions == 12, "every prediction of the model counted");
  CHECK(metrics.feedbackStats.total == 9, "nine feedback rows");
  CHECK(metrics.feedbackStats.correct == 6 && metrics.feedbackStats.incorrect == 2, "counts by type");
  CHECK(metrics.feedbackStats.partiallyCorrect == 1, "partially correct counted");
  CHECK(metrics.correctPredictions == 6, "correct predictions");
  CHECK(metrics.accuracy && std::fabs(*metrics.accuracy - 0.75) < 1e-12, "accuracy 6 / (6 + 2)");
  CHECK(!metrics.trainingReady, "nine rows are not enough to train");

  engine.submitFeedback(makeRequest(predictions[9], BPE::FeedbackType::CORRECT));
  CHECK(engine.getModelMetrics("org-1").trainingReady, "ten rows are enough to train");
}

//===================================================================================================================//

static void testMetricsAccuracyFallback() {
  std::cout << "--- testMetricsAccuracyFallback ---" << std::endl;

  FakeEntities entities;
  BPE::Engine engine(entities, entities, makeEngineConfig());

  BPE::Model model = engine.getModel("org-1");
  engine.getRepository()->updateModel(model.id, [](BPE::Model& target) { target.trainingAccuracy = 62.0; });

  BPE::ModelMetrics metrics = engine.getModelMetrics("org-1");
  CHECK(metrics.accuracy && std::fabs(*metrics.accuracy - 0.62) < 1e-12, "training accuracy used without judged feedback");
  CHECK(metrics.trainingAccuracy == std::optional<double>(62.0), "training accuracy reported");
}

//===================================================================================================================//

void runFeedbackTests() {
  testSubmitFeedback();
  testFeedbackIdempotence();
  testFeedbackValidation();
  testModelMetrics();
  testMetricsAccuracyFallback();
}
