#include "test_helpers.hpp"

//===================================================================================================================//

static void testWeightedBlend() {
  std::cout << "--- testWeightedBlend ---" << std::endl;

  BPE::TimePoint now = BPE::Clock::now();
  BPE::BlendResult result = BPE::BlendingEngine::blend(80, 95, 60.0, 70.0, now);

  // 80 * 95/165 + 60 * 70/165 = 71.52
  CHECK(result.combinedScore == 71, "combined score 71");
  CHECK(result.combinedConfidence == 83, "combined confidence round(82.5) = 83");
  CHECK(result.riskCategory == BPE::RiskCategory::HIGH, "category HIGH");
  CHECK(result.sourceLabel == BPE::SourceLabel::ML_ENHANCED, "ML-Enhanced");
  CHECK(result.daysToBreach && *result.daysToBreach == 87, "days to breach (100 - 71) * 3 = 87");
  CHECK(result.predictedBreachDate && *result.predictedBreachDate == now + std::chrono::hours(24 * 87), "breach date 87 days out");
}

//===================================================================================================================//

static void testStatisticalOnly() {
  std::cout << "--- testStatisticalOnly ---" << std::endl;

  BPE::BlendResult result = BPE::BlendingEngine::blend(63.4, 85, std::nullopt, std::nullopt);
  CHECK(result.combinedScore == 63, "score is the rounded statistical score");
  CHECK(result.combinedConfidence == 85, "confidence is the statistical confidence");
  CHECK(result.sourceLabel == BPE::SourceLabel::STATISTICAL, "Statistical");

  // A score without a confidence is not blended
  CHECK(BPE::BlendingEngine::blend(50, 85, 90.0, std::nullopt).sourceLabel == BPE::SourceLabel::STATISTICAL,
        "ML score without confidence ignored");

  BPE::BlendResult low = BPE::BlendingEngine::blend(39, 80, std::nullopt, std::nullopt);
  CHECK(low.riskCategory == BPE::RiskCategory::LOW, "39 is LOW");
  CHECK(!low.daysToBreach.has_value(), "no projection below 40");
  CHECK(!low.predictedBreachDate.has_value(), "no breach date below 40");
}

//===================================================================================================================//

static void testZeroConfidences() {
  std::cout << "--- testZeroConfidences ---" << std::endl;

  BPE::BlendResult result = BPE::BlendingEngine::blend(20, 0, 80.0, 0.0);
  CHECK(result.combinedScore == 50, "equal weighting when both confidences are zero");
  CHECK(result.combinedConfidence == 0, "zero confidence");
}

//===================================================================================================================//

static void testCategories() {
  std::cout << "--- testCategories ---" << std::endl;

  CHECK(BPE::BlendingEngine::categorize(100) == BPE::RiskCategory::CRITICAL, "100 CRITICAL");
  CHECK(BPE::BlendingEngine::categorize(85) == BPE::RiskCategory::CRITICAL, "85 CRITICAL");
  CHECK(BPE::BlendingEngine::categorize(84) == BPE::RiskCategory::HIGH, "84 HIGH");
  CHECK(BPE::BlendingEngine::categorize(70) == BPE::RiskCategory::HIGH, "70 HIGH");
  CHECK(BPE::BlendingEngine::categorize(69) == BPE::RiskCategory::MEDIUM, "69 MEDIUM");
  CHECK(BPE::BlendingEngine::categorize(40) == BPE::RiskCategory::MEDIUM, "40 MEDIUM");
  CHECK(BPE::BlendingEngine::categorize(39) == BPE::RiskCategory::LOW, "39 LOW");
  CHECK(BPE::BlendingEngine::categorize(0) == BPE::RiskCategory::LOW, "0 LOW");
}

//===================================================================================================================//

static void testDaysToBreach() {
  std::cout << "--- testDaysToBreach ---" << std::endl;

  CHECK(BPE::BlendingEngine::projectDaysToBreach(100) == std::optional<int>(1), "never less than one day");
  CHECK(BPE::BlendingEngine::projectDaysToBreach(90) == std::optional<int>(30), "90 -> 30 days");
  CHECK(BPE::BlendingEngine::projectDaysToBreach(70) == std::optional<int>(90), "70 -> 90 days");
  CHECK(BPE::BlendingEngine::projectDaysToBreach(69) == std::optional<int>(92), "69 -> 30 + 31 * 2 = 92 days");
  CHECK(BPE::BlendingEngine::projectDaysToBreach(40) == std::optional<int>(150), "40 -> 150 days");
  CHECK(!BPE::BlendingEngine::projectDaysToBreach(39).has_value(), "39 -> none");

  // Higher risk never projects a later breach
  bool monotonic = true;
  std::optional<int> previous = BPE::BlendingEngine::projectDaysToBreach(40);

  for (int score = 41; score <= 100; score++) {
    std::optional<int> days = BPE::BlendingEngine::projectDaysToBreach(score);
    monotonic = monotonic && days && *days <= *previous;
    previous = days;
  }

  CHECK(monotonic, "days to breach non-increasing in score");
}

//===================================================================================================================//

static void testBlendBounds() {
  std::cout << "--- testBlendBounds ---" << std::endl;

  bool bounded = true;

  for (double stat = 0; stat <= 100; stat += 12.5) {
    for (double ml = 0; ml <= 100; ml += 12.5) {
      BPE::BlendResult result = BPE::BlendingEngine::blend(stat, 85, ml, 60.0);
      int lo = static_cast<int>(std::floor(std::min(stat, ml)));
      int hi = static_cast<int>(std::ceil(std::max(stat, ml)));
      bounded = bounded && result.combinedScore >= lo && result.combinedScore <= hi;
    }
  }

  CHECK(bounded, "combined score lies between the two inputs");
}

//===================================================================================================================//

static void testBlendMonotonic() {
  std::cout << "--- testBlendMonotonic ---" << std::endl;

  const std::vector<std::pair<double, double>> confidences = {{85, 60}, {30, 90}, {0, 0}, {100, 1}};

  bool rises = true;

  for (const auto& confidence : confidences) {
    for (double fixed = 0; fixed <= 100; fixed += 25) {
      int previousStat = -1;
      int previousMl = -1;

      for (double moving = 0; moving <= 100; moving += 0.5) {
        int statSweep = BPE::BlendingEngine::blend(moving, confidence.first, fixed, confidence.second).combinedScore;
        int mlSweep = BPE::BlendingEngine::blend(fixed, confidence.first, moving, confidence.second).combinedScore;

        rises = rises && statSweep >= previousStat && mlSweep >= previousMl;
        previousStat = statSweep;
        previousMl = mlSweep;
      }
    }
  }

  CHECK(rises, "combined score never falls as either input score rises");
}

//===================================================================================================================//

void runBlendingTests() {
  testWeightedBlend();
  testStatisticalOnly();
  testZeroConfidences();
  testCategories();
  testDaysToBreach();
  testBlendBounds();
  testBlendMonotonic();
}
