#include "test_helpers.hpp"

int testsPassed = 0;
int testsFailed = 0;

void runActvFuncTests();
void runUtilsTests();
void runBackendTests();
void runSerializationTests();
void runBlendingTests();
void runFeatureTests();
void runPredictionTests();
void runFeedbackTests();
void runTrainingTests();

int main() {
  std::cout << "========================================" << std::endl;
  std::cout << "       BPE Unit Tests" << std::endl;
  std::cout << "========================================" << std::endl;

  std::cout << "\n=== Activation Function Tests ===" << std::endl;
  runActvFuncTests();

  std::cout << "\n=== Utils / Config / Mode Tests ===" << std::endl;
  runUtilsTests();

  std::cout << "\n=== Backend Tests ===" << std::endl;
  runBackendTests();

  std::cout << "\n=== Serialization Tests ===" << std::endl;
  runSerializationTests();

  std::cout << "\n=== Blending Tests ===" << std::endl;
  runBlendingTests();

  std::cout << "\n=== Feature Tests ===" << std::endl;
  runFeatureTests();

  std::cout << "\n=== Prediction Tests ===" << std::endl;
  runPredictionTests();

  std::cout << "\n=== Feedback Tests ===" << std::endl;
  runFeedbackTests();

  std::cout << "\n=== Training Tests ===" << std::endl;
  runTrainingTests();

  std::cout << "\n========================================" << std::endl;
  std::cout << "Results: " << testsPassed << " passed, " << testsFailed << " failed" << std::endl;
  std::cout << "========================================" << std::endl;

  return testsFailed > 0 ? 1 : 0;
}
