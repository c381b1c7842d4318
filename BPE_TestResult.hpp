#ifndef BPE_TESTRESULT_HPP
#define BPE_TESTRESULT_HPP

#include <sys/types.h>

//===================================================================================================================//

namespace BPE {
  // Evaluation of a backend against labelled samples, weights untouched.
  struct TestResult {
    ulong numSamples = 0;
    double averageLoss = 0;   // Mean squared error on the 0-1 scale
    ulong numCorrect = 0;     // Predictions within 15 points of the target
    double accuracy = 0;      // Percentage
  };
}

//===================================================================================================================//

#endif // BPE_TESTRESULT_HPP
