#include "BPE_StatisticalScorer.hpp"

using namespace BPE;

//===================================================================================================================//

double StatisticalScorer::confidenceFor(const RiskBreakdown& riskBreakdown) {
  const FactorBreakdown& factors = riskBreakdown.factorBreakdown;

  if (factors.expiringCertificates > 0 || factors.overdueCertificates > 0) {
    return 95;
  }

  if (factors.openDefects > 0) {
    return 90;
  }

  if (!factors.missingStreams.empty()) {
    return 80;
  }

  return 85;
}

//===================================================================================================================//
