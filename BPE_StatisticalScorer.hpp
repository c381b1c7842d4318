#ifndef BPE_STATISTICALSCORER_HPP
#define BPE_STATISTICALSCORER_HPP

#include "BPE_Types.hpp"

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

//===================================================================================================================//

namespace BPE {
  struct FactorBreakdown {
    ulong expiringCertificates = 0;
    ulong overdueCertificates = 0;
    ulong openDefects = 0;
    ulong criticalDefects = 0;
    std::vector<std::string> missingStreams;  // Compliance streams with no coverage
    std::optional<double> assetAge;           // Years
    bool isHRB = false;
    bool hasVulnerableOccupants = false;
  };

  // Baseline produced by the rule-based scorer. All scores on the 0-100 scale.
  struct RiskBreakdown {
    double overallScore = 0;
    double expiryRiskScore = 0;
    double defectRiskScore = 0;
    double assetProfileRiskScore = 0;
    double coverageGapRiskScore = 0;
    double externalFactorRiskScore = 0;
    FactorBreakdown factorBreakdown;
  };

  // Recent history of an entity that the risk breakdown does not carry.
  struct EntityHistory {
    std::optional<TimePoint> lastCertificateIssued;
    ulong openActions = 0;          // Open or in-progress remedial actions
    ulong historicalBreaches = 0;
  };

  // Deterministic rule engine, external to this library.
  class StatisticalScorer
  {
    public:
      virtual ~StatisticalScorer() = default;

      virtual RiskBreakdown computeStatisticalScore(const std::string& entityId, const std::string& organisationId) = 0;

      // 95 with expiring or overdue certificates, else 90 with open defects, else 80 with missing streams, else 85.
      static double confidenceFor(const RiskBreakdown& riskBreakdown);
  };

  // Entity lookups used for feature extraction and for bootstrap sampling.
  class EntityDirectory
  {
    public:
      virtual ~EntityDirectory() = default;

      virtual EntityHistory getHistory(const std::string& entityId, const std::string& organisationId) = 0;
      virtual std::vector<std::string> listEntities(const std::string& organisationId, ulong limit) = 0;
  };
}

//===================================================================================================================//

#endif // BPE_STATISTICALSCORER_HPP
