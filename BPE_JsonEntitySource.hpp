#ifndef BPE_JSONENTITYSOURCE_HPP
#define BPE_JSONENTITYSOURCE_HPP

#include "BPE_StatisticalScorer.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

//===================================================================================================================//

namespace BPE {
  // Entities with precomputed breakdowns, read from a JSON fixture:
  // {"entities": [{"id", "organisationId", "riskBreakdown": {...}, "history": {...}}]}
  // Read-only after construction.
  class JsonEntitySource : public StatisticalScorer, public EntityDirectory
  {
    public:
      explicit JsonEntitySource(const nlohmann::ordered_json& json);

      static JsonEntitySource fromFile(const std::string& filePath);

      RiskBreakdown computeStatisticalScore(const std::string& entityId, const std::string& organisationId) override;
      EntityHistory getHistory(const std::string& entityId, const std::string& organisationId) override;
      std::vector<std::string> listEntities(const std::string& organisationId, ulong limit) override;

      ulong size() const { return this->entities.size(); }

    private:
      struct Entity {
        std::string organisationId;
        RiskBreakdown riskBreakdown;
        EntityHistory history;
      };

      std::map<std::string, Entity> entities;
      std::vector<std::string> order;  // Fixture order, used by listEntities

      const Entity& find(const std::string& entityId, const std::string& organisationId) const;

      static RiskBreakdown loadRiskBreakdown(const nlohmann::ordered_json& json);
      static EntityHistory loadHistory(const nlohmann::ordered_json& json);
  };
}

//===================================================================================================================//

#endif // BPE_JSONENTITYSOURCE_HPP
