#include "BPE_JsonEntitySource.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_Utils.hpp"

using namespace BPE;

//===================================================================================================================//

JsonEntitySource::JsonEntitySource(const nlohmann::ordered_json& json) {
  try {
    for (const auto& entityJson : json.at("entities")) {
      std::string id = entityJson.at("id").get<std::string>();

      if (this->entities.count(id) > 0) {
        throw ConfigurationError("duplicate entity id '" + id + "'");
      }

      Entity entity;
      entity.organisationId = entityJson.at("organisationId").get<std::string>();
      entity.riskBreakdown = JsonEntitySource::loadRiskBreakdown(entityJson.at("riskBreakdown"));

      if (entityJson.contains("history")) {
        entity.history = JsonEntitySource::loadHistory(entityJson.at("history"));
      }

      this->entities[id] = entity;
      this->order.push_back(id);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("invalid entity fixture: ") + e.what());
  }
}

//===================================================================================================================//

JsonEntitySource JsonEntitySource::fromFile(const std::string& filePath) {
  nlohmann::ordered_json json;

  try {
    json = nlohmann::ordered_json::parse(Utils::readFile(filePath));
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("cannot parse entity fixture " + filePath + ": " + e.what());
  }

  return JsonEntitySource(json);
}

//===================================================================================================================//

RiskBreakdown JsonEntitySource::computeStatisticalScore(const std::string& entityId, const std::string& organisationId) {
  return this->find(entityId, organisationId).riskBreakdown;
}

//===================================================================================================================//

EntityHistory JsonEntitySource::getHistory(const std::string& entityId, const std::string& organisationId) {
  return this->find(entityId, organisationId).history;
}

//===================================================================================================================//

std::vector<std::string> JsonEntitySource::listEntities(const std::string& organisationId, ulong limit) {
  std::vector<std::string> entityIds;

  for (const std::string& id : this->order) {
    if (entityIds.size() >= limit) {
      break;
    }

    if (this->entities.at(id).organisationId == organisationId) {
      entityIds.push_back(id);
    }
  }

  return entityIds;
}

//===================================================================================================================//

const JsonEntitySource::Entity& JsonEntitySource::find(const std::string& entityId, const std::string& organisationId) const {
  auto it = this->entities.find(entityId);

  if (it == this->entities.end() || it->second.organisationId != organisationId) {
    throw NotFoundError("entity " + entityId);
  }

  return it->second;
}

//===================================================================================================================//

RiskBreakdown JsonEntitySource::loadRiskBreakdown(const nlohmann::ordered_json& json) {
  RiskBreakdown riskBreakdown;
  riskBreakdown.overallScore = json.at("overallScore").get<double>();
  riskBreakdown.expiryRiskScore = json.value("expiryRiskScore", 0.0);
  riskBreakdown.defectRiskScore = json.value("defectRiskScore", 0.0);
  riskBreakdown.assetProfileRiskScore = json.value("assetProfileRiskScore", 0.0);
  riskBreakdown.coverageGapRiskScore = json.value("coverageGapRiskScore", 0.0);
  riskBreakdown.externalFactorRiskScore = json.value("externalFactorRiskScore", 0.0);

  if (json.contains("factorBreakdown")) {
    const nlohmann::ordered_json& factorsJson = json.at("factorBreakdown");
    FactorBreakdown& factors = riskBreakdown.factorBreakdown;

    factors.expiringCertificates = factorsJson.value("expiringCertificates", 0UL);
    factors.overdueCertificates = factorsJson.value("overdueCertificates", 0UL);
    factors.openDefects = factorsJson.value("openDefects", 0UL);
    factors.criticalDefects = factorsJson.value("criticalDefects", 0UL);
    factors.missingStreams = factorsJson.value("missingStreams", std::vector<std::string>());
    factors.isHRB = factorsJson.value("isHRB", false);
    factors.hasVulnerableOccupants = factorsJson.value("hasVulnerableOccupants", false);

    if (factorsJson.contains("assetAge") && !factorsJson.at("assetAge").is_null()) {
      factors.assetAge = factorsJson.at("assetAge").get<double>();
    }
  }

  return riskBreakdown;
}

//===================================================================================================================//

EntityHistory JsonEntitySource::loadHistory(const nlohmann::ordered_json& json) {
  EntityHistory history;
  history.openActions = json.value("openActions", 0UL);
  history.historicalBreaches = json.value("historicalBreaches", 0UL);

  if (json.contains("lastCertificateIssued") && !json.at("lastCertificateIssued").is_null()) {
    history.lastCertificateIssued = Utils::parseISO8601(json.at("lastCertificateIssued").get<std::string>());
  }

  return history;
}

//===================================================================================================================//
