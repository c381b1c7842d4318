#include "BPE_Engine.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_JsonEntitySource.hpp"
#include "BPE_Mode.hpp"
#include "BPE_Utils.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>

using namespace BPE;

//===================================================================================================================//

namespace {
  nlohmann::ordered_json getMetricsJson(const ModelMetrics& metrics) {
    nlohmann::ordered_json runsJson = nlohmann::ordered_json::array();

    for (const TrainingRun& trainingRun : metrics.recentTrainingRuns) {
      runsJson.push_back(Utils::getTrainingRunJson(trainingRun));
    }

    nlohmann::ordered_json json;
    json["modelId"] = metrics.modelId;
    json["status"] = Enums::toName(metrics.status);
    json["accuracy"] = metrics.accuracy ? nlohmann::ordered_json(*metrics.accuracy) : nlohmann::ordered_json(nullptr);
    json["totalPredictions"] = metrics.totalPredictions;
    json["correctPredictions"] = metrics.correctPredictions;
    json["trainingAccuracy"] =
        metrics.trainingAccuracy ? nlohmann::ordered_json(*metrics.trainingAccuracy) : nlohmann::ordered_json(nullptr);
    json["lastTrainedAt"] =
        metrics.lastTrainedAt ? nlohmann::ordered_json(Utils::formatISO8601(*metrics.lastTrainedAt)) : nlohmann::ordered_json(nullptr);
    json["feedbackStats"] = {
      {"total", metrics.feedbackStats.total},
      {"correct", metrics.feedbackStats.correct},
      {"incorrect", metrics.feedbackStats.incorrect},
      {"partiallyCorrect", metrics.feedbackStats.partiallyCorrect}
    };
    json["trainingReady"] = metrics.trainingReady;
    json["recentTrainingRuns"] = runsJson;

    return json;
  }

  nlohmann::ordered_json getOutcomeJson(const TrainingOutcome& outcome) {
    nlohmann::ordered_json json;
    json["success"] = outcome.success;
    json["alreadyRunning"] = outcome.alreadyRunning;
    json["modelId"] = outcome.modelId;
    json["runId"] = outcome.runId;
    json["backend"] = outcome.backendName;
    json["accuracy"] = outcome.accuracy ? nlohmann::ordered_json(*outcome.accuracy) : nlohmann::ordered_json(nullptr);
    json["loss"] = outcome.loss ? nlohmann::ordered_json(*outcome.loss) : nlohmann::ordered_json(nullptr);
    json["samples"] = outcome.numSamples;
    json["feedbackUsed"] = outcome.numFeedbackUsed;
    json["bootstrapped"] = outcome.bootstrapped;
    json["epochHistory"] = Utils::getEpochHistoryJson(outcome.epochHistory);

    if (!outcome.errorMessage.empty()) {
      json["error"] = outcome.errorMessage;
    }

    return json;
  }

  std::optional<double> doubleOption(const QCommandLineParser& parser, const QString& name) {
    if (!parser.isSet(name)) {
      return std::nullopt;
    }

    bool ok = false;
    double value = parser.value(name).toDouble(&ok);

    if (!ok) {
      throw ConfigurationError("--" + name.toStdString() + " expects a number");
    }

    return value;
  }

  std::optional<ulong> ulongOption(const QCommandLineParser& parser, const QString& name) {
    if (!parser.isSet(name)) {
      return std::nullopt;
    }

    bool ok = false;
    ulong value = parser.value(name).toULong(&ok);

    if (!ok) {
      throw ConfigurationError("--" + name.toStdString() + " expects a non-negative integer");
    }

    return value;
  }

  std::string requiredOption(const QCommandLineParser& parser, const QString& name) {
    if (!parser.isSet(name)) {
      throw ConfigurationError("--" + name.toStdString() + " is required");
    }

    return parser.value(name).toStdString();
  }

  TrainingOverrides trainingOverrides(const QCommandLineParser& parser) {
    TrainingOverrides overrides;
    overrides.learningRate = doubleOption(parser, "learning-rate");
    overrides.epochs = ulongOption(parser, "epochs");
    overrides.batchSize = ulongOption(parser, "batch-size");

    return overrides;
  }

  nlohmann::ordered_json runMode(ModeType modeType, Engine& engine, const QCommandLineParser& parser) {
    std::string organisationId = requiredOption(parser, "org");

    switch (modeType) {
      case ModeType::PREDICT: {
        QStringList entityIds = parser.values("entity");

        if (entityIds.isEmpty()) {
          if (!parser.isSet("test")) {
            throw ConfigurationError("--entity is required unless --test is given");
          }

          nlohmann::ordered_json json = nlohmann::ordered_json::array();
          ulong limit = ulongOption(parser, "limit").value_or(Engine::defaultTestPredictions);

          for (const Prediction& prediction : engine.runTestPredictions(organisationId, limit)) {
            json.push_back(Utils::getPredictionJson(prediction));
          }

          return json;
        }

        if (entityIds.size() == 1) {
          return Utils::getPredictionJson(engine.predictBreach(entityIds.front().toStdString(), organisationId, parser.isSet("test")));
        }

        std::vector<std::string> ids;

        for (const QString& entityId : entityIds) {
          ids.push_back(entityId.toStdString());
        }

        nlohmann::ordered_json json = nlohmann::ordered_json::array();

        for (const Prediction& prediction : engine.predictBatch(ids, organisationId)) {
          json.push_back(Utils::getPredictionJson(prediction));
        }

        return json;
      }

      case ModeType::FEEDBACK: {
        FeedbackRequest request;
        request.predictionId = requiredOption(parser, "prediction");
        request.organisationId = organisationId;
        request.feedbackType = Enums::feedbackTypeFromName(requiredOption(parser, "type"));
        request.correctedScore = doubleOption(parser, "score");

        if (parser.isSet("category")) {
          request.correctedCategory = Enums::riskCategoryFromName(parser.value("category").toStdString());
        }

        request.notes = parser.value("notes").toStdString();
        request.submittedBy = parser.value("user").toStdString();

        return Utils::getFeedbackJson(engine.submitFeedback(request));
      }

      case ModeType::TRAIN:
        return getOutcomeJson(engine.triggerTraining(organisationId, trainingOverrides(parser)));

      case ModeType::METRICS:
        return getMetricsJson(engine.getModelMetrics(organisationId));

      case ModeType::SETTINGS: {
        ModelSettings settings;
        settings.training = trainingOverrides(parser);

        return Utils::getModelJson(engine.updateModelSettings(organisationId, settings));
      }

      case ModeType::FEATURES:
        return Utils::getFeatureMapJson(engine.extractFeatures(requiredOption(parser, "entity"), organisationId));

      default:
        throw ConfigurationError("unsupported mode");
    }
  }
}

//===================================================================================================================//

int main(int argc, char* argv[]) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("bpe");

  QCommandLineParser parser;
  parser.setApplicationDescription("Compliance breach prediction engine");
  parser.addHelpOption();
  parser.addPositionalArgument("mode", "predict, feedback, train, metrics, settings or features");

  parser.addOptions({
    {"config", "Engine configuration JSON file.", "file"},
    {"state", "Repository snapshot, created when missing and saved afterwards.", "file"},
    {"entities", "Entity fixture JSON file.", "file"},
    {"org", "Organisation id.", "id"},
    {"entity", "Entity id, repeat for a batch.", "id"},
    {"prediction", "Prediction id the feedback refers to.", "id"},
    {"type", "Feedback type: CORRECT, INCORRECT or PARTIALLY_CORRECT.", "type"},
    {"score", "Corrected score, 0-100.", "score"},
    {"category", "Corrected risk category.", "category"},
    {"notes", "Feedback notes.", "text"},
    {"user", "Who submits the feedback.", "name"},
    {"epochs", "Training epochs.", "n"},
    {"learning-rate", "Training learning rate.", "rate"},
    {"batch-size", "Training batch size.", "n"},
    {"limit", "Number of test predictions.", "n"},
    {"test", "Flag predictions as test predictions."},
  });

  parser.process(app);

  const QStringList positional = parser.positionalArguments();

  if (positional.size() != 1) {
    parser.showHelp(1);
  }

  try {
    ModeType modeType = Mode::nameToType(positional.front().toStdString());

    EngineConfig engineConfig = parser.isSet("config") ? Utils::loadEngineConfig(parser.value("config").toStdString()) : EngineConfig();

    JsonEntitySource entitySource = parser.isSet("entities")
                                        ? JsonEntitySource::fromFile(parser.value("entities").toStdString())
                                        : JsonEntitySource(nlohmann::ordered_json{{"entities", nlohmann::ordered_json::array()}});

    Engine engine(entitySource, entitySource, engineConfig);

    std::string statePath = parser.value("state").toStdString();

    if (!statePath.empty() && Utils::fileExists(statePath)) {
      engine.loadSnapshot(statePath);
    }

    nlohmann::ordered_json result = runMode(modeType, engine, parser);

    if (!statePath.empty()) {
      engine.saveSnapshot(statePath);
    }

    std::cout << result.dump(4) << std::endl;
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;

    return 1;
  }

  return 0;
}
