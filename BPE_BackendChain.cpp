#include "BPE_BackendChain.hpp"
#include "BPE_Exceptions.hpp"

#include <QDebug>
#include <QSemaphore>
#include <QThreadPool>

#include <algorithm>
#include <cmath>
#include <exception>

using namespace BPE;

//===================================================================================================================//

BackendChain::BackendChain(LogLevel logLevel) : logLevel(logLevel) {
}

//===================================================================================================================//

void BackendChain::addStrategy(BackendStrategy strategy) {
  if (!strategy.predict) {
    throw ConfigurationError("backend strategy '" + strategy.name + "' has no predict function");
  }

  this->strategies.push_back(std::move(strategy));
}

//===================================================================================================================//

ChainResult BackendChain::run(const Model& model, const Input& input, const std::string& entityId) const {
  ChainResult result;

  for (const BackendStrategy& strategy : this->strategies) {
    try {
      double score = BackendChain::callWithTimeout(strategy, model, input);

      if (!std::isfinite(score)) {
        throw BackendError("non-finite score");
      }

      result.hasResult = true;
      result.mlScore = std::round(std::min(std::max(score, 0.0), 100.0));
      result.mlConfidence = BackendChain::confidenceFor(strategy.baseConfidence, model);
      result.backendName = strategy.name;

      if (this->logLevel >= LogLevel::DEBUG) {
        qDebug() << "ML prediction entity=" << QString::fromStdString(entityId) << "model=" << QString::fromStdString(model.id)
                 << "backend=" << QString::fromStdString(strategy.name) << "score=" << result.mlScore
                 << "confidence=" << result.mlConfidence;
      }

      return result;
    } catch (const std::exception& e) {
      result.failures.push_back(strategy.name + ": " + e.what());

      if (this->logLevel >= LogLevel::WARNING) {
        qWarning() << "ML backend failed entity=" << QString::fromStdString(entityId)
                   << "model=" << QString::fromStdString(model.id) << "backend=" << QString::fromStdString(strategy.name)
                   << "error=" << e.what();
      }
    }
  }

  if (this->logLevel >= LogLevel::ERROR && !this->strategies.empty()) {
    qCritical() << "all ML backends failed, statistical only entity=" << QString::fromStdString(entityId)
                << "model=" << QString::fromStdString(model.id) << "attempts=" << result.failures.size();
  }

  return result;
}

//===================================================================================================================//

double BackendChain::confidenceFor(double baseConfidence, const Model& model) {
  double accuracy = model.trainingAccuracy.value_or(50.0);
  double feedbackBonus = std::min(static_cast<double>(model.feedbackCount) * 2.0, 20.0);

  return std::min(std::round(baseConfidence + accuracy * 0.4 + feedbackBonus), 95.0);
}

//===================================================================================================================//

BackendChain BackendChain::makeDefault(std::shared_ptr<ModelCache> modelCache, ulong primaryTimeoutMs, LogLevel logLevel) {
  BackendChain chain(logLevel);

  chain.addStrategy({Backends::typeToName(BackendType::TENSOR), tensorBaseConfidence, primaryTimeoutMs,
                     BackendChain::cachedBackend(modelCache, BackendType::TENSOR)});
  chain.addStrategy({Backends::typeToName(BackendType::NATIVE), nativeBaseConfidence, 0,
                     BackendChain::cachedBackend(modelCache, BackendType::NATIVE)});

  return chain;
}

//===================================================================================================================//

PredictFunction BackendChain::cachedBackend(std::shared_ptr<ModelCache> modelCache, BackendType backendType) {
  return [modelCache, backendType](const Model& model, const Input& input) {
    std::shared_ptr<const Backend> backend = modelCache->get(model, backendType);

    if (!backend) {
      throw BackendError("weights of model " + model.id + " are not loadable by the " + Backends::typeToName(backendType) + " backend");
    }

    return backend->predict(input);
  };
}

//===================================================================================================================//

// Bounded calls get their own pool so batch workers on the global pool never starve them.
QThreadPool& BackendChain::inferencePool() {
  static QThreadPool pool;

  return pool;
}

//===================================================================================================================//

// The call owns copies of its arguments, so an abandoned call outlives this frame safely.
double BackendChain::callWithTimeout(const BackendStrategy& strategy, const Model& model, const Input& input) {
  if (strategy.timeoutMs == 0) {
    return strategy.predict(model, input);
  }

  struct PendingCall {
    QSemaphore done;
    double score = 0;
    std::exception_ptr error;
  };

  auto call = std::make_shared<PendingCall>();
  auto modelCopy = std::make_shared<const Model>(model);
  PredictFunction predict = strategy.predict;

  BackendChain::inferencePool().start([call, modelCopy, input, predict]() {
    try {
      call->score = predict(*modelCopy, input);
    } catch (...) {
      call->error = std::current_exception();
    }

    call->done.release();
  });

  if (!call->done.tryAcquire(1, static_cast<int>(strategy.timeoutMs))) {
    throw BackendError("timed out after " + std::to_string(strategy.timeoutMs) + " ms");
  }

  if (call->error) {
    std::rethrow_exception(call->error);
  }

  return call->score;
}

//===================================================================================================================//
