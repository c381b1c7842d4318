#ifndef BPE_BACKEND_HPP
#define BPE_BACKEND_HPP

#include "BPE_BackendType.hpp"
#include "BPE_LogLevel.hpp"
#include "BPE_ModelConfig.hpp"
#include "BPE_Sample.hpp"
#include "BPE_TestResult.hpp"
#include "BPE_TrainingConfig.hpp"
#include "BPE_TrainingProgress.hpp"
#include "BPE_Types.hpp"
#include "BPE_WeightsFormat.hpp"

#include <cmath>
#include <memory>
#include <random>

//===================================================================================================================//

namespace BPE {
  // A feed-forward network with ReLU hidden layers and one sigmoid output unit.
  // State machine: UNLOADED -> LOADED (loadWeights / initialize) -> TRAINED (train).
  class Backend {
    public:
      static std::unique_ptr<Backend> makeBackend(BackendType backendType, const ModelConfig& modelConfig,
                                                  LogLevel logLevel = LogLevel::ERROR);

      virtual ~Backend() = default;

      //-- Weights --//
      virtual bool loadWeights(const SerializedWeights& weights) = 0;
      virtual SerializedWeights exportWeights() const = 0;
      virtual void initialize() = 0;  // Fresh random weights

      //-- Inference (re-entrant, safe to share between threads) --//
      virtual double predict(const Input& input) const = 0;  // Score in [0, 100]

      //-- Training --//
      virtual TrainingResult train(const Samples& samples, const TrainingConfig& trainingConfig,
                                   const TrainingHooks& hooks = TrainingHooks()) = 0;

      TestResult test(const Samples& samples) const;

      //-- Getters --//
      BackendType getBackendType() const { return this->backendType; }
      BackendState getState() const { return this->state; }
      const ModelConfig& getModelConfig() const { return this->modelConfig; }
      WeightsFormat getWeightsFormat() const;

      void seed(unsigned int value) { this->rng.seed(value); }

      // Training bookkeeping: a prediction counts as correct within this many points of the target.
      static constexpr double accuracyTolerance = 15.0;

      static bool isCorrect(double predicted01, double target100) {
        return std::abs(predicted01 * 100.0 - target100) < accuracyTolerance;
      }

    protected:
      Backend(BackendType backendType, const ModelConfig& modelConfig, LogLevel logLevel);

      BackendType backendType;
      ModelConfig modelConfig;
      LogLevel logLevel;
      BackendState state = BackendState::UNLOADED;
      std::mt19937 rng{std::random_device{}()};

      void requireReady(const char* operation) const;
      void checkInput(const Input& input) const;
      void checkSamples(const Samples& samples) const;
      bool cancelled(const TrainingHooks& hooks) const { return hooks.isCancelled && hooks.isCancelled(); }
  };
}

//===================================================================================================================//

#endif // BPE_BACKEND_HPP
