#ifndef BPE_BACKENDTENSOR_HPP
#define BPE_BACKENDTENSOR_HPP

#include "BPE_Backend.hpp"

#include <torch/torch.h>

#include <vector>

//==============================================================================//

namespace BPE {
  // libtorch network: Linear -> ReLU -> Dropout per hidden layer, then Linear -> Sigmoid.
  // Trained in mini-batches with binary cross-entropy and torch::optim::Adam.
  class BackendTensor : public Backend {
    public:
      BackendTensor(const ModelConfig& modelConfig, LogLevel logLevel = LogLevel::ERROR);

      //-- Backend interface --//
      bool loadWeights(const SerializedWeights& weights) override;
      SerializedWeights exportWeights() const override;
      void initialize() override;
      double predict(const Input& input) const override;
      TrainingResult train(const Samples& samples, const TrainingConfig& trainingConfig,
                           const TrainingHooks& hooks = TrainingHooks()) override;

      const std::vector<ulong>& getLayerSizes() const { return this->layerSizes; }

      // Dropout after hidden layer l during training. Layers past the list get none.
      static const std::vector<double> dropoutRates;

      static constexpr double adamBeta1 = 0.9;
      static constexpr double adamBeta2 = 0.999;
      static constexpr double adamEpsilon = 1e-7;

    private:
      std::vector<ulong> layerSizes;

      // forward() is not const in libtorch; inference only reads the parameters in eval mode.
      mutable torch::nn::Sequential net;

      void buildNet();

      torch::Tensor toTensor(const Samples& samples, const std::vector<ulong>& indices, ulong begin, ulong end,
                             torch::Tensor& targets) const;
      static ulong countCorrect(const torch::Tensor& output, const torch::Tensor& targets);
  };
}

#endif // BPE_BACKENDTENSOR_HPP
