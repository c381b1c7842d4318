#ifndef BPE_BACKENDNATIVE_HPP
#define BPE_BACKENDNATIVE_HPP

#include "BPE_Backend.hpp"
#include "BPE_Matrix2D.hpp"

//==============================================================================//

namespace BPE {
  // Hand-rolled network with explicit forward pass and per-example backpropagation.
  // Weights of layer l are a [fanIn, fanOut] matrix; each layer carries one scalar bias.
  class BackendNative : public Backend {
    public:
      BackendNative(const ModelConfig& modelConfig, LogLevel logLevel = LogLevel::ERROR);

      //-- Backend interface --//
      bool loadWeights(const SerializedWeights& weights) override;
      SerializedWeights exportWeights() const override;
      void initialize() override;
      double predict(const Input& input) const override;
      TrainingResult train(const Samples& samples, const TrainingConfig& trainingConfig,
                           const TrainingHooks& hooks = TrainingHooks()) override;

      //-- Inspection --//
      const std::vector<Matrix2D<double>>& getWeights() const { return this->weights; }
      const std::vector<double>& getBiases() const { return this->biases; }
      const std::vector<ulong>& getLayerSizes() const { return this->layerSizes; }

    private:
      std::vector<ulong> layerSizes;
      std::vector<Matrix2D<double>> weights;
      std::vector<double> biases;

      //-- Forward / Backward pass --//
      // actvs[0] and zs[0] hold the input; actvs[l + 1] and zs[l + 1] are the outputs of weight layer l.
      void propagate(const Input& input, Tensor2D& actvs, Tensor2D& zs) const;
      void backpropagate(double outputError, const Tensor2D& zs, Tensor2D& deltas) const;
      void update(const Tensor2D& actvs, const Tensor2D& deltas, double learningRate);

      ulong numWeightLayers() const { return this->layerSizes.size() - 1; }
  };
}

#endif // BPE_BACKENDNATIVE_HPP
