#ifndef BPE_TYPES_HPP
#define BPE_TYPES_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>

//===================================================================================================================//

namespace BPE {
  using Input = std::vector<double>;

  using Inputs = std::vector<Input>;

  using Tensor1D = std::vector<double>;

  using Tensor2D = std::vector<std::vector<double>>;

  // Ordered (name, value) pairs. Order is significant: it must match ModelConfig::inputFeatures.
  using FeatureMap = std::vector<std::pair<std::string, double>>;

  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;
}

//===================================================================================================================//

#endif // BPE_TYPES_HPP
