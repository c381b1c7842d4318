#ifndef BPE_SAMPLE_HPP
#define BPE_SAMPLE_HPP

#include "BPE_Types.hpp"

//===================================================================================================================//

namespace BPE {
  struct Sample {
    Input input;
    double target;  // 0-100 scale; backends train on target / 100
  };

  using Samples = std::vector<Sample>;
}

//===================================================================================================================//

#endif // BPE_SAMPLE_HPP
