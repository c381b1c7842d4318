#include "BPE_ActvFunc.hpp"
#include "BPE_Exceptions.hpp"

#include <algorithm>
#include <cmath>

using namespace BPE;

//===================================================================================================================//

ActvFuncType ActvFunc::nameToType(const std::string& name) {
  auto it = actvMap.find(name);

  if (it == actvMap.end()) {
    throw ConfigurationError("unknown activation function: " + name);
  }

  return it->second;
}

//===================================================================================================================//

std::string ActvFunc::typeToName(const ActvFuncType& actvFuncType) {
  for (const auto& pair : actvMap) {
    if (pair.second == actvFuncType) {
      return pair.first;
    }
  }

  throw ConfigurationError("unknown activation function enum value");
}

//===================================================================================================================//

double ActvFunc::calculate(double x, ActvFuncType type, bool isDerivative) {
  switch (type) {
    case ActvFuncType::RELU:
      return !isDerivative ? ActvFunc::relu(x) : ActvFunc::drelu(x);
    case ActvFuncType::SIGMOID:
      return !isDerivative ? ActvFunc::sigmoid(x) : ActvFunc::dsigmoid(x);
  }

  throw ConfigurationError("unknown activation function enum value");
}

//===================================================================================================================//

double ActvFunc::relu(double x) {
  return (x > 0) ? x : 0;
}

//===================================================================================================================//

// Input is clamped to [-500, 500] so exp() cannot overflow.
double ActvFunc::sigmoid(double x) {
  double clamped = std::max(-500.0, std::min(500.0, x));

  return 1.0 / (1.0 + std::exp(-clamped));
}

//===================================================================================================================//

double ActvFunc::drelu(double x) {
  return (x > 0) ? 1.0 : 0.0;
}

//===================================================================================================================//

double ActvFunc::dsigmoid(double x) {
  double sig = ActvFunc::sigmoid(x);
  return sig * (1.0 - sig);
}

//===================================================================================================================//
