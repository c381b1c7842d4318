#ifndef BPE_ACTVFUNC_HPP
#define BPE_ACTVFUNC_HPP

#include <cmath>
#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace BPE {
  enum class ActvFuncType {
    RELU,
    SIGMOID
  };

  const std::unordered_map<std::string, ActvFuncType> actvMap = {
    {"relu", ActvFuncType::RELU},
    {"sigmoid", ActvFuncType::SIGMOID}
  };

  class ActvFunc {
    public:
      static ActvFuncType nameToType(const std::string& name);
      static std::string typeToName(const ActvFuncType& actvFuncType);

      static double calculate(double x, ActvFuncType type, bool derivative = false);

    private:
      static double relu(double x);
      static double sigmoid(double x);

      static double drelu(double x);
      static double dsigmoid(double x);
  };
}

//===================================================================================================================//

#endif // BPE_ACTVFUNC_HPP
