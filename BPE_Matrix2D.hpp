#ifndef BPE_MATRIX2D_HPP
#define BPE_MATRIX2D_HPP

#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <vector>

//===================================================================================================================//

namespace BPE {
  // Row-major buffer with declared dimensions. at() is bounds-checked, operator() is not.
  template <typename T>
  class Matrix2D {
    public:
      Matrix2D() = default;

      Matrix2D(ulong numRows, ulong numCols, T value = T()) : numRows(numRows), numCols(numCols), data(numRows * numCols, value) {}

      Matrix2D(ulong numRows, ulong numCols, std::vector<T> values) : numRows(numRows), numCols(numCols), data(std::move(values)) {
        if (this->data.size() != numRows * numCols) {
          throw std::invalid_argument("Matrix2D data size " + std::to_string(this->data.size()) +
                                      " does not match shape [" + std::to_string(numRows) + ", " + std::to_string(numCols) + "]");
        }
      }

      T& at(ulong row, ulong col) {
        this->checkBounds(row, col);
        return this->data[row * this->numCols + col];
      }

      const T& at(ulong row, ulong col) const {
        this->checkBounds(row, col);
        return this->data[row * this->numCols + col];
      }

      T& operator()(ulong row, ulong col) { return this->data[row * this->numCols + col]; }
      const T& operator()(ulong row, ulong col) const { return this->data[row * this->numCols + col]; }

      ulong rows() const { return this->numRows; }
      ulong cols() const { return this->numCols; }
      ulong size() const { return this->data.size(); }

      const std::vector<T>& values() const { return this->data; }

    private:
      ulong numRows = 0;
      ulong numCols = 0;
      std::vector<T> data;

      void checkBounds(ulong row, ulong col) const {
        if (row >= this->numRows || col >= this->numCols) {
          throw std::out_of_range("Matrix2D index (" + std::to_string(row) + ", " + std::to_string(col) +
                                  ") outside shape [" + std::to_string(this->numRows) + ", " + std::to_string(this->numCols) + "]");
        }
      }
  };
}

//===================================================================================================================//

#endif // BPE_MATRIX2D_HPP
