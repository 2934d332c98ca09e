#include "rmm/reranker/matrix.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace rmm::reranker {

Matrix::Matrix(const std::size_t rows, const std::size_t cols, const double fill)
    : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

Matrix Matrix::identity(const std::size_t size) {
  Matrix out(size, size);
  for (std::size_t i = 0; i < size; ++i) {
    out.at(i, i) = 1.0;
  }
  return out;
}

Matrix Matrix::noisy_identity(const std::size_t size, const double stddev,
                              const std::uint64_t seed) {
  Matrix out = identity(size);
  if (stddev <= 0.0) {
    return out;
  }
  std::mt19937_64 rng(seed);
  std::normal_distribution<double> noise(0.0, stddev);
  for (double &value : out.data_) {
    value += noise(rng);
  }
  return out;
}

std::vector<double> Matrix::multiply(const std::vector<double> &vector) const {
  if (vector.size() != cols_) {
    throw std::invalid_argument("matrix/vector dimension mismatch: " + std::to_string(cols_) +
                                " vs " + std::to_string(vector.size()));
  }
  std::vector<double> out(rows_, 0.0);
  for (std::size_t r = 0; r < rows_; ++r) {
    const double *row = data_.data() + r * cols_;
    double sum = 0.0;
    for (std::size_t c = 0; c < cols_; ++c) {
      sum += row[c] * vector[c];
    }
    out[r] = sum;
  }
  return out;
}

void Matrix::add_outer(const double scale, const std::vector<double> &left,
                       const std::vector<double> &right) {
  if (left.size() != rows_ || right.size() != cols_) {
    throw std::invalid_argument("outer product does not match matrix shape");
  }
  if (scale == 0.0) {
    return;
  }
  for (std::size_t r = 0; r < rows_; ++r) {
    const double factor = scale * left[r];
    if (factor == 0.0) {
      continue;
    }
    double *row = data_.data() + r * cols_;
    for (std::size_t c = 0; c < cols_; ++c) {
      row[c] += factor * right[c];
    }
  }
}

void Matrix::add(const Matrix &other) {
  if (other.rows_ != rows_ || other.cols_ != cols_) {
    throw std::invalid_argument("matrix sum does not match matrix shape");
  }
  for (std::size_t i = 0; i < data_.size(); ++i) {
    data_[i] += other.data_[i];
  }
}

void Matrix::clip(const double limit) {
  for (double &value : data_) {
    value = std::clamp(value, -limit, limit);
  }
}

bool Matrix::is_finite() const {
  return std::all_of(data_.begin(), data_.end(), [](double v) { return std::isfinite(v); });
}

double dot(const std::vector<double> &lhs, const std::vector<double> &rhs) {
  if (lhs.size() != rhs.size()) {
    throw std::invalid_argument("dot product dimension mismatch");
  }
  double sum = 0.0;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    sum += lhs[i] * rhs[i];
  }
  return sum;
}

} // namespace rmm::reranker
