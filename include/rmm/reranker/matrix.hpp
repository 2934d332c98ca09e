#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rmm::reranker {

/// Dense row-major matrix of doubles.
class Matrix {
public:
  Matrix() = default;
  Matrix(std::size_t rows, std::size_t cols, double fill = 0.0);

  [[nodiscard]] static Matrix identity(std::size_t size);
  /// Identity plus i.i.d. N(0, stddev^2) noise on every entry.
  [[nodiscard]] static Matrix noisy_identity(std::size_t size, double stddev, std::uint64_t seed);

  [[nodiscard]] std::size_t rows() const { return rows_; }
  [[nodiscard]] std::size_t cols() const { return cols_; }
  [[nodiscard]] bool empty() const { return data_.empty(); }

  [[nodiscard]] double at(std::size_t row, std::size_t col) const {
    return data_[row * cols_ + col];
  }
  double &at(std::size_t row, std::size_t col) { return data_[row * cols_ + col]; }

  [[nodiscard]] const std::vector<double> &data() const { return data_; }

  /// this * vector. The vector must have cols() entries.
  [[nodiscard]] std::vector<double> multiply(const std::vector<double> &vector) const;

  /// this += scale * (left ⊗ right).
  void add_outer(double scale, const std::vector<double> &left, const std::vector<double> &right);

  /// this += other. Shapes must match.
  void add(const Matrix &other);

  /// Clamp every entry to [-limit, limit].
  void clip(double limit);

  [[nodiscard]] bool is_finite() const;

  bool operator==(const Matrix &) const = default;

private:
  std::size_t rows_ = 0;
  std::size_t cols_ = 0;
  std::vector<double> data_;
};

[[nodiscard]] double dot(const std::vector<double> &lhs, const std::vector<double> &rhs);

} // namespace rmm::reranker
