// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cmath>
#include <limits>
#include <spinalg/data/spin_matrices.hpp>
#include <stdexcept>
#include <string>

namespace spinalg::data {

namespace detail {

void check_twice_spin(std::uint32_t twice_spin) {
  if (twice_spin == 0) {
    throw std::invalid_argument("Spin must be a positive half-integer");
  }
}

/**
 * @brief Raising operator S+ in the basis m = s, s-1, ..., -s.
 *
 * S+ |m> = sqrt(s(s+1) - m(m+1)) |m+1>, so the only non-zero entries sit on
 * the first superdiagonal.
 */
Eigen::MatrixXd raising_operator(std::uint32_t twice_spin) {
  check_twice_spin(twice_spin);
  const Eigen::Index dim = static_cast<Eigen::Index>(twice_spin) + 1;
  const double s = 0.5 * twice_spin;
  Eigen::MatrixXd s_plus = Eigen::MatrixXd::Zero(dim, dim);
  for (Eigen::Index k = 1; k < dim; ++k) {
    const double m = s - static_cast<double>(k);
    s_plus(k - 1, k) = std::sqrt(s * (s + 1.0) - m * (m + 1.0));
  }
  return s_plus;
}

}  // namespace detail

Eigen::MatrixXcd spin_x(std::uint32_t twice_spin) {
  const Eigen::MatrixXd s_plus = detail::raising_operator(twice_spin);
  return (0.5 * (s_plus + s_plus.transpose())).cast<std::complex<double>>();
}

Eigen::MatrixXcd spin_y(std::uint32_t twice_spin) {
  const Eigen::MatrixXd s_plus = detail::raising_operator(twice_spin);
  // S_y = (S+ - S-) / 2i
  const std::complex<double> factor(0.0, -0.5);
  return factor * (s_plus - s_plus.transpose()).cast<std::complex<double>>();
}

Eigen::MatrixXcd spin_z(std::uint32_t twice_spin) {
  detail::check_twice_spin(twice_spin);
  const Eigen::Index dim = static_cast<Eigen::Index>(twice_spin) + 1;
  const double s = 0.5 * twice_spin;
  Eigen::MatrixXcd sz = Eigen::MatrixXcd::Zero(dim, dim);
  for (Eigen::Index k = 0; k < dim; ++k) {
    sz(k, k) = s - static_cast<double>(k);
  }
  return sz;
}

Eigen::MatrixXcd spin_matrix(SpinGenerator generator,
                             std::uint32_t twice_spin) {
  switch (generator) {
    case SpinGenerator::X:
      return spin_x(twice_spin);
    case SpinGenerator::Y:
      return spin_y(twice_spin);
    case SpinGenerator::Z:
      return spin_z(twice_spin);
  }
  throw std::invalid_argument("Invalid spin generator");
}

Eigen::MatrixXcd matrix_power(const Eigen::MatrixXcd& matrix,
                              std::uint64_t power) {
  Eigen::MatrixXcd result =
      Eigen::MatrixXcd::Identity(matrix.rows(), matrix.cols());
  Eigen::MatrixXcd base = matrix;
  while (power > 0) {
    if (power & 1u) result = result * base;
    power >>= 1;
    if (power > 0) base = base * base;
  }
  return result;
}

SpinMatrixBuilder::SpinMatrixBuilder(std::uint32_t twice_spin,
                                     std::uint64_t num_sites)
    : twice_spin_(twice_spin),
      num_sites_(num_sites),
      site_dimension_(static_cast<Eigen::Index>(twice_spin) + 1),
      dimension_(1),
      generators_{spin_x(twice_spin), spin_y(twice_spin), spin_z(twice_spin)} {
  block_sizes_.reserve(num_sites_ + 1);
  block_sizes_.push_back(1);
  for (std::uint64_t k = 0; k < num_sites_; ++k) {
    if (dimension_ > std::numeric_limits<Eigen::Index>::max() / site_dimension_) {
      throw std::overflow_error(
          "Matrix dimension (" + std::to_string(site_dimension_) + ")^" +
          std::to_string(num_sites_) + " is not representable");
    }
    dimension_ *= site_dimension_;
    block_sizes_.push_back(dimension_);
  }
}

std::vector<Eigen::MatrixXcd> SpinMatrixBuilder::site_factors(
    const SpinTerm& term) const {
  std::vector<Eigen::MatrixXcd> factors(
      num_sites_, Eigen::MatrixXcd::Identity(site_dimension_, site_dimension_));
  for (const auto& factor : term) {
    if (factor.site >= num_sites_) {
      throw std::out_of_range("Site " + std::to_string(factor.site) +
                              " is outside a register of " +
                              std::to_string(num_sites_) + " sites");
    }
    const auto& generator =
        generators_[static_cast<std::size_t>(factor.generator)];
    auto& local = factors[factor.site];
    if (factor.exponent == 1) {
      local = local * generator;
    } else if (factor.exponent > 1) {
      local = local * matrix_power(generator, factor.exponent);
    }
  }
  return factors;
}

void SpinMatrixBuilder::accumulate(Eigen::MatrixXcd& target,
                                   const SpinTerm& term,
                                   std::complex<double> coefficient) const {
  if (target.rows() != dimension_ || target.cols() != dimension_) {
    throw std::invalid_argument("Target matrix must be " +
                                std::to_string(dimension_) + " x " +
                                std::to_string(dimension_));
  }
  const auto factors = site_factors(term);
  add_dense(target, 0, 0, factors, factors.size(), coefficient);
}

void SpinMatrixBuilder::accumulate(
    std::vector<Eigen::Triplet<std::complex<double>>>& triplets,
    const SpinTerm& term, std::complex<double> coefficient) const {
  const auto factors = site_factors(term);
  add_triplets(triplets, 0, 0, factors, factors.size(), coefficient);
}

Eigen::MatrixXcd SpinMatrixBuilder::term_matrix(const SpinTerm& term) const {
  Eigen::MatrixXcd result = Eigen::MatrixXcd::Zero(dimension_, dimension_);
  accumulate(result, term, 1.0);
  return result;
}

void SpinMatrixBuilder::add_dense(Eigen::MatrixXcd& target,
                                  Eigen::Index row_offset,
                                  Eigen::Index col_offset,
                                  const std::vector<Eigen::MatrixXcd>& factors,
                                  std::size_t count,
                                  std::complex<double> scale) const {
  if (count == 0) {
    target(row_offset, col_offset) += scale;
    return;
  }
  if (count == 1) {
    target.block(row_offset, col_offset, site_dimension_, site_dimension_) +=
        scale * factors[0];
    return;
  }

  const auto& outer = factors[count - 1];
  const Eigen::Index block = block_sizes_[count - 1];
  for (Eigen::Index c = 0; c < site_dimension_; ++c) {
    for (Eigen::Index r = 0; r < site_dimension_; ++r) {
      const std::complex<double> value = outer(r, c);
      if (value == 0.0) continue;
      add_dense(target, row_offset + r * block, col_offset + c * block,
                factors, count - 1, scale * value);
    }
  }
}

void SpinMatrixBuilder::add_triplets(
    std::vector<Eigen::Triplet<std::complex<double>>>& out,
    Eigen::Index row_offset, Eigen::Index col_offset,
    const std::vector<Eigen::MatrixXcd>& factors, std::size_t count,
    std::complex<double> scale) const {
  if (count == 0) {
    out.emplace_back(row_offset, col_offset, scale);
    return;
  }

  const auto& outer = factors[count - 1];
  const Eigen::Index block = block_sizes_[count - 1];
  for (Eigen::Index c = 0; c < site_dimension_; ++c) {
    for (Eigen::Index r = 0; r < site_dimension_; ++r) {
      const std::complex<double> value = outer(r, c);
      if (value == 0.0) continue;
      add_triplets(out, row_offset + r * block, col_offset + c * block,
                   factors, count - 1, scale * value);
    }
  }
}

}  // namespace spinalg::data
