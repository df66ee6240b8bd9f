// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <array>
#include <complex>
#include <cstdint>
#include <spinalg/data/spin_term.hpp>
#include <vector>

namespace spinalg::data {

/// Sparse complex matrix type used for operator export
using SparseMatrixXcd = Eigen::SparseMatrix<std::complex<double>>;

/**
 * @brief Returns the spin matrix S_x for spin s = twice_spin / 2.
 *
 * The basis is ordered by descending magnetic quantum number
 * m = s, s-1, ..., -s. For s = 1/2 this is sigma_x / 2.
 *
 * @param twice_spin Twice the spin quantum number; must be positive.
 * @throws std::invalid_argument If twice_spin is zero.
 */
Eigen::MatrixXcd spin_x(std::uint32_t twice_spin);

/**
 * @brief Returns the spin matrix S_y for spin s = twice_spin / 2.
 * @see spin_x()
 */
Eigen::MatrixXcd spin_y(std::uint32_t twice_spin);

/**
 * @brief Returns the spin matrix S_z = diag(s, s-1, ..., -s).
 * @see spin_x()
 */
Eigen::MatrixXcd spin_z(std::uint32_t twice_spin);

/**
 * @brief Returns the spin matrix of @p generator for spin twice_spin / 2.
 */
Eigen::MatrixXcd spin_matrix(SpinGenerator generator,
                             std::uint32_t twice_spin);

/**
 * @brief Raises a square matrix to a non-negative integer power by repeated
 * squaring; power zero gives the identity.
 */
Eigen::MatrixXcd matrix_power(const Eigen::MatrixXcd& matrix,
                              std::uint64_t power);

/**
 * @brief Builds matrices of spin terms on a register of equal spins.
 *
 * Sites are embedded little-endian: site 0 is the fastest varying tensor
 * index, i.e. the rightmost factor of the Kronecker product
 *
 *   M = L_{n-1} (x) ... (x) L_1 (x) L_0
 *
 * where L_k is the ordered product of the factors of the term acting on site
 * k (the identity when there are none). Factors on different sites commute,
 * so grouping a term per site leaves its matrix unchanged while keeping the
 * relative order of factors on the same site.
 *
 * The Kronecker product is never formed for a term on its own: its entries
 * are placed straight into the target by recursing over the sites from the
 * most significant one, skipping zero entries of every L_k.
 */
class SpinMatrixBuilder {
 public:
  /**
   * @brief Constructs a builder for @p num_sites sites of spin twice_spin/2.
   * @throws std::invalid_argument If twice_spin is zero.
   * @throws std::overflow_error If (twice_spin+1)^num_sites does not fit
   *         into a matrix index.
   */
  SpinMatrixBuilder(std::uint32_t twice_spin, std::uint64_t num_sites);

  /// Dimension of a single site, 2s+1
  Eigen::Index site_dimension() const { return site_dimension_; }

  /// Dimension of the full register, (2s+1)^num_sites
  Eigen::Index dimension() const { return dimension_; }

  std::uint64_t num_sites() const { return num_sites_; }

  /**
   * @brief Returns the per-site matrices L_0, ..., L_{n-1} of a term.
   * @throws std::out_of_range If the term references a site >= num_sites.
   */
  std::vector<Eigen::MatrixXcd> site_factors(const SpinTerm& term) const;

  /**
   * @brief Adds coefficient * M(term) to a dense dimension() x dimension()
   * matrix.
   */
  void accumulate(Eigen::MatrixXcd& target, const SpinTerm& term,
                  std::complex<double> coefficient) const;

  /**
   * @brief Appends the non-zero entries of coefficient * M(term) as
   * triplets. Duplicate positions are meant to be summed by
   * SparseMatrix::setFromTriplets.
   */
  void accumulate(std::vector<Eigen::Triplet<std::complex<double>>>& triplets,
                  const SpinTerm& term,
                  std::complex<double> coefficient) const;

  /**
   * @brief Returns the dense matrix of a single term.
   */
  Eigen::MatrixXcd term_matrix(const SpinTerm& term) const;

 private:
  void add_dense(Eigen::MatrixXcd& target, Eigen::Index row_offset,
                 Eigen::Index col_offset,
                 const std::vector<Eigen::MatrixXcd>& factors,
                 std::size_t count, std::complex<double> scale) const;

  void add_triplets(std::vector<Eigen::Triplet<std::complex<double>>>& out,
                    Eigen::Index row_offset, Eigen::Index col_offset,
                    const std::vector<Eigen::MatrixXcd>& factors,
                    std::size_t count, std::complex<double> scale) const;

  std::uint32_t twice_spin_;
  std::uint64_t num_sites_;
  Eigen::Index site_dimension_;
  Eigen::Index dimension_;
  /// S_x, S_y, S_z indexed by SpinGenerator
  std::array<Eigen::MatrixXcd, 3> generators_;
  /// block_sizes_[k] = site_dimension_^k
  std::vector<Eigen::Index> block_sizes_;
};

}  // namespace spinalg::data
