// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <complex>
#include <cstdint>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <spinalg/data/settings.hpp>
#include <spinalg/data/spin_matrices.hpp>
#include <spinalg/data/spin_term.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace spinalg::data {

/**
 * @class SpinOperatorSettings
 * @brief Numerical thresholds used by SpinOperator
 */
class SpinOperatorSettings : public Settings {
 public:
  SpinOperatorSettings() {
    set_default("simplify_tolerance", 1e-12,
                "Terms with |coefficient| at or below this value are dropped "
                "by simplify()",
                BoundConstraint<double>{0.0,
                                        std::numeric_limits<double>::max()});
    set_default("equality_atol", 1e-8,
                "Absolute tolerance of coefficient comparison in equiv()",
                BoundConstraint<double>{0.0,
                                        std::numeric_limits<double>::max()});
    set_default("equality_rtol", 1e-5,
                "Relative tolerance of coefficient comparison in equiv()",
                BoundConstraint<double>{0.0,
                                        std::numeric_limits<double>::max()});
    set_default("matrix_warning_dimension", int64_t{4096},
                "Dense matrix dimension above which to_matrix() warns",
                BoundConstraint<int64_t>{
                    1, std::numeric_limits<int64_t>::max()});
  }
};

/**
 * @brief Exception thrown when two operators that must act on the same
 * register do not.
 */
class DimensionMismatchError : public std::invalid_argument {
 public:
  DimensionMismatchError(const std::string& operation,
                         std::uint64_t lhs_num_sites, double lhs_spin,
                         std::uint64_t rhs_num_sites, double rhs_spin);
};

/**
 * @brief Exception thrown by SpinOperator::permute_indices() for a sequence
 * that is not a permutation of the operator's sites.
 */
class InvalidPermutationError : public std::invalid_argument {
 public:
  explicit InvalidPermutationError(const std::string& reason)
      : std::invalid_argument("Invalid permutation: " + reason) {}
};

/**
 * @brief Accumulator for spin terms that merges identical terms.
 *
 * Terms are kept in order of first insertion.
 */
class SpinTermAccumulator {
 public:
  SpinTermAccumulator() = default;

  /**
   * @brief Adds @p coeff to the coefficient of @p term, inserting the term if
   * it has not been seen.
   */
  void accumulate(const SpinTerm& term, std::complex<double> coeff);

  void reserve(std::size_t capacity);

  std::size_t size() const { return terms_.size(); }

  /**
   * @brief Moves the accumulated terms out, dropping those with
   * |coefficient| <= threshold when a threshold is given.
   */
  std::pair<std::vector<SpinTerm>, std::vector<std::complex<double>>> release(
      std::optional<double> threshold = std::nullopt);

 private:
  std::unordered_map<SpinTerm, std::size_t, SpinTermHash> index_;
  std::vector<SpinTerm> terms_;
  std::vector<std::complex<double>> coefficients_;
};

/**
 * @brief A weighted sum of spin terms acting on a register of equal spins.
 *
 * Each term is an ordered product of X, Y and Z generators on sites
 * 0 ... num_sites-1, all carrying spin s (site dimension d = 2s+1). The
 * operator is immutable: every operation returns a new SpinOperator.
 *
 * Terms are stored as parsed factor lists next to a parallel list of
 * coefficients, in insertion order. Construction merges terms that parse
 * identically; equivalent but differently written terms ("X_0^2" and
 * "X_0 X_0") stay apart until simplify() is called.
 *
 * Example:
 * @code
 *   SpinOperator h({{"X_0 X_1", 1.0}, {"Y_0 Y_1", 1.0}, {"Z_0 Z_1", 1.0}});
 *   Eigen::MatrixXcd m = h.to_matrix();  // 4 x 4
 *   auto h2 = (h * h).simplify();
 * @endcode
 */
class SpinOperator {
 public:
  /// Label -> coefficient input, in insertion order
  using LabelCoefficients =
      std::vector<std::pair<std::string, std::complex<double>>>;
  /// A term paired with its coefficient
  using TermPair = std::pair<SpinTerm, std::complex<double>>;
  using TermList = std::vector<TermPair>;

  /**
   * @brief Restartable view over the (term, coefficient) pairs of an
   * operator, in insertion order.
   *
   * The view refers to the operator it was obtained from and must not
   * outlive it. Every call to begin() starts a fresh pass. The view also
   * carries the register of that operator, so from_terms(op.terms()) rebuilds
   * op on the same number of sites and spin.
   */
  class TermView {
   public:
    class iterator {
     public:
      using iterator_category = std::input_iterator_tag;
      using iterator_concept = std::input_iterator_tag;
      using value_type = TermPair;
      using difference_type = std::ptrdiff_t;
      using reference = TermPair;
      using pointer = void;

      iterator() = default;
      iterator(const SpinOperator* op, std::size_t index)
          : op_(op), index_(index) {}

      TermPair operator*() const {
        return TermPair(op_->terms_[index_], op_->coefficients_[index_]);
      }

      iterator& operator++() {
        ++index_;
        return *this;
      }

      iterator operator++(int) {
        iterator tmp = *this;
        ++index_;
        return tmp;
      }

      bool operator==(const iterator& other) const {
        return op_ == other.op_ && index_ == other.index_;
      }

     private:
      const SpinOperator* op_ = nullptr;
      std::size_t index_ = 0;
    };

    explicit TermView(const SpinOperator& op) : op_(&op) {}

    iterator begin() const { return iterator(op_, 0); }
    iterator end() const { return iterator(op_, op_->size()); }
    std::size_t size() const { return op_->size(); }

    std::uint64_t get_num_sites() const { return op_->get_num_sites(); }
    double get_spin() const { return op_->get_spin(); }
    std::shared_ptr<const SpinOperatorSettings> get_settings() const {
      return op_->settings_;
    }

   private:
    const SpinOperator* op_;
  };

  /**
   * @brief Constructs an operator from label/coefficient pairs.
   *
   * Labels follow the grammar of parse_spin_label(); exponent zero is
   * accepted and removed later by simplify(). Pairs whose labels parse to the
   * same term are merged.
   *
   * @param data Label/coefficient pairs.
   * @param num_sites Number of sites; defaults to one more than the largest
   *        site index found in @p data, and at least 1.
   * @param spin Spin quantum number of every site, a positive multiple of 1/2.
   * @param settings Thresholds; a locked copy is stored. Defaults to
   *        SpinOperatorSettings().
   * @throws MalformedLabelError If a label is malformed or refers to a site
   *         >= num_sites.
   * @throws std::invalid_argument If @p spin is not a positive half-integer.
   */
  explicit SpinOperator(
      const LabelCoefficients& data,
      std::optional<std::uint64_t> num_sites = std::nullopt, double spin = 0.5,
      std::shared_ptr<const SpinOperatorSettings> settings = nullptr);

  /**
   * @brief Constructs an operator from parsed terms.
   *
   * A plain list carries no register: num_sites is inferred from the
   * largest site index unless given. Pass op.terms() itself, or the
   * operator's get_num_sites() and get_spin(), to rebuild an operator whose
   * highest sites are idle.
   *
   * @see SpinOperator(const LabelCoefficients&, ...)
   */
  static SpinOperator from_terms(
      const TermList& terms,
      std::optional<std::uint64_t> num_sites = std::nullopt, double spin = 0.5,
      std::shared_ptr<const SpinOperatorSettings> settings = nullptr);

  /**
   * @brief Inverse of terms(): rebuilds an operator from a term view.
   *
   * The number of sites, spin and settings default to those of the operator
   * the view was taken from, so from_terms(op.terms()) is structurally equal
   * to op.
   */
  static SpinOperator from_terms(
      const TermView& view,
      std::optional<std::uint64_t> num_sites = std::nullopt,
      std::optional<double> spin = std::nullopt,
      std::shared_ptr<const SpinOperatorSettings> settings = nullptr);

  /**
   * @brief Constructs an operator from any other range of (term,
   * coefficient) pairs.
   */
  template <std::ranges::input_range Range>
    requires(!std::same_as<std::remove_cvref_t<Range>, TermList> &&
             !std::same_as<std::remove_cvref_t<Range>, TermView>)
  static SpinOperator from_terms(
      Range&& range, std::optional<std::uint64_t> num_sites = std::nullopt,
      double spin = 0.5,
      std::shared_ptr<const SpinOperatorSettings> settings = nullptr) {
    TermList list;
    for (auto&& [term, coeff] : range) {
      list.emplace_back(SpinTerm(term), std::complex<double>(coeff));
    }
    return from_terms(list, num_sites, spin, std::move(settings));
  }

  /**
   * @brief The operator without terms.
   *
   * Equality requires matching registers, so an operator on n sites that
   * cancels to nothing compares equal to zero(n), not to zero().
   */
  static SpinOperator zero(
      std::uint64_t num_sites = 1, double spin = 0.5,
      std::shared_ptr<const SpinOperatorSettings> settings = nullptr);

  /**
   * @brief The identity: a single empty term with coefficient 1.
   *
   * SpinOperator({{"", 1.0}}) and SpinOperator({{"X_0^0", 1.0}}).simplify()
   * both equal one().
   */
  static SpinOperator one(
      std::uint64_t num_sites = 1, double spin = 0.5,
      std::shared_ptr<const SpinOperatorSettings> settings = nullptr);

  std::uint64_t get_num_sites() const { return num_sites_; }

  double get_spin() const { return 0.5 * twice_spin_; }

  std::uint32_t get_twice_spin() const { return twice_spin_; }

  /// Dimension of a single site, 2s+1
  std::uint64_t get_site_dimension() const { return twice_spin_ + 1u; }

  /// Number of stored terms, duplicates included
  std::size_t size() const { return terms_.size(); }

  bool empty() const { return terms_.empty(); }

  const SpinOperatorSettings& get_settings() const { return *settings_; }

  /**
   * @brief Returns the (term, coefficient) pairs in insertion order.
   */
  TermView terms() const { return TermView(*this); }

  /**
   * @brief Returns the labels of all terms, in insertion order.
   */
  std::vector<std::string> get_labels() const;

  /**
   * @brief Returns the summed coefficient of every stored term that parses
   * to the same factors as @p label; zero when there is none.
   */
  std::complex<double> coefficient(const std::string& label) const;

  /**
   * @name Arithmetic
   *
   * add(), subtract() and compose() require both operands to have the same
   * number of sites and spin; tensor() and expand() only the same spin.
   * Results carry the settings of the left operand and are not simplified.
   * @{
   */

  /**
   * @brief Structural union; coefficients of identical terms are summed.
   * @throws DimensionMismatchError
   */
  SpinOperator add(const SpinOperator& other) const;

  /// @throws DimensionMismatchError
  SpinOperator subtract(const SpinOperator& other) const;

  SpinOperator scale(std::complex<double> factor) const;

  /// @throws std::invalid_argument If @p divisor is zero.
  SpinOperator divide(std::complex<double> divisor) const;

  SpinOperator negate() const;

  /**
   * @brief Operator product this * other.
   *
   * Every pair of terms is concatenated, left factors first, with the product
   * of their coefficients.
   *
   * @throws DimensionMismatchError
   */
  SpinOperator compose(const SpinOperator& other) const;

  /**
   * @brief Tensor product with @p other placed on the higher sites.
   *
   * The sites of @p other are shifted by get_num_sites(); the result acts on
   * get_num_sites() + other.get_num_sites() sites.
   *
   * @throws DimensionMismatchError If the spins differ.
   */
  SpinOperator tensor(const SpinOperator& other) const;

  /**
   * @brief Tensor product with @p other placed on the lower sites, i.e.
   * other.tensor(*this).
   *
   * @throws DimensionMismatchError If the spins differ.
   */
  SpinOperator expand(const SpinOperator& other) const;

  /** @} */

  /**
   * @brief Complex conjugate of the operator's matrix.
   *
   * Conjugates every coefficient. S_y is imaginary, so each term also picks
   * up a factor (-1)^(number of Y factors).
   */
  SpinOperator conjugate() const;

  /**
   * @brief Transpose of the operator's matrix.
   *
   * Reverses the factors of every term. S_y is antisymmetric, so each term
   * also picks up a factor (-1)^(number of Y factors).
   */
  SpinOperator transpose() const;

  /**
   * @brief Hermitian adjoint: reversed factors and conjugated coefficients.
   */
  SpinOperator adjoint() const;

  /**
   * @brief Reduces the operator to its simplified form.
   *
   * Exponents are expanded into repeated factors (exponent zero removes the
   * factor), identical terms are merged and terms with |coefficient| at or
   * below @p tolerance are dropped. Term order is otherwise kept.
   *
   * @param tolerance Defaults to the "simplify_tolerance" setting.
   */
  SpinOperator simplify(std::optional<double> tolerance = std::nullopt) const;

  /**
   * @brief Stably sorts the factors of every term by site.
   *
   * Factors on the same site keep their relative order. Terms that become
   * identical are not merged; call simplify() for that.
   */
  SpinOperator index_order() const;

  /**
   * @brief Relabels every site i as perm[i].
   * @throws InvalidPermutationError If @p perm does not have get_num_sites()
   *         entries or is not a bijection of {0, ..., num_sites-1}.
   */
  SpinOperator permute_indices(const std::vector<std::uint64_t>& perm) const;

  /**
   * @brief Tolerance based equality of the simplified operators.
   *
   * Operators on a different number of sites or with different spin are
   * never equivalent. Otherwise, for every term t present in either
   * simplified operator (missing coefficients count as zero),
   * |a_t - b_t| <= atol + rtol * |b_t| must hold.
   *
   * @param atol Defaults to the "equality_atol" setting.
   * @param rtol Defaults to the "equality_rtol" setting.
   */
  bool equiv(const SpinOperator& other,
             std::optional<double> atol = std::nullopt,
             std::optional<double> rtol = std::nullopt) const;

  /**
   * @brief Exact comparison without simplification.
   *
   * True when both operators have the same number of sites and spin and
   * store the same multiset of (term, coefficient) pairs, in any order.
   */
  bool is_structurally_equal(const SpinOperator& other) const;

  /// True when no term survives simplify(tolerance).
  bool is_zero(std::optional<double> tolerance = std::nullopt) const;

  /**
   * @brief Symbolic Hermiticity check.
   *
   * True when (A - A^dagger).index_order().simplify(atol) has no terms. The
   * check does not apply the spin commutation relations, so it can miss
   * operators that are Hermitian only after such rewriting.
   */
  bool is_hermitian(std::optional<double> atol = std::nullopt) const;

  /**
   * @brief Zeroes real and imaginary parts with magnitude <= @p tolerance
   * and drops terms that become exactly zero.
   */
  SpinOperator chop(std::optional<double> tolerance = std::nullopt) const;

  /// Rounds real and imaginary parts to @p decimals decimal places.
  SpinOperator round(int decimals = 0) const;

  /**
   * @brief Returns (sum_t |c_t|^order)^(1/order).
   * @throws std::invalid_argument If @p order < 1.
   */
  double induced_norm(double order = 1.0) const;

  /**
   * @brief Returns the operator with its terms sorted.
   *
   * @param weight Sort by descending |coefficient| instead of by term; ties
   *        are broken by term.
   */
  SpinOperator sort(bool weight = false) const;

  /**
   * @brief Human readable sum, e.g. "2 * X_0 Y_1 - i * Z_0 + 0.5".
   *
   * "0" for an operator without terms.
   */
  std::string to_string() const;

  /**
   * @brief Multi-line description: spin, sites, term count and one line per
   * term.
   */
  std::string get_summary() const;

  /**
   * @brief Dense matrix of the operator on the full register.
   *
   * The result is d^num_sites x d^num_sites with site 0 as the fastest
   * varying index (see SpinMatrixBuilder). A warning is logged when the
   * dimension exceeds the "matrix_warning_dimension" setting.
   *
   * @throws std::overflow_error If the dimension is not representable.
   */
  Eigen::MatrixXcd to_matrix() const;

  /**
   * @brief Sparse counterpart of to_matrix().
   */
  SparseMatrixXcd to_sparse_matrix() const;

 private:
  SpinOperator(std::vector<SpinTerm> terms,
               std::vector<std::complex<double>> coefficients,
               std::uint64_t num_sites, std::uint32_t twice_spin,
               std::shared_ptr<const SpinOperatorSettings> settings);

  SpinOperator with_terms(std::vector<SpinTerm> terms,
                          std::vector<std::complex<double>> coefficients) const;

  void check_same_register(const SpinOperator& other,
                           const std::string& operation) const;

  void check_same_spin(const SpinOperator& other,
                       const std::string& operation) const;

  static SpinOperator tensor_product(const SpinOperator& low,
                                     const SpinOperator& high,
                                     std::shared_ptr<const SpinOperatorSettings>
                                         settings);

  std::vector<SpinTerm> terms_;
  std::vector<std::complex<double>> coefficients_;
  std::uint64_t num_sites_;
  std::uint32_t twice_spin_;
  std::shared_ptr<const SpinOperatorSettings> settings_;
};

/**
 * @name SpinOperator arithmetic operators
 *
 * Thin wrappers over the named SpinOperator methods; operator* between two
 * operators is compose().
 * @{
 */
inline SpinOperator operator+(const SpinOperator& lhs,
                              const SpinOperator& rhs) {
  return lhs.add(rhs);
}

inline SpinOperator operator-(const SpinOperator& lhs,
                              const SpinOperator& rhs) {
  return lhs.subtract(rhs);
}

inline SpinOperator operator-(const SpinOperator& op) { return op.negate(); }

inline SpinOperator operator*(std::complex<double> s, const SpinOperator& op) {
  return op.scale(s);
}

inline SpinOperator operator*(const SpinOperator& op, std::complex<double> s) {
  return op.scale(s);
}

inline SpinOperator operator*(const SpinOperator& lhs,
                              const SpinOperator& rhs) {
  return lhs.compose(rhs);
}

inline SpinOperator operator/(const SpinOperator& op, std::complex<double> s) {
  return op.divide(s);
}

inline bool operator==(const SpinOperator& lhs, const SpinOperator& rhs) {
  return lhs.equiv(rhs);
}

inline bool operator!=(const SpinOperator& lhs, const SpinOperator& rhs) {
  return !lhs.equiv(rhs);
}
/** @} */

}  // namespace spinalg::data
