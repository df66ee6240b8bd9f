// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <spinalg/data/spin_operator.hpp>
#include <spinalg/utils/logger.hpp>

namespace spinalg::data {

namespace detail {

std::uint32_t to_twice_spin(double spin) {
  const double twice = 2.0 * spin;
  if (!std::isfinite(twice) || twice < 1.0 || std::floor(twice) != twice ||
      twice >= static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    throw std::invalid_argument("Spin must be a positive multiple of 1/2, got " +
                                std::to_string(spin));
  }
  return static_cast<std::uint32_t>(twice);
}

std::string spin_to_string(double spin) {
  const auto twice = static_cast<long long>(std::llround(2.0 * spin));
  if (twice % 2 == 0) return std::to_string(twice / 2);
  return std::to_string(twice) + "/2";
}

std::shared_ptr<const SpinOperatorSettings> resolve_settings(
    std::shared_ptr<const SpinOperatorSettings> settings) {
  static const std::shared_ptr<const SpinOperatorSettings> defaults = [] {
    auto s = std::make_shared<SpinOperatorSettings>();
    s->lock();
    return s;
  }();
  if (!settings) return defaults;
  if (settings->is_locked()) return settings;
  auto copy = std::make_shared<SpinOperatorSettings>(*settings);
  copy->lock();
  return copy;
}

/**
 * @brief Formats a coefficient for to_string(): "" for 1, "-" for -1, "i" and
 * "-i" for the imaginary units, "(a+bi)" for general complex values.
 */
std::string spin_operator_scalar_to_string(std::complex<double> coefficient) {
  constexpr double zero_tolerance = std::numeric_limits<double>::epsilon();
  std::ostringstream oss;
  if (coefficient.imag() == 0.0) {
    if (std::abs(coefficient.real() - 1.0) < zero_tolerance) {
      return "";
    } else if (std::abs(coefficient.real() + 1.0) < zero_tolerance) {
      return "-";
    }
    oss << coefficient.real();
  } else if (coefficient.real() == 0.0) {
    if (std::abs(coefficient.imag() - 1.0) < zero_tolerance) {
      return "i";
    } else if (std::abs(coefficient.imag() + 1.0) < zero_tolerance) {
      return "-i";
    }
    oss << coefficient.imag() << "i";
  } else {
    oss << "(" << coefficient.real();
    if (coefficient.imag() >= 0) oss << "+";
    oss << coefficient.imag() << "i)";
  }
  return oss.str();
}

double y_sign(const SpinTerm& term) {
  return count_y_factors(term) % 2 == 0 ? 1.0 : -1.0;
}

SpinTerm reversed(const SpinTerm& term) {
  return SpinTerm(term.rbegin(), term.rend());
}

bool term_pair_less(const SpinOperator::TermPair& a,
                    const SpinOperator::TermPair& b) {
  if (a.first != b.first) return a.first < b.first;
  if (a.second.real() != b.second.real()) {
    return a.second.real() < b.second.real();
  }
  return a.second.imag() < b.second.imag();
}

void warn_if_large(Eigen::Index dimension,
                   const SpinOperatorSettings& settings) {
  const auto limit = settings.get<int64_t>("matrix_warning_dimension");
  if (dimension > limit) {
    SPINALG_LOGGER().warn(
        "Building a {0}x{0} matrix, above matrix_warning_dimension = {1}",
        dimension, limit);
  }
}

}  // namespace detail

DimensionMismatchError::DimensionMismatchError(const std::string& operation,
                                               std::uint64_t lhs_num_sites,
                                               double lhs_spin,
                                               std::uint64_t rhs_num_sites,
                                               double rhs_spin)
    : std::invalid_argument(
          "Cannot " + operation + " operators on " +
          std::to_string(lhs_num_sites) + " sites of spin " +
          detail::spin_to_string(lhs_spin) + " and " +
          std::to_string(rhs_num_sites) + " sites of spin " +
          detail::spin_to_string(rhs_spin)) {}

// SpinTermAccumulator

void SpinTermAccumulator::accumulate(const SpinTerm& term,
                                     std::complex<double> coeff) {
  auto [it, inserted] = index_.try_emplace(term, terms_.size());
  if (inserted) {
    terms_.push_back(term);
    coefficients_.push_back(coeff);
  } else {
    coefficients_[it->second] += coeff;
  }
}

void SpinTermAccumulator::reserve(std::size_t capacity) {
  index_.reserve(capacity);
  terms_.reserve(capacity);
  coefficients_.reserve(capacity);
}

std::pair<std::vector<SpinTerm>, std::vector<std::complex<double>>>
SpinTermAccumulator::release(std::optional<double> threshold) {
  std::vector<SpinTerm> terms;
  std::vector<std::complex<double>> coefficients;
  if (!threshold) {
    terms = std::move(terms_);
    coefficients = std::move(coefficients_);
  } else {
    terms.reserve(terms_.size());
    coefficients.reserve(terms_.size());
    for (std::size_t i = 0; i < terms_.size(); ++i) {
      if (std::abs(coefficients_[i]) > *threshold) {
        terms.push_back(std::move(terms_[i]));
        coefficients.push_back(coefficients_[i]);
      }
    }
  }
  index_.clear();
  terms_.clear();
  coefficients_.clear();
  return {std::move(terms), std::move(coefficients)};
}

// Construction

namespace detail {

SpinOperator::TermList parse_labels(
    const SpinOperator::LabelCoefficients& data) {
  SpinOperator::TermList terms;
  terms.reserve(data.size());
  for (const auto& [label, coeff] : data) {
    terms.emplace_back(parse_spin_label(label, true), coeff);
  }
  return terms;
}

}  // namespace detail

SpinOperator::SpinOperator(const LabelCoefficients& data,
                           std::optional<std::uint64_t> num_sites, double spin,
                           std::shared_ptr<const SpinOperatorSettings> settings)
    : SpinOperator(from_terms(detail::parse_labels(data), num_sites, spin,
                              std::move(settings))) {}

SpinOperator::SpinOperator(std::vector<SpinTerm> terms,
                           std::vector<std::complex<double>> coefficients,
                           std::uint64_t num_sites, std::uint32_t twice_spin,
                           std::shared_ptr<const SpinOperatorSettings> settings)
    : terms_(std::move(terms)),
      coefficients_(std::move(coefficients)),
      num_sites_(num_sites),
      twice_spin_(twice_spin),
      settings_(detail::resolve_settings(std::move(settings))) {}

SpinOperator SpinOperator::from_terms(
    const TermList& terms, std::optional<std::uint64_t> num_sites, double spin,
    std::shared_ptr<const SpinOperatorSettings> settings) {
  const std::uint32_t twice_spin = detail::to_twice_spin(spin);

  // An identity-only operator acts on a single site, like one() and zero()
  std::uint64_t required_sites = 1;
  for (const auto& [term, coeff] : terms) {
    if (term.empty()) continue;
    const std::uint64_t max_site = max_site_index(term);
    if (max_site == std::numeric_limits<std::uint64_t>::max()) {
      throw MalformedLabelError(to_spin_label(term), "site index too large");
    }
    if (num_sites && max_site >= *num_sites) {
      throw MalformedLabelError(
          to_spin_label(term), "site index " + std::to_string(max_site) +
                                   " is out of range for " +
                                   std::to_string(*num_sites) + " sites");
    }
    required_sites = std::max(required_sites, max_site + 1);
  }

  SpinTermAccumulator acc;
  acc.reserve(terms.size());
  for (const auto& [term, coeff] : terms) {
    acc.accumulate(term, coeff);
  }
  auto [merged_terms, merged_coeffs] = acc.release();
  return SpinOperator(std::move(merged_terms), std::move(merged_coeffs),
                      num_sites.value_or(required_sites), twice_spin,
                      std::move(settings));
}

SpinOperator SpinOperator::from_terms(
    const TermView& view, std::optional<std::uint64_t> num_sites,
    std::optional<double> spin,
    std::shared_ptr<const SpinOperatorSettings> settings) {
  return from_terms(TermList(view.begin(), view.end()),
                    num_sites.value_or(view.get_num_sites()),
                    spin.value_or(view.get_spin()),
                    settings ? std::move(settings) : view.get_settings());
}

SpinOperator SpinOperator::zero(
    std::uint64_t num_sites, double spin,
    std::shared_ptr<const SpinOperatorSettings> settings) {
  return SpinOperator({}, {}, num_sites, detail::to_twice_spin(spin),
                      std::move(settings));
}

SpinOperator SpinOperator::one(
    std::uint64_t num_sites, double spin,
    std::shared_ptr<const SpinOperatorSettings> settings) {
  return SpinOperator({SpinTerm{}}, {std::complex<double>(1.0, 0.0)},
                      num_sites, detail::to_twice_spin(spin),
                      std::move(settings));
}

SpinOperator SpinOperator::with_terms(
    std::vector<SpinTerm> terms,
    std::vector<std::complex<double>> coefficients) const {
  return SpinOperator(std::move(terms), std::move(coefficients), num_sites_,
                      twice_spin_, settings_);
}

void SpinOperator::check_same_register(const SpinOperator& other,
                                       const std::string& operation) const {
  if (num_sites_ != other.num_sites_ || twice_spin_ != other.twice_spin_) {
    throw DimensionMismatchError(operation, num_sites_, get_spin(),
                                 other.num_sites_, other.get_spin());
  }
}

void SpinOperator::check_same_spin(const SpinOperator& other,
                                   const std::string& operation) const {
  if (twice_spin_ != other.twice_spin_) {
    throw DimensionMismatchError(operation, num_sites_, get_spin(),
                                 other.num_sites_, other.get_spin());
  }
}

// Inspection

std::vector<std::string> SpinOperator::get_labels() const {
  std::vector<std::string> labels;
  labels.reserve(terms_.size());
  for (const auto& term : terms_) {
    labels.push_back(to_spin_label(term));
  }
  return labels;
}

std::complex<double> SpinOperator::coefficient(const std::string& label) const {
  const SpinTerm term = parse_spin_label(label, true);
  std::complex<double> result(0.0, 0.0);
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    if (terms_[i] == term) result += coefficients_[i];
  }
  return result;
}

// Arithmetic

SpinOperator SpinOperator::add(const SpinOperator& other) const {
  SPINALG_LOG_TRACE_ENTERING();
  check_same_register(other, "add");

  SpinTermAccumulator acc;
  acc.reserve(size() + other.size());
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    acc.accumulate(terms_[i], coefficients_[i]);
  }
  for (std::size_t i = 0; i < other.terms_.size(); ++i) {
    acc.accumulate(other.terms_[i], other.coefficients_[i]);
  }
  auto [terms, coefficients] = acc.release();
  return with_terms(std::move(terms), std::move(coefficients));
}

SpinOperator SpinOperator::subtract(const SpinOperator& other) const {
  SPINALG_LOG_TRACE_ENTERING();
  check_same_register(other, "subtract");
  return add(other.negate());
}

SpinOperator SpinOperator::scale(std::complex<double> factor) const {
  std::vector<std::complex<double>> coefficients(coefficients_);
  for (auto& c : coefficients) c *= factor;
  return with_terms(terms_, std::move(coefficients));
}

SpinOperator SpinOperator::divide(std::complex<double> divisor) const {
  if (divisor == 0.0) {
    throw std::invalid_argument("Cannot divide a SpinOperator by zero");
  }
  return scale(1.0 / divisor);
}

SpinOperator SpinOperator::negate() const { return scale(-1.0); }

SpinOperator SpinOperator::compose(const SpinOperator& other) const {
  SPINALG_LOG_TRACE_ENTERING();
  check_same_register(other, "compose");

  SpinTermAccumulator acc;
  acc.reserve(size() * other.size());
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    for (std::size_t j = 0; j < other.terms_.size(); ++j) {
      SpinTerm product;
      product.reserve(terms_[i].size() + other.terms_[j].size());
      product.insert(product.end(), terms_[i].begin(), terms_[i].end());
      product.insert(product.end(), other.terms_[j].begin(),
                     other.terms_[j].end());
      acc.accumulate(product, coefficients_[i] * other.coefficients_[j]);
    }
  }
  auto [terms, coefficients] = acc.release();
  return with_terms(std::move(terms), std::move(coefficients));
}

SpinOperator SpinOperator::tensor_product(
    const SpinOperator& low, const SpinOperator& high,
    std::shared_ptr<const SpinOperatorSettings> settings) {
  const std::uint64_t shift = low.num_sites_;
  if (high.num_sites_ > std::numeric_limits<std::uint64_t>::max() - shift) {
    throw std::overflow_error("Tensor product has too many sites");
  }

  SpinTermAccumulator acc;
  acc.reserve(low.size() * high.size());
  for (std::size_t i = 0; i < low.terms_.size(); ++i) {
    for (std::size_t j = 0; j < high.terms_.size(); ++j) {
      SpinTerm product;
      product.reserve(low.terms_[i].size() + high.terms_[j].size());
      product.insert(product.end(), low.terms_[i].begin(),
                     low.terms_[i].end());
      for (const auto& factor : high.terms_[j]) {
        product.push_back(
            SpinFactor{factor.generator, factor.site + shift, factor.exponent});
      }
      acc.accumulate(product, low.coefficients_[i] * high.coefficients_[j]);
    }
  }
  auto [terms, coefficients] = acc.release();
  return SpinOperator(std::move(terms), std::move(coefficients),
                      low.num_sites_ + high.num_sites_, low.twice_spin_,
                      std::move(settings));
}

SpinOperator SpinOperator::tensor(const SpinOperator& other) const {
  SPINALG_LOG_TRACE_ENTERING();
  check_same_spin(other, "tensor");
  return tensor_product(*this, other, settings_);
}

SpinOperator SpinOperator::expand(const SpinOperator& other) const {
  SPINALG_LOG_TRACE_ENTERING();
  check_same_spin(other, "expand");
  return tensor_product(other, *this, settings_);
}

SpinOperator SpinOperator::conjugate() const {
  std::vector<std::complex<double>> coefficients;
  coefficients.reserve(coefficients_.size());
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    coefficients.push_back(std::conj(coefficients_[i]) *
                           detail::y_sign(terms_[i]));
  }
  return with_terms(terms_, std::move(coefficients));
}

SpinOperator SpinOperator::transpose() const {
  std::vector<SpinTerm> terms;
  std::vector<std::complex<double>> coefficients;
  terms.reserve(terms_.size());
  coefficients.reserve(coefficients_.size());
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    terms.push_back(detail::reversed(terms_[i]));
    coefficients.push_back(coefficients_[i] * detail::y_sign(terms_[i]));
  }
  return with_terms(std::move(terms), std::move(coefficients));
}

SpinOperator SpinOperator::adjoint() const {
  std::vector<SpinTerm> terms;
  std::vector<std::complex<double>> coefficients;
  terms.reserve(terms_.size());
  coefficients.reserve(coefficients_.size());
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    terms.push_back(detail::reversed(terms_[i]));
    coefficients.push_back(std::conj(coefficients_[i]));
  }
  return with_terms(std::move(terms), std::move(coefficients));
}

// Canonicalization

SpinOperator SpinOperator::simplify(std::optional<double> tolerance) const {
  SPINALG_LOG_TRACE_ENTERING();
  const double tol =
      tolerance.value_or(settings_->get<double>("simplify_tolerance"));
  if (tol < 0.0) {
    throw std::invalid_argument("Simplification tolerance must be >= 0");
  }

  SpinTermAccumulator acc;
  acc.reserve(terms_.size());
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    acc.accumulate(expand_exponents(terms_[i]), coefficients_[i]);
  }
  auto [terms, coefficients] = acc.release(tol);
  SPINALG_LOGGER().debug("simplify: {} terms in, {} terms out", terms_.size(),
                         terms.size());
  return with_terms(std::move(terms), std::move(coefficients));
}

SpinOperator SpinOperator::index_order() const {
  SPINALG_LOG_TRACE_ENTERING();
  std::vector<SpinTerm> terms(terms_);
  for (auto& term : terms) {
    std::stable_sort(term.begin(), term.end(),
                     [](const SpinFactor& a, const SpinFactor& b) {
                       return a.site < b.site;
                     });
  }
  return with_terms(std::move(terms), coefficients_);
}

SpinOperator SpinOperator::permute_indices(
    const std::vector<std::uint64_t>& perm) const {
  SPINALG_LOG_TRACE_ENTERING();
  if (perm.size() != num_sites_) {
    throw InvalidPermutationError("expected " + std::to_string(num_sites_) +
                                  " entries, got " +
                                  std::to_string(perm.size()));
  }
  std::vector<bool> seen(num_sites_, false);
  for (const auto p : perm) {
    if (p >= num_sites_ || seen[p]) {
      throw InvalidPermutationError("not a bijection of {0, ..., " +
                                    std::to_string(num_sites_ - 1) + "}");
    }
    seen[p] = true;
  }

  std::vector<SpinTerm> terms(terms_);
  for (auto& term : terms) {
    for (auto& factor : term) {
      factor.site = perm[factor.site];
    }
  }
  return with_terms(std::move(terms), coefficients_);
}

// Comparison

bool SpinOperator::equiv(const SpinOperator& other, std::optional<double> atol,
                         std::optional<double> rtol) const {
  SPINALG_LOG_TRACE_ENTERING();
  if (num_sites_ != other.num_sites_ || twice_spin_ != other.twice_spin_) {
    return false;
  }
  const double a_tol =
      atol.value_or(settings_->get<double>("equality_atol"));
  const double r_tol =
      rtol.value_or(settings_->get<double>("equality_rtol"));
  auto close = [&](std::complex<double> a, std::complex<double> b) {
    return std::abs(a - b) <= a_tol + r_tol * std::abs(b);
  };

  const SpinOperator lhs = simplify();
  const SpinOperator rhs = other.simplify();

  std::unordered_map<SpinTerm, std::complex<double>, SpinTermHash> remaining;
  remaining.reserve(rhs.size());
  for (std::size_t i = 0; i < rhs.terms_.size(); ++i) {
    remaining[rhs.terms_[i]] += rhs.coefficients_[i];
  }

  for (std::size_t i = 0; i < lhs.terms_.size(); ++i) {
    std::complex<double> b(0.0, 0.0);
    if (auto it = remaining.find(lhs.terms_[i]); it != remaining.end()) {
      b = it->second;
      remaining.erase(it);
    }
    if (!close(lhs.coefficients_[i], b)) return false;
  }
  for (const auto& [term, b] : remaining) {
    if (!close(0.0, b)) return false;
  }
  return true;
}

bool SpinOperator::is_structurally_equal(const SpinOperator& other) const {
  if (num_sites_ != other.num_sites_ || twice_spin_ != other.twice_spin_ ||
      terms_.size() != other.terms_.size()) {
    return false;
  }
  TermList lhs(terms().begin(), terms().end());
  TermList rhs(other.terms().begin(), other.terms().end());
  std::sort(lhs.begin(), lhs.end(), detail::term_pair_less);
  std::sort(rhs.begin(), rhs.end(), detail::term_pair_less);
  return lhs == rhs;
}

bool SpinOperator::is_zero(std::optional<double> tolerance) const {
  return simplify(tolerance).empty();
}

bool SpinOperator::is_hermitian(std::optional<double> atol) const {
  SPINALG_LOG_TRACE_ENTERING();
  const double tol = atol.value_or(settings_->get<double>("equality_atol"));
  return subtract(adjoint()).index_order().simplify(tol).empty();
}

// Coefficient utilities

SpinOperator SpinOperator::chop(std::optional<double> tolerance) const {
  const double tol =
      tolerance.value_or(settings_->get<double>("simplify_tolerance"));
  std::vector<SpinTerm> terms;
  std::vector<std::complex<double>> coefficients;
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    double re = coefficients_[i].real();
    double im = coefficients_[i].imag();
    if (std::abs(re) <= tol) re = 0.0;
    if (std::abs(im) <= tol) im = 0.0;
    if (re == 0.0 && im == 0.0) continue;
    terms.push_back(terms_[i]);
    coefficients.emplace_back(re, im);
  }
  return with_terms(std::move(terms), std::move(coefficients));
}

SpinOperator SpinOperator::round(int decimals) const {
  const double factor = std::pow(10.0, decimals);
  std::vector<std::complex<double>> coefficients;
  coefficients.reserve(coefficients_.size());
  for (const auto& c : coefficients_) {
    coefficients.emplace_back(std::round(c.real() * factor) / factor,
                              std::round(c.imag() * factor) / factor);
  }
  return with_terms(terms_, std::move(coefficients));
}

double SpinOperator::induced_norm(double order) const {
  if (!(order >= 1.0)) {
    throw std::invalid_argument("Induced norm order must be >= 1, got " +
                                std::to_string(order));
  }
  double sum = 0.0;
  for (const auto& c : coefficients_) {
    sum += std::pow(std::abs(c), order);
  }
  return std::pow(sum, 1.0 / order);
}

SpinOperator SpinOperator::sort(bool weight) const {
  std::vector<std::size_t> order(terms_.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) {
                     if (weight) {
                       const double wa = std::abs(coefficients_[a]);
                       const double wb = std::abs(coefficients_[b]);
                       if (wa != wb) return wa > wb;
                     }
                     return terms_[a] < terms_[b];
                   });

  std::vector<SpinTerm> terms;
  std::vector<std::complex<double>> coefficients;
  terms.reserve(order.size());
  coefficients.reserve(order.size());
  for (const auto i : order) {
    terms.push_back(terms_[i]);
    coefficients.push_back(coefficients_[i]);
  }
  return with_terms(std::move(terms), std::move(coefficients));
}

// String forms

std::string SpinOperator::to_string() const {
  if (terms_.empty()) return "0";

  std::string result;
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    const std::string coeff_str =
        detail::spin_operator_scalar_to_string(coefficients_[i]);
    const std::string label = to_spin_label(terms_[i]);

    std::string term_str;
    if (label.empty()) {
      term_str = coeff_str.empty() ? "1" : coeff_str == "-" ? "-1" : coeff_str;
    } else if (coeff_str.empty()) {
      term_str = label;
    } else if (coeff_str == "-") {
      term_str = "-" + label;
    } else {
      term_str = coeff_str + " * " + label;
    }

    if (i == 0) {
      result = term_str;
    } else if (term_str[0] == '-') {
      result += " - " + term_str.substr(1);
    } else {
      result += " + " + term_str;
    }
  }
  return result;
}

std::string SpinOperator::get_summary() const {
  std::ostringstream oss;
  oss << "Spin Operator Summary:\n";
  oss << "  Spin: " << detail::spin_to_string(get_spin()) << "\n";
  oss << "  Number of sites: " << num_sites_ << "\n";
  oss << "  Number of terms: " << terms_.size() << "\n";
  if (!terms_.empty()) {
    oss << "  Terms:\n";
    for (std::size_t i = 0; i < terms_.size(); ++i) {
      const auto& c = coefficients_[i];
      const std::string label = to_spin_label(terms_[i]);
      oss << "    (" << c.real() << (c.imag() >= 0 ? "+" : "") << c.imag()
          << "i) " << (label.empty() ? "<identity>" : label) << "\n";
    }
  }
  return oss.str();
}

// Matrices

Eigen::MatrixXcd SpinOperator::to_matrix() const {
  SPINALG_LOG_TRACE_ENTERING();
  const SpinMatrixBuilder builder(twice_spin_, num_sites_);
  detail::warn_if_large(builder.dimension(), *settings_);
  SPINALG_LOGGER().debug("to_matrix: dimension {}, {} terms",
                         builder.dimension(), terms_.size());

  Eigen::MatrixXcd result =
      Eigen::MatrixXcd::Zero(builder.dimension(), builder.dimension());
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    builder.accumulate(result, terms_[i], coefficients_[i]);
  }
  return result;
}

SparseMatrixXcd SpinOperator::to_sparse_matrix() const {
  SPINALG_LOG_TRACE_ENTERING();
  const SpinMatrixBuilder builder(twice_spin_, num_sites_);
  SPINALG_LOGGER().debug("to_sparse_matrix: dimension {}, {} terms",
                         builder.dimension(), terms_.size());

  std::vector<Eigen::Triplet<std::complex<double>>> triplets;
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    builder.accumulate(triplets, terms_[i], coefficients_[i]);
  }
  SparseMatrixXcd result(builder.dimension(), builder.dimension());
  result.setFromTriplets(triplets.begin(), triplets.end());
  result.prune([](const Eigen::Index&, const Eigen::Index&,
                  const std::complex<double>& value) { return value != 0.0; });
  return result;
}

}  // namespace spinalg::data
