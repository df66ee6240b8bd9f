// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <compare>
#include <cstdint>
#include <spinalg/utils/hash.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace spinalg::data {

/**
 * @brief The three single-site spin generators.
 *
 * Each generator is represented on a site of spin s by the corresponding
 * (2s+1)-dimensional spin matrix S_x, S_y or S_z.
 */
enum class SpinGenerator : std::uint8_t { X = 0, Y = 1, Z = 2 };

/**
 * @brief Returns the label character of a generator ('X', 'Y' or 'Z').
 */
char to_char(SpinGenerator generator);

/**
 * @brief One factor of a spin term: a generator acting on a site, possibly
 * raised to a power.
 *
 * An exponent of k stands for k adjacent copies of the same factor. Raw
 * operators keep the exponent as written in the label; simplification
 * expands it. An exponent of 0 acts as the identity on the site.
 */
struct SpinFactor {
  SpinGenerator generator;
  std::uint64_t site;
  std::uint64_t exponent = 1;

  bool operator==(const SpinFactor& other) const = default;

  /**
   * @brief Orders factors by site, then generator, then exponent.
   */
  std::strong_ordering operator<=>(const SpinFactor& other) const;
};

/**
 * @brief An ordered product of spin factors.
 *
 * Factor order is significant since generators acting on the same site do
 * not commute. The empty term is the identity operator.
 *
 * std::vector's lexicographic comparison, built on SpinFactor's ordering,
 * gives a total order over terms in which a proper prefix sorts first.
 *
 * Example: "Z_1 Y_1 X_2" is represented as
 *   [{Z, 1, 1}, {Y, 1, 1}, {X, 2, 1}]
 */
using SpinTerm = std::vector<SpinFactor>;

/**
 * @brief Hash function for SpinTerm.
 */
struct SpinTermHash {
  std::size_t operator()(const SpinTerm& term) const noexcept {
    std::size_t seed = term.size();
    for (const auto& factor : term) {
      seed = utils::hash_combine(seed, factor.site,
                                 static_cast<std::uint8_t>(factor.generator),
                                 factor.exponent);
    }
    return seed;
  }
};

/**
 * @brief Exception thrown when a term label does not follow the label
 * grammar, or names a site outside the operator's register.
 */
class MalformedLabelError : public std::invalid_argument {
 public:
  explicit MalformedLabelError(const std::string& label,
                               const std::string& reason)
      : std::invalid_argument("Malformed spin label '" + label +
                              "': " + reason) {}
};

/**
 * @brief Parses a term label into its factors.
 *
 * The grammar is a whitespace separated list of tokens of the form
 * `G_i` or `G_i^k` with G one of X, Y, Z, i a non-negative decimal site index
 * and k a positive decimal exponent. The empty (or all-blank) label parses to
 * the identity term.
 *
 * @param label The label to parse, e.g. "X_0 Y_0^2 Z_3".
 * @param allow_zero_exponent Accept `G_i^0` tokens. Operator construction
 *        enables this so that simplification can drop the factor.
 * @return The parsed term in label order.
 * @throws MalformedLabelError If a token does not match the grammar, the site
 *         index is negative or too large, or the exponent is not positive
 *         (or negative when zero exponents are allowed).
 */
SpinTerm parse_spin_label(std::string_view label,
                          bool allow_zero_exponent = false);

/**
 * @brief Serializes a term into its label.
 *
 * Every factor is emitted as `G_i`, or `G_i^k` when it carries an exponent
 * other than one, so that parse_spin_label(to_spin_label(t)) == t.
 *
 * With @p compact set, runs of adjacent factors with the same generator and
 * site are additionally folded into a single `G_i^k` token, e.g.
 * "X_0 X_0 X_0 Y_1" becomes "X_0^3 Y_1".
 *
 * @param term The term to serialize.
 * @param compact Fold repeated adjacent factors into exponents.
 * @return The label; the empty string for the identity term.
 * @throws MalformedLabelError If a folded exponent does not fit in 64 bits.
 */
std::string to_spin_label(const SpinTerm& term, bool compact = false);

/**
 * @brief Replaces every factor of exponent k by k factors of exponent one.
 *
 * Factors with exponent zero disappear.
 */
SpinTerm expand_exponents(const SpinTerm& term);

/**
 * @brief Counts the Y generators of a term, with multiplicity.
 *
 * S_y is the only spin matrix that is imaginary (and antisymmetric), so this
 * count fixes the sign picked up by a term under complex conjugation or
 * transposition.
 */
std::uint64_t count_y_factors(const SpinTerm& term);

/**
 * @brief Returns the largest site index referenced by a term.
 * @throws std::logic_error If the term is empty.
 */
std::uint64_t max_site_index(const SpinTerm& term);

}  // namespace spinalg::data
