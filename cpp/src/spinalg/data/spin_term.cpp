// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <sstream>
#include <spinalg/data/spin_term.hpp>
#include <string>
#include <system_error>

namespace spinalg::data {

namespace detail {

bool is_label_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/**
 * @brief Parses an unsigned decimal number spanning all of @p digits.
 *
 * @return false if @p digits is empty, contains anything but decimal digits,
 *         or does not fit into 64 bits.
 */
bool parse_decimal(std::string_view digits, std::uint64_t& value) {
  if (digits.empty()) return false;
  const char* first = digits.data();
  const char* last = first + digits.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  return ec == std::errc() && ptr == last;
}

SpinFactor parse_factor(std::string_view token, std::string_view label,
                        bool allow_zero_exponent) {
  auto fail = [&](const std::string& reason) {
    return MalformedLabelError(std::string(label), reason + " in token '" +
                                                       std::string(token) +
                                                       "'");
  };

  if (token.size() < 3 || token[1] != '_') {
    throw fail("expected G_i or G_i^k");
  }

  SpinGenerator generator;
  switch (token[0]) {
    case 'X':
      generator = SpinGenerator::X;
      break;
    case 'Y':
      generator = SpinGenerator::Y;
      break;
    case 'Z':
      generator = SpinGenerator::Z;
      break;
    default:
      throw fail("unknown generator '" + std::string(1, token[0]) + "'");
  }

  std::string_view rest = token.substr(2);
  std::string_view site_digits = rest;
  std::string_view exponent_digits;
  bool has_exponent = false;
  if (auto caret = rest.find('^'); caret != std::string_view::npos) {
    site_digits = rest.substr(0, caret);
    exponent_digits = rest.substr(caret + 1);
    has_exponent = true;
  }

  if (!site_digits.empty() && site_digits.front() == '-') {
    throw fail("negative site index");
  }
  std::uint64_t site = 0;
  if (!parse_decimal(site_digits, site)) {
    throw fail("invalid site index");
  }

  std::uint64_t exponent = 1;
  if (has_exponent) {
    if (!exponent_digits.empty() && exponent_digits.front() == '-') {
      throw fail("negative exponent");
    }
    if (!parse_decimal(exponent_digits, exponent)) {
      throw fail("invalid exponent");
    }
    if (exponent == 0 && !allow_zero_exponent) {
      throw fail("zero exponent");
    }
  }

  return SpinFactor{generator, site, exponent};
}

}  // namespace detail

char to_char(SpinGenerator generator) {
  switch (generator) {
    case SpinGenerator::X:
      return 'X';
    case SpinGenerator::Y:
      return 'Y';
    case SpinGenerator::Z:
      return 'Z';
  }
  throw std::invalid_argument("Invalid spin generator");
}

std::strong_ordering SpinFactor::operator<=>(const SpinFactor& other) const {
  if (auto cmp = site <=> other.site; cmp != 0) return cmp;
  if (auto cmp = generator <=> other.generator; cmp != 0) return cmp;
  return exponent <=> other.exponent;
}

SpinTerm parse_spin_label(std::string_view label, bool allow_zero_exponent) {
  SpinTerm term;
  std::size_t pos = 0;
  while (pos < label.size()) {
    while (pos < label.size() && detail::is_label_space(label[pos])) ++pos;
    if (pos == label.size()) break;
    std::size_t end = pos;
    while (end < label.size() && !detail::is_label_space(label[end])) ++end;
    term.push_back(detail::parse_factor(label.substr(pos, end - pos), label,
                                        allow_zero_exponent));
    pos = end;
  }
  return term;
}

std::string to_spin_label(const SpinTerm& term, bool compact) {
  std::ostringstream oss;
  bool first = true;
  for (std::size_t i = 0; i < term.size();) {
    const auto& factor = term[i];
    std::uint64_t exponent = factor.exponent;
    std::size_t next = i + 1;
    if (compact) {
      while (next < term.size() &&
             term[next].generator == factor.generator &&
             term[next].site == factor.site) {
        if (term[next].exponent >
            std::numeric_limits<std::uint64_t>::max() - exponent) {
          throw MalformedLabelError(
              to_spin_label(term),
              "folded exponent of " + std::string(1, to_char(factor.generator)) +
                  "_" + std::to_string(factor.site) + " overflows");
        }
        exponent += term[next].exponent;
        ++next;
      }
    }

    if (!first) oss << ' ';
    oss << to_char(factor.generator) << '_' << factor.site;
    if (exponent != 1) oss << '^' << exponent;
    first = false;
    i = next;
  }
  return oss.str();
}

SpinTerm expand_exponents(const SpinTerm& term) {
  SpinTerm expanded;
  expanded.reserve(term.size());
  for (const auto& factor : term) {
    for (std::uint64_t k = 0; k < factor.exponent; ++k) {
      expanded.push_back(SpinFactor{factor.generator, factor.site, 1});
    }
  }
  return expanded;
}

std::uint64_t count_y_factors(const SpinTerm& term) {
  std::uint64_t count = 0;
  for (const auto& factor : term) {
    if (factor.generator == SpinGenerator::Y) count += factor.exponent;
  }
  return count;
}

std::uint64_t max_site_index(const SpinTerm& term) {
  if (term.empty()) {
    throw std::logic_error("Cannot get max site index of the identity term");
  }
  std::uint64_t max_site = 0;
  for (const auto& factor : term) {
    max_site = std::max(max_site, factor.site);
  }
  return max_site;
}

}  // namespace spinalg::data
