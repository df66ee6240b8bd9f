// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <limits>
#include <spinalg/data/spin_term.hpp>
#include <string>
#include <unordered_set>

#include "ut_common.hpp"

using namespace spinalg::data;

TEST(SpinLabelTest, ParseSingleFactors) {
  auto term = parse_spin_label("X_0");
  ASSERT_EQ(term.size(), 1);
  EXPECT_EQ(term[0].generator, SpinGenerator::X);
  EXPECT_EQ(term[0].site, 0);
  EXPECT_EQ(term[0].exponent, 1);

  term = parse_spin_label("Z_1 Y_1 X_2");
  ASSERT_EQ(term.size(), 3);
  EXPECT_EQ(term[0], (SpinFactor{SpinGenerator::Z, 1, 1}));
  EXPECT_EQ(term[1], (SpinFactor{SpinGenerator::Y, 1, 1}));
  EXPECT_EQ(term[2], (SpinFactor{SpinGenerator::X, 2, 1}));
}

TEST(SpinLabelTest, ParseExponents) {
  auto term = parse_spin_label("X_0^2 Z_12^3");
  ASSERT_EQ(term.size(), 2);
  EXPECT_EQ(term[0], (SpinFactor{SpinGenerator::X, 0, 2}));
  EXPECT_EQ(term[1], (SpinFactor{SpinGenerator::Z, 12, 3}));
}

TEST(SpinLabelTest, EmptyLabelIsIdentity) {
  EXPECT_TRUE(parse_spin_label("").empty());
  EXPECT_TRUE(parse_spin_label("   ").empty());
}

TEST(SpinLabelTest, ExtraWhitespaceIsIgnored) {
  EXPECT_EQ(parse_spin_label("  X_0   Y_1 "), parse_spin_label("X_0 Y_1"));
}

TEST(SpinLabelTest, MalformedLabels) {
  EXPECT_THROW(parse_spin_label("X"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X0"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("W_0"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("x_0"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_-1"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_a"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_1a"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_0^"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_0^-1"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_0^2^3"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_0,Y_1"), MalformedLabelError);
  EXPECT_THROW(parse_spin_label("X_99999999999999999999999"),
               MalformedLabelError);
}

TEST(SpinLabelTest, ZeroExponentNeedsOptIn) {
  EXPECT_THROW(parse_spin_label("X_0^0"), MalformedLabelError);

  auto term = parse_spin_label("X_0^0 Y_1", true);
  ASSERT_EQ(term.size(), 2);
  EXPECT_EQ(term[0].exponent, 0);
}

TEST(SpinLabelTest, ErrorMessageNamesLabel) {
  try {
    parse_spin_label("X_0 Q_1");
    FAIL() << "Expected MalformedLabelError";
  } catch (const MalformedLabelError& e) {
    const std::string message = e.what();
    EXPECT_NE(message.find("X_0 Q_1"), std::string::npos);
    EXPECT_NE(message.find("Q_1"), std::string::npos);
  }
}

TEST(SpinLabelTest, Serialize) {
  EXPECT_EQ(to_spin_label({}), "");
  EXPECT_EQ(to_spin_label(parse_spin_label("Z_1 Y_1 X_2")), "Z_1 Y_1 X_2");
  EXPECT_EQ(to_spin_label(parse_spin_label("X_0^2 Y_1")), "X_0^2 Y_1");
}

TEST(SpinLabelTest, SerializeCompact) {
  EXPECT_EQ(to_spin_label(parse_spin_label("X_0 X_0 X_0 Y_1"), true),
            "X_0^3 Y_1");
  EXPECT_EQ(to_spin_label(parse_spin_label("X_0 X_0^2 Y_0 X_0"), true),
            "X_0^3 Y_0 X_0");
  // Same generator on different sites is not folded
  EXPECT_EQ(to_spin_label(parse_spin_label("X_0 X_1"), true), "X_0 X_1");
}

TEST(SpinLabelTest, ExpandExponents) {
  auto expanded = expand_exponents(parse_spin_label("X_0^2 Z_0", false));
  EXPECT_EQ(to_spin_label(expanded), "X_0 X_0 Z_0");

  expanded = expand_exponents(parse_spin_label("X_0^0 Y_1", true));
  EXPECT_EQ(to_spin_label(expanded), "Y_1");
}

TEST(SpinLabelTest, CountYFactors) {
  EXPECT_EQ(count_y_factors(parse_spin_label("X_0 Y_1 Y_0^3")), 4);
  EXPECT_EQ(count_y_factors({}), 0);
}

TEST(SpinLabelTest, MaxSiteIndex) {
  EXPECT_EQ(max_site_index(parse_spin_label("X_3 Y_1 Z_7")), 7);
  EXPECT_THROW(max_site_index({}), std::logic_error);
}

TEST(SpinTermTest, TotalOrder) {
  // Site first, then generator, then exponent
  EXPECT_LT(parse_spin_label("Z_0"), parse_spin_label("X_1"));
  EXPECT_LT(parse_spin_label("X_0"), parse_spin_label("Y_0"));
  EXPECT_LT(parse_spin_label("X_0"), parse_spin_label("X_0^2"));
  // A proper prefix sorts first
  EXPECT_LT(SpinTerm{}, parse_spin_label("X_0"));
  EXPECT_LT(parse_spin_label("X_0"), parse_spin_label("X_0 X_0"));
}

TEST(SpinTermTest, HashDistinguishesOrder) {
  std::unordered_set<SpinTerm, SpinTermHash> terms;
  terms.insert(parse_spin_label("X_0 Y_0"));
  terms.insert(parse_spin_label("Y_0 X_0"));
  terms.insert(parse_spin_label("X_0 Y_0"));
  EXPECT_EQ(terms.size(), 2);
}

TEST(SpinLabelTest, CompactExponentOverflow) {
  const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
  SpinTerm term = {SpinFactor{SpinGenerator::X, 0, max},
                   SpinFactor{SpinGenerator::X, 0, 1}};
  EXPECT_THROW(to_spin_label(term, true), MalformedLabelError);
  EXPECT_NO_THROW(to_spin_label(term));

  term[1].exponent = 0;
  EXPECT_EQ(to_spin_label(term, true), "X_0^" + std::to_string(max));
}
