/**
 * @file test_taint.cpp
 * @brief Taint lattice
 */

#include "pkgaudit/ast/taint.hpp"

#include <array>

#include <gtest/gtest.h>

namespace {

using pkgaudit::ast::combine;
using pkgaudit::ast::Taint;

constexpr std::array<Taint, 3> kAll = {Taint::kSafe, Taint::kUnknown, Taint::kTainted};

TEST(Taint, TaintedAbsorbs)
{
    for (auto value : kAll) {
        EXPECT_EQ(combine(Taint::kTainted, value), Taint::kTainted);
        EXPECT_EQ(combine(value, Taint::kTainted), Taint::kTainted);
    }
}

TEST(Taint, UnknownAbsorbsSafe)
{
    EXPECT_EQ(combine(Taint::kUnknown, Taint::kSafe), Taint::kUnknown);
    EXPECT_EQ(combine(Taint::kSafe, Taint::kUnknown), Taint::kUnknown);
    EXPECT_EQ(combine(Taint::kSafe, Taint::kSafe), Taint::kSafe);
}

TEST(Taint, CommutativeAndAssociative)
{
    for (auto a : kAll) {
        for (auto b : kAll) {
            EXPECT_EQ(combine(a, b), combine(b, a));
            for (auto c : kAll) {
                EXPECT_EQ(combine(combine(a, b), c), combine(a, combine(b, c)));
            }
        }
    }
}

static_assert(combine(Taint::kSafe, Taint::kTainted) == Taint::kTainted);
static_assert(pkgaudit::ast::to_string(Taint::kUnknown) == "UNKNOWN");

}  // namespace
