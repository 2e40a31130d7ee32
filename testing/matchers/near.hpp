#pragma once

#include <string>

#include <catch2/matchers/catch_matchers_templated.hpp>

#include <fmt/format.h>

#include <libs/geom/format.hpp>

/// Squared distance between vectors is below tolerance
class vector_near_matcher : public Catch::Matchers::MatcherGenericBase {
public:
  vector_near_matcher(geom::vector val, fixed::fp sqr_tolerance) noexcept
      : expectation_{val}, sqr_tolerance_{sqr_tolerance} {}

  bool match(geom::vector val) const { return (val - expectation_).sqr_len() < sqr_tolerance_; }

  std::string describe() const override {
    return fmt::format("Is within squared distance {} of {}", sqr_tolerance_, expectation_);
  }

private:
  geom::vector expectation_;
  fixed::fp sqr_tolerance_;
};

class fp_near_matcher : public Catch::Matchers::MatcherGenericBase {
public:
  fp_near_matcher(fixed::fp val, fixed::fp tolerance) noexcept
      : expectation_{val}, tolerance_{tolerance} {}

  bool match(fixed::fp val) const { return (val - expectation_).abs() <= tolerance_; }

  std::string describe() const override {
    return fmt::format("Is within {} of {}", tolerance_, expectation_);
  }

private:
  fixed::fp expectation_;
  fixed::fp tolerance_;
};

inline auto is_near(geom::vector val, fixed::fp sqr_tolerance = fixed::fp{0.01}) {
  return vector_near_matcher{val, sqr_tolerance};
}

inline auto is_near(fixed::fp val, fixed::fp tolerance) { return fp_near_matcher{val, tolerance}; }
