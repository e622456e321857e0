#include <catch2/catch.hpp>

#include <limits>
#include <random>

#include "stream_core/correlation.hpp"
#include "stream_core/errors.hpp"

using namespace stream_core;

TEST_CASE("Perfectly co-moving identities need no shrinkage", "[correlation]") {
  Eigen::MatrixXd x(4, 2);
  x << 1, 1, -1, -1, 1, 1, -1, -1;
  CorrelationEstimator est;
  REQUIRE(est.fit(x, {"a", "b"}));

  CHECK(est.shrinkage() == Approx(0.0));
  const Eigen::MatrixXd cov = est.covariance();
  CHECK(cov(0, 0) == Approx(1.0));
  CHECK(cov(0, 1) == Approx(1.0));
  CHECK(cov(1, 1) == Approx(1.0));
  CHECK(est.correlation("a", "b") == Approx(1.0));
}

TEST_CASE("Shrinkage pulls the covariance toward a scaled identity", "[correlation]") {
  // Sample covariance diag(2/3, 0); target (1/3) I; weight 1/3.
  Eigen::MatrixXd x(3, 2);
  x << 1, 0, -1, 0, 0, 0;
  CorrelationEstimator est;
  REQUIRE(est.fit(x, {"a", "b"}));

  CHECK(est.shrinkage() == Approx(1.0 / 3.0));
  const Eigen::MatrixXd cov = est.covariance();
  CHECK(cov(0, 0) == Approx(5.0 / 9.0));
  CHECK(cov(1, 1) == Approx(1.0 / 9.0));
  CHECK(cov(0, 1) == Approx(0.0).margin(1e-12));
}

TEST_CASE("Correlation matrix is a unit-diagonal symmetric matrix", "[correlation]") {
  std::mt19937_64 rng(11);
  std::normal_distribution<double> noise(0.0, 1.0);
  Eigen::MatrixXd x(20, 3);
  for (Eigen::Index r = 0; r < x.rows(); ++r) {
    const double common = noise(rng);
    x(r, 0) = common + 0.1 * noise(rng);
    x(r, 1) = common + 0.1 * noise(rng);
    x(r, 2) = noise(rng);
  }
  CorrelationEstimator est;
  REQUIRE(est.fit(x, {"a", "b", "c"}));

  const Eigen::MatrixXd corr = est.correlation();
  CHECK(est.shrinkage() >= 0.0);
  CHECK(est.shrinkage() <= 1.0);
  CHECK(corr.isApprox(corr.transpose()));
  for (Eigen::Index i = 0; i < corr.rows(); ++i)
    CHECK(corr(i, i) == Approx(1.0));
  CHECK(est.correlation("a", "b") > est.correlation("a", "c"));
  CHECK(est.correlation("a", "b") == Approx(corr(0, 1)));
}

TEST_CASE("Too few periods leave the estimator unfitted", "[correlation]") {
  Eigen::MatrixXd x(2, 2);
  x << 1, 2, 3, 4;
  CorrelationEstimator est;
  CHECK_FALSE(est.fit(x, {"a", "b"}));
  CHECK_FALSE(est.fitted());
  CHECK(est.shrinkage() == 1.0);
  CHECK(est.covariance().isApprox(Eigen::MatrixXd::Identity(2, 2)));
  CHECK(est.correlation("a", "b") == 0.0);
  CHECK(est.correlation("a", "unknown") == 0.0);
}

TEST_CASE("Malformed fits are rejected", "[correlation]") {
  CorrelationEstimator est;
  Eigen::MatrixXd x = Eigen::MatrixXd::Zero(4, 2);
  CHECK_THROWS_AS(est.fit(x, {"a"}), InvalidInput);
  CHECK_THROWS_AS(est.fit(x, {"a", "a"}), InvalidInput);
  x(1, 1) = std::numeric_limits<double>::quiet_NaN();
  CHECK_THROWS_AS(est.fit(x, {"a", "b"}), InvalidInput);
}
