#include "agreement.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

// ============================================================================
// Cohen's kappa
// ============================================================================

TEST(Agreement, IdenticalRatersAgreeFully) {
    std::vector<int> r{1, 0, 1, 1, 0, 0, 1};
    acti::AgreementMetric k = acti::cohensKappa(r, r);
    EXPECT_DOUBLE_EQ(k.value, 1.0);
    EXPECT_DOUBLE_EQ(k.observedAgreement, 1.0);
    EXPECT_DOUBLE_EQ(k.statistics.at("sensitivity"), 1.0);
    EXPECT_DOUBLE_EQ(k.statistics.at("disagreements"), 0.0);
    EXPECT_EQ(k.name, "cohens_kappa");
}

TEST(Agreement, PartialAgreement) {
    acti::AgreementMetric k = acti::cohensKappa({1, 1, 0, 0}, {1, 0, 0, 0});
    EXPECT_DOUBLE_EQ(k.observedAgreement, 0.75);
    EXPECT_DOUBLE_EQ(k.expectedAgreement, 0.5);
    EXPECT_DOUBLE_EQ(k.value, 0.5);
    EXPECT_DOUBLE_EQ(k.statistics.at("sensitivity"), 0.5);
    EXPECT_DOUBLE_EQ(k.statistics.at("specificity"), 1.0);
}

TEST(Agreement, SingleClassIsFullAgreement) {
    acti::AgreementMetric k = acti::cohensKappa({1, 1, 1}, {1, 1, 1});
    EXPECT_DOUBLE_EQ(k.value, 1.0);
    EXPECT_TRUE(std::isnan(k.statistics.at("specificity")));
}

TEST(Agreement, OppositeRatersAreNegative) {
    acti::AgreementMetric k = acti::cohensKappa({1, 0, 1, 0}, {0, 1, 0, 1});
    EXPECT_DOUBLE_EQ(k.value, -1.0);
}

TEST(Agreement, InvalidInput) {
    EXPECT_THROW(acti::cohensKappa({1, 0}, {1}), std::invalid_argument);
    EXPECT_THROW(acti::cohensKappa({}, {}), acti::InsufficientDataError);
}
