#include "agreement.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <string>

namespace acti {

AgreementMetric cohensKappa(const std::vector<int>& rater1, const std::vector<int>& rater2) {
    if (rater1.size() != rater2.size()) {
        throw std::invalid_argument("Rater arrays differ in length (" + std::to_string(rater1.size()) + " vs " +
                                    std::to_string(rater2.size()) + ")");
    }
    if (rater1.empty()) {
        throw InsufficientDataError("Cannot compute agreement on empty arrays");
    }

    double bothSleep = 0.0;
    double bothWake = 0.0;
    double sleepWake = 0.0;  // rater1 sleep, rater2 wake
    double wakeSleep = 0.0;
    for (std::size_t i = 0; i < rater1.size(); ++i) {
        bool a = rater1[i] != 0;
        bool b = rater2[i] != 0;
        if (a && b) {
            bothSleep += 1.0;
        } else if (!a && !b) {
            bothWake += 1.0;
        } else if (a) {
            sleepWake += 1.0;
        } else {
            wakeSleep += 1.0;
        }
    }

    const double n = static_cast<double>(rater1.size());
    const double observed = (bothSleep + bothWake) / n;
    const double r1Sleep = (bothSleep + sleepWake) / n;
    const double r2Sleep = (bothSleep + wakeSleep) / n;
    const double expected = r1Sleep * r2Sleep + (1.0 - r1Sleep) * (1.0 - r2Sleep);

    AgreementMetric out;
    out.name = "cohens_kappa";
    out.observedAgreement = observed;
    out.expectedAgreement = expected;
    if (expected == 1.0) {
        out.value = 1.0;
    } else {
        out.value = (observed - expected) / (1.0 - expected);
    }

    const double refSleep = bothSleep + sleepWake;
    const double refWake = bothWake + wakeSleep;
    out.statistics["observed"] = observed;
    out.statistics["expected"] = expected;
    out.statistics["n"] = n;
    out.statistics["both_sleep"] = bothSleep;
    out.statistics["both_wake"] = bothWake;
    out.statistics["disagreements"] = sleepWake + wakeSleep;
    out.statistics["sensitivity"] = refSleep > 0.0 ? bothSleep / refSleep : quietNaN();
    out.statistics["specificity"] = refWake > 0.0 ? bothWake / refWake : quietNaN();
    return out;
}

}  // namespace acti
