// ZEUS - Dual-Rate EWMA
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Fast and slow exponentially weighted moving averages of one signal,
// updated together. Their divergence is the trend signal used by the
// difficulty controller, the consistency bonus and the weight aggregator.

#ifndef ZEUS_VALIDATOR_EWMA_H
#define ZEUS_VALIDATOR_EWMA_H

#include <algorithm>
#include <cmath>

namespace zeus {
namespace validator {

/// Single EWMA step; the first sample seeds the average
inline double EwmaStep(double current, double sample, double alpha, bool seeded) {
    return seeded ? current + alpha * (sample - current) : sample;
}

class DualRateEwma {
public:
    DualRateEwma() = default;
    DualRateEwma(double fast, double slow, bool seeded)
        : fast_(fast), slow_(slow), seeded_(seeded) {}
    
    /// Fold one sample into both trackers
    void Update(double sample, double alphaHigh, double alphaLow) {
        fast_ = EwmaStep(fast_, sample, alphaHigh, seeded_);
        slow_ = EwmaStep(slow_, sample, alphaLow, seeded_);
        seeded_ = true;
    }
    
    double Fast() const { return fast_; }
    double Slow() const { return slow_; }
    bool IsSeeded() const { return seeded_; }
    
    double Divergence() const { return std::fabs(fast_ - slow_); }
    
    /// 1 - |fast - slow| / max(|fast|, |slow|); 1 when both are zero
    double Agreement() const {
        double scale = std::max(std::fabs(fast_), std::fabs(slow_));
        if (scale <= 0.0) return 1.0;
        return 1.0 - Divergence() / scale;
    }
    
    void Reset() {
        fast_ = slow_ = 0.0;
        seeded_ = false;
    }

private:
    double fast_{0.0};
    double slow_{0.0};
    bool seeded_{false};
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_EWMA_H
