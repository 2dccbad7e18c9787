// =============================================================================
// c64view - DC Blocking Filter
// =============================================================================
// First-order high-pass per channel: y[n] = x[n] - x[n-1] + alpha * y[n-1]
// Removes the constant offset the SID output carries. State persists across
// calls so chunk boundaries are seamless.
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace c64view {

class DcBlocker {
public:
    static constexpr double DEFAULT_ALPHA = 0.995;

    explicit DcBlocker(uint16_t channels = 2, double alpha = DEFAULT_ALPHA);

    // Filters interleaved samples in place; output clipped to int16.
    void process(int16_t* samples, size_t frames);
    void process(std::vector<int16_t>& samples);

    void reset();

    uint16_t channels() const { return channels_; }
    double alpha() const { return alpha_; }

private:
    uint16_t channels_;
    double alpha_;
    std::vector<double> prev_in_;
    std::vector<double> prev_out_;
};

} // namespace c64view
