#include "dc_blocker.hpp"

#include <algorithm>
#include <cmath>

namespace c64view {

DcBlocker::DcBlocker(uint16_t channels, double alpha)
    : channels_(channels == 0 ? 1 : channels)
    , alpha_(alpha)
    , prev_in_(channels_, 0.0)
    , prev_out_(channels_, 0.0) {}

void DcBlocker::process(int16_t* samples, size_t frames) {
    if (samples == nullptr) return;
    for (size_t i = 0; i < frames; i++) {
        for (uint16_t ch = 0; ch < channels_; ch++) {
            int16_t& s = samples[i * channels_ + ch];
            double x = s;
            double y = x - prev_in_[ch] + alpha_ * prev_out_[ch];
            prev_in_[ch] = x;
            prev_out_[ch] = y;
            s = static_cast<int16_t>(std::clamp(std::lround(y), -32768L, 32767L));
        }
    }
}

void DcBlocker::process(std::vector<int16_t>& samples) {
    process(samples.data(), samples.size() / channels_);
}

void DcBlocker::reset() {
    std::fill(prev_in_.begin(), prev_in_.end(), 0.0);
    std::fill(prev_out_.begin(), prev_out_.end(), 0.0);
}

} // namespace c64view
