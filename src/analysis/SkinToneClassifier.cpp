#include "skintone/analysis/SkinToneClassifier.hpp"
#include <algorithm>
#include <cstdlib>

namespace skintone {
namespace analysis {

bool SkinToneClassifier::isSkin(int r, int g, int b) const {
    const SkinThresholds& t = thresholds_;

    if (r <= t.min_red || g <= t.min_green || b <= t.min_blue) {
        return false;
    }
    // Overexposed highlights carry no skin color
    if (r >= t.max_channel || g >= t.max_channel || b >= t.max_channel) {
        return false;
    }
    if (r <= b - t.red_blue_tolerance) {
        return false;
    }
    if (std::abs(r - g) >= t.max_red_green_gap) {
        return false;
    }
    if (r <= g - t.red_green_tolerance) {
        return false;
    }
    if (t.min_channel_spread > 0) {
        const int spread = std::max({std::abs(r - g), std::abs(r - b), std::abs(g - b)});
        if (spread <= t.min_channel_spread) {
            return false;
        }
    }
    return true;
}

} // namespace analysis
} // namespace skintone
