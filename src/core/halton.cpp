#include "knowmap/halton.hpp"

#include <algorithm>
#include <numeric>

namespace knowmap {

namespace {

// Digits needed to exhaust double precision: ceil(53 / log2(base))
unsigned digits_for_base(unsigned base) {
    unsigned digits = 0;
    double scale = 1.0;
    while (scale > 0x1p-53) {
        scale /= base;
        ++digits;
    }
    return digits;
}

double inset(double v, double margin) {
    return v * (1.0 - 2.0 * margin) + margin;
}

class DigitScrambler {
public:
    DigitScrambler(unsigned base, Rng& rng) : base_(base), digits_(digits_for_base(base)) {
        perms_.resize(digits_);
        for (auto& perm : perms_) {
            perm.resize(base);
            std::iota(perm.begin(), perm.end(), 0u);
            // Fisher-Yates with the explicit stream
            for (unsigned i = base - 1; i > 0; --i) {
                unsigned j = static_cast<unsigned>(rng.index(i + 1));
                std::swap(perm[i], perm[j]);
            }
        }
    }

    double operator()(uint64_t index) const {
        double value = 0.0;
        double f = 1.0 / base_;
        for (unsigned d = 0; d < digits_; ++d) {
            unsigned digit = static_cast<unsigned>(index % base_);
            index /= base_;
            value += f * perms_[d][digit];
            f /= base_;
        }
        // Guard against rounding up to exactly 1.0
        return std::min(value, 1.0 - 0x1p-53);
    }

private:
    unsigned base_;
    unsigned digits_;
    std::vector<std::vector<unsigned>> perms_;
};

} // namespace

double radical_inverse(uint64_t index, unsigned base) {
    double result = 0.0;
    double f = 1.0;
    while (index > 0) {
        f /= base;
        result += f * static_cast<double>(index % base);
        index /= base;
    }
    return result;
}

PointSet halton_points(size_t n, double margin) {
    PointSet out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        // 1-indexed so the first point is not the corner (0, 0)
        out.emplace_back(inset(radical_inverse(i + 1, 2), margin),
                         inset(radical_inverse(i + 1, 3), margin));
    }
    return out;
}

PointSet scrambled_halton_points(size_t n, double margin, Rng& rng) {
    DigitScrambler sx(2, rng);
    DigitScrambler sy(3, rng);

    PointSet out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.emplace_back(inset(sx(i), margin), inset(sy(i), margin));
    }
    return out;
}

} // namespace knowmap
