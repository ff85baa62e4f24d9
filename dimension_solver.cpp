#include "dimension_solver.hpp"

#include <cmath>

namespace filepix {

    uint64_t integerSqrt(uint64_t n)
    {
        if (n < 2) return n;

        // double 估计值在大数时可能差 1, 用整数修正
        uint64_t r = static_cast<uint64_t>(std::sqrt(static_cast<double>(n)));
        while (r > n / r) {
            --r;
        }
        while (r + 1 <= n / (r + 1)) {
            ++r;
        }
        return r;
    }

    uint64_t minPixelsForBytes(uint64_t byteCount)
    {
        return byteCount / kChannels + (byteCount % kChannels != 0 ? 1 : 0);
    }

    Dimensions solveDimensions(uint64_t minPixels)
    {
        Dimensions dims;
        if (minPixels == 0) {
            return dims;
        }

        // w = 1 always divides, so the first n tested is always feasible
        for (uint64_t w = integerSqrt(minPixels); w >= 1; --w) {
            if (minPixels % w == 0) {
                dims.width = w;
                dims.height = minPixels / w;
                break;
            }
        }
        return dims;
    }

}
