#ifndef DIMENSION_SOLVER_HPP
#define DIMENSION_SOLVER_HPP

#include "codec_types.hpp"

#include <cstdint>

namespace filepix {

    // 最小面积的矩形, width * height == minPixels (0 -> 1x1).
    // width 是 <= floor(sqrt(n)) 的最大因子, 所以 width <= height
    Dimensions solveDimensions(uint64_t minPixels);

    // ceil(byteCount / 3)
    uint64_t minPixelsForBytes(uint64_t byteCount);

    // floor(sqrt(n)), exact for every 64-bit n
    uint64_t integerSqrt(uint64_t n);

}

#endif // DIMENSION_SOLVER_HPP
