#ifndef PIXEL_CODEC_HPP
#define PIXEL_CODEC_HPP

#include "codec_types.hpp"

#include <cstdint>
#include <vector>

namespace filepix {

    // payload -> frame -> solveDimensions -> pack
    Status encodeToGrid(const std::vector<uint8_t>& payload, PixelGrid& outGrid);

    // unpack -> decodeFrame
    Status decodeFromGrid(const PixelGrid& grid, std::vector<uint8_t>& outPayload);

}

#endif // PIXEL_CODEC_HPP
