#include "pixel_codec.hpp"

#include "dimension_solver.hpp"
#include "frame_codec.hpp"
#include "pixel_packer.hpp"

namespace filepix {

    Status encodeToGrid(const std::vector<uint8_t>& payload, PixelGrid& outGrid)
    {
        std::vector<uint8_t> frame = encodeFrame(payload);
        Dimensions dims = solveDimensions(minPixelsForBytes(frame.size()));
        return pack(frame, dims, outGrid);
    }

    Status decodeFromGrid(const PixelGrid& grid, std::vector<uint8_t>& outPayload)
    {
        outPayload.clear();

        std::vector<uint8_t> bytes;
        Status st = unpack(grid, bytes);
        if (st != Status::Ok) {
            return st;
        }
        return decodeFrame(bytes, outPayload);
    }

}
