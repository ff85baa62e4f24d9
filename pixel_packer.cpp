#include "pixel_packer.hpp"

#include <iostream>
#include <utility>

namespace filepix {

    Status pack(const std::vector<uint8_t>& frame,
                const Dimensions& dims,
                PixelGrid& outGrid)
    {
        const uint64_t capacity = dims.area() * kChannels;
        if (static_cast<uint64_t>(frame.size()) > capacity) {
            std::cerr << "[pack] Frame of " << frame.size() << " bytes does not fit "
                      << dims.width << "x" << dims.height << " (" << capacity << " bytes)\n";
            return Status::CapacityExceeded;
        }

        PixelGrid grid;
        grid.width = dims.width;
        grid.height = dims.height;
        grid.rgb.assign(static_cast<size_t>(capacity), 0);

        // pixel (x, y) -> offset (y * width + x) * 3
        size_t offset = 0;
        for (uint64_t y = 0; y < grid.height && offset < frame.size(); ++y) {
            for (uint64_t x = 0; x < grid.width && offset < frame.size(); ++x) {
                uint8_t* px = grid.pixel(x, y);
                for (size_t c = 0; c < kChannels && offset < frame.size(); ++c) {
                    px[c] = frame[offset++];
                }
            }
        }

        outGrid = std::move(grid);
        return Status::Ok;
    }

    Status unpack(const PixelGrid& grid, std::vector<uint8_t>& outBytes)
    {
        outBytes.clear();
        if (grid.rgb.size() != grid.capacity()) {
            std::cerr << "[unpack] Grid " << grid.width << "x" << grid.height
                      << " carries " << grid.rgb.size() << " bytes, expected "
                      << grid.capacity() << "\n";
            return Status::MalformedGrid;
        }

        outBytes.assign(grid.rgb.begin(), grid.rgb.end());
        return Status::Ok;
    }

}
