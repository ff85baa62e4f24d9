#include "metrics.hpp"

#include "dimension_solver.hpp"

#include <bitset>

namespace metrics {

    // --- BER ---
    double computeByteErrorRate(const std::vector<uint8_t>& original,
                                const std::vector<uint8_t>& recovered)
    {
        if (original.size() != recovered.size()) {
            return 1.0; // 100% wrong
        }
        if (original.empty()) {
            return 0.0;
        }

        uint64_t bitErrors = 0;
        const uint64_t totalBits = static_cast<uint64_t>(original.size()) * 8;

        for (size_t i = 0; i < original.size(); i++) {
            const uint8_t diff = original[i] ^ recovered[i];
            bitErrors += std::bitset<8>(diff).count();
        }

        return static_cast<double>(bitErrors) / static_cast<double>(totalBits);
    }

    // --- packing ---
    PackingStats computePackingStats(uint64_t payloadBytes)
    {
        PackingStats s;
        s.payloadBytes = payloadBytes;
        s.frameBytes = filepix::kFrameHeaderBytes + payloadBytes;
        s.dims = filepix::solveDimensions(filepix::minPixelsForBytes(s.frameBytes));
        s.capacityBytes = s.dims.area() * filepix::kChannels;
        s.paddingBytes = s.capacityBytes - s.frameBytes;
        s.fillRatio = static_cast<double>(s.frameBytes) / static_cast<double>(s.capacityBytes);
        return s;
    }

}
