#ifndef METRICS_HPP
#define METRICS_HPP

#include "codec_types.hpp"

#include <cstdint>
#include <vector>

namespace metrics {

    // BER for recovered vs original bytes
    double computeByteErrorRate(const std::vector<uint8_t>& original,
                                const std::vector<uint8_t>& recovered);

    struct PackingStats {
        uint64_t payloadBytes = 0;
        uint64_t frameBytes = 0;
        filepix::Dimensions dims;
        uint64_t capacityBytes = 0;
        uint64_t paddingBytes = 0;
        double fillRatio = 0.0;   // frameBytes / capacityBytes
    };

    // 不实际打包, 只算尺寸和浪费
    PackingStats computePackingStats(uint64_t payloadBytes);
}

#endif
