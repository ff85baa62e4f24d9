#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include "codec_types.hpp"

#include <cstdint>
#include <vector>

namespace filepix {

    // [len: u64 big-endian][payload]
    std::vector<uint8_t> encodeFrame(const std::vector<uint8_t>& payload);

    // 只读头 8 字节, 不拷贝 payload
    Status readFrameLength(const uint8_t* data, size_t size, uint64_t& outLength);

    // 返回 [8, 8+L), 之后的 padding 不看
    Status decodeFrame(const uint8_t* data, size_t size, std::vector<uint8_t>& outPayload);
    Status decodeFrame(const std::vector<uint8_t>& bytes, std::vector<uint8_t>& outPayload);

}

#endif // FRAME_CODEC_HPP
