#ifndef PIXEL_PACKER_HPP
#define PIXEL_PACKER_HPP

#include "codec_types.hpp"

#include <cstdint>
#include <vector>

namespace filepix {

    // frame -> width x height 的 RGB grid, 剩余部分补 0.
    // frame 比 width*height*3 大时返回 CapacityExceeded, outGrid 不动
    Status pack(const std::vector<uint8_t>& frame,
                const Dimensions& dims,
                PixelGrid& outGrid);

    // grid -> width*height*3 字节, 和 pack 同样的 row-major 顺序.
    // 不知道数据在哪结束, 交给 decodeFrame.
    // rgb 长度和 width*height*3 不一致时返回 MalformedGrid, outBytes 为空
    Status unpack(const PixelGrid& grid, std::vector<uint8_t>& outBytes);

}

#endif // PIXEL_PACKER_HPP
