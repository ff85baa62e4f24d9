#ifndef CODEC_TYPES_HPP
#define CODEC_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <vector>

namespace filepix {

    // 帧头: 8 字节大端 payload 长度
    constexpr size_t kFrameHeaderBytes = 8;
    constexpr size_t kChannels = 3; // R, G, B

    enum class Status {
        Ok,
        SourceUnavailable,  // 输入文件/图片打不开
        TruncatedHeader,    // 不足 8 字节
        TruncatedPayload,   // 声明长度超过可用数据
        CapacityExceeded,   // 尺寸装不下 frame (solver/packer 用错了)
        MalformedGrid,      // rgb 长度 != width * height * 3
        UnsupportedImage,   // 不是 8-bit 3 通道, 或尺寸超出图片后端上限
        SinkUnavailable,    // 输出写不了
        LossyFormat         // 输出扩展名不是无损格式
    };

    const char* statusName(Status s);

    struct Dimensions {
        uint64_t width = 1;
        uint64_t height = 1;

        uint64_t area() const { return width * height; }
    };

    // width * height 个 RGB 三元组, row-major
    struct PixelGrid {
        uint64_t width = 0;
        uint64_t height = 0;
        std::vector<uint8_t> rgb;

        size_t capacity() const { return static_cast<size_t>(width * height * kChannels); }

        uint8_t* pixel(uint64_t x, uint64_t y) {
            return rgb.data() + (y * width + x) * kChannels;
        }
        const uint8_t* pixel(uint64_t x, uint64_t y) const {
            return rgb.data() + (y * width + x) * kChannels;
        }
    };

}

#endif // CODEC_TYPES_HPP
