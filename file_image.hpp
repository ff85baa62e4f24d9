#ifndef FILE_IMAGE_HPP
#define FILE_IMAGE_HPP

#include "codec_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

// 文件 <-> 图片, 图片读写交给 OpenCV (PNG/BMP/PPM/TIFF, 只允许无损格式)
namespace filepix {

    constexpr int kPngCompressionLevel = 9;

    // OpenCV imread 默认上限 (CV_IO_MAX_IMAGE_WIDTH/HEIGHT/PIXELS)
    constexpr uint64_t kMaxImageSide = uint64_t(1) << 20;
    constexpr uint64_t kMaxImagePixels = uint64_t(1) << 30;
    // libpng 默认 user limit, 每边 1,000,000 px
    constexpr uint64_t kMaxPngSide = 1000000;

    struct ImageInfo {
        uint64_t width = 0;
        uint64_t height = 0;
        uint64_t capacityBytes = 0;   // width * height * 3
        uint64_t payloadBytes = 0;    // header 里声明的长度
        uint64_t paddingBytes = 0;    // capacity - 8 - payload
    };

    // .png .bmp .ppm .pnm .tif .tiff (不分大小写)
    bool isLosslessImagePath(const std::string& path);

    // 任意文件 -> 图片
    Status encodeFileToImage(const std::string& filePath,
                             const std::string& imagePath);

    // 图片 -> 原文件
    Status decodeImageToFile(const std::string& imagePath,
                             const std::string& filePath);

    Status encodeBytesToImage(const std::vector<uint8_t>& payload,
                              const std::string& imagePath);

    Status decodeImageToBytes(const std::string& imagePath,
                              std::vector<uint8_t>& outPayload);

    // 只读 header, 不写任何输出
    Status inspectImage(const std::string& imagePath, ImageInfo& outInfo);

    // 超出上面的上限返回 UnsupportedImage; 按 imagePath 的扩展名选上限
    Status checkImageSize(uint64_t width, uint64_t height, const std::string& imagePath);

    Status loadGrid(const std::string& imagePath, PixelGrid& outGrid);
    Status saveGrid(const PixelGrid& grid, const std::string& imagePath);

    Status readFileBytes(const std::string& path, std::vector<uint8_t>& outBytes);
    Status writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes);

}

#endif // FILE_IMAGE_HPP
