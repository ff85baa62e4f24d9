#include "file_image.hpp"

#include "digest.hpp"
#include "frame_codec.hpp"
#include "pixel_codec.hpp"
#include "pixel_packer.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>

namespace filepix {

    static std::string lowerExtension(const std::string& path)
    {
        std::string ext = std::filesystem::path(path).extension().string();
        for (auto& ch : ext) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return ext;
    }

    // 先写到同目录的 ".<stem>.partial<ext>", 成功后再 rename 到目标.
    // 扩展名保留在最后, imwrite 靠它选编码器
    static std::string stagingPath(const std::string& path)
    {
        const std::filesystem::path p(path);
        const std::string name = "." + p.stem().string() + ".partial" + p.extension().string();
        return (p.parent_path() / name).string();
    }

    static void discardStaged(const std::string& stagedPath)
    {
        std::error_code ec;
        std::filesystem::remove(stagedPath, ec);
    }

    // 失败时目标保持原样 (原来没有就还是没有)
    static bool commitStaged(const std::string& stagedPath, const std::string& path)
    {
        std::error_code ec;
        std::filesystem::rename(stagedPath, path, ec);
        if (ec) {
            std::cerr << "[write] Cannot move output into place: " << path
                      << " (" << ec.message() << ")" << std::endl;
            discardStaged(stagedPath);
            return false;
        }
        return true;
    }

    static std::string fingerprint(const std::vector<uint8_t>& bytes)
    {
        std::string hex;
        if (!digest::sha256Hex(bytes, hex)) {
            return "n/a";
        }
        return hex;
    }

    bool isLosslessImagePath(const std::string& path)
    {
        static const char* const kLossless[] = {
            ".png", ".bmp", ".ppm", ".pnm", ".tif", ".tiff"
        };
        const std::string ext = lowerExtension(path);
        return std::any_of(std::begin(kLossless), std::end(kLossless),
                           [&ext](const char* e) { return ext == e; });
    }

    Status readFileBytes(const std::string& path, std::vector<uint8_t>& outBytes)
    {
        outBytes.clear();

        std::ifstream ifs(path, std::ios::binary);
        if (!ifs.good()) {
            std::cerr << "[read] Failed to open file: " << path << std::endl;
            return Status::SourceUnavailable;
        }

        ifs.seekg(0, std::ios::end);
        const std::streamsize n = ifs.tellg();
        ifs.seekg(0, std::ios::beg);
        if (n < 0) {
            std::cerr << "[read] Cannot determine size of: " << path << std::endl;
            return Status::SourceUnavailable;
        }

        std::vector<uint8_t> buf(static_cast<size_t>(n));
        if (n > 0) {
            ifs.read(reinterpret_cast<char*>(buf.data()), n);
            if (ifs.gcount() != n) {
                std::cerr << "[read] Short read on: " << path << std::endl;
                return Status::SourceUnavailable;
            }
        }

        outBytes = std::move(buf);
        return Status::Ok;
    }

    Status writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes)
    {
        const std::string staged = stagingPath(path);

        bool written = false;
        {
            std::ofstream ofs(staged, std::ios::binary | std::ios::trunc);
            if (!ofs.good()) {
                std::cerr << "[write] Failed to open for writing: " << path << std::endl;
                return Status::SinkUnavailable;
            }
            ofs.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
            ofs.close();
            written = !ofs.fail();
        }

        if (!written) {
            std::cerr << "[write] Write failed: " << path << std::endl;
            discardStaged(staged);
            return Status::SinkUnavailable;
        }
        if (!commitStaged(staged, path)) {
            return Status::SinkUnavailable;
        }
        return Status::Ok;
    }

    Status checkImageSize(uint64_t width, uint64_t height, const std::string& imagePath)
    {
        const uint64_t maxSide = (lowerExtension(imagePath) == ".png") ? kMaxPngSide : kMaxImageSide;

        if (width == 0 || height == 0 ||
            width > maxSide || height > maxSide ||
            width * height > kMaxImagePixels) {
            std::cerr << "[save] " << width << "x" << height << " exceeds the "
                      << maxSide << " px side limit for " << imagePath << std::endl;
            return Status::UnsupportedImage;
        }
        return Status::Ok;
    }

    Status loadGrid(const std::string& imagePath, PixelGrid& outGrid)
    {
        // UNCHANGED: 不让 OpenCV 偷偷转色彩空间或补通道
        cv::Mat img;
        try {
            img = cv::imread(imagePath, cv::IMREAD_UNCHANGED);
        } catch (const cv::Exception& e) {
            // imread 的尺寸上限检查是 CV_Assert, 会直接抛出
            std::cerr << "[load] OpenCV error: " << e.what() << std::endl;
            return Status::UnsupportedImage;
        }
        if (img.empty()) {
            std::cerr << "[load] Failed to load image: " << imagePath << std::endl;
            return Status::SourceUnavailable;
        }
        if (img.type() != CV_8UC3) {
            std::cerr << "[load] Expected 8-bit RGB image, got " << img.channels()
                      << " channel(s), depth " << img.depth() << ": " << imagePath << std::endl;
            return Status::UnsupportedImage;
        }

        PixelGrid grid;
        grid.width = static_cast<uint64_t>(img.cols);
        grid.height = static_cast<uint64_t>(img.rows);
        grid.rgb.resize(grid.capacity());

        for (int y = 0; y < img.rows; ++y) {
            for (int x = 0; x < img.cols; ++x) {
                const cv::Vec3b& bgr = img.at<cv::Vec3b>(y, x);
                uint8_t* px = grid.pixel(static_cast<uint64_t>(x), static_cast<uint64_t>(y));
                px[0] = bgr[2];
                px[1] = bgr[1];
                px[2] = bgr[0];
            }
        }

        outGrid = std::move(grid);
        return Status::Ok;
    }

    Status saveGrid(const PixelGrid& grid, const std::string& imagePath)
    {
        if (!isLosslessImagePath(imagePath)) {
            std::cerr << "[save] Refusing non-lossless output format: " << imagePath << std::endl;
            return Status::LossyFormat;
        }
        // 写出去的图必须能被 loadGrid 读回来
        Status st = checkImageSize(grid.width, grid.height, imagePath);
        if (st != Status::Ok) {
            return st;
        }
        if (grid.rgb.size() != grid.capacity()) {
            std::cerr << "[save] Grid buffer size mismatch\n";
            return Status::MalformedGrid;
        }

        const int rows = static_cast<int>(grid.height);
        const int cols = static_cast<int>(grid.width);
        cv::Mat img(rows, cols, CV_8UC3);

        // OpenCV 是 BGR 顺序
        for (int y = 0; y < rows; ++y) {
            for (int x = 0; x < cols; ++x) {
                const uint8_t* px = grid.pixel(static_cast<uint64_t>(x), static_cast<uint64_t>(y));
                img.at<cv::Vec3b>(y, x) = cv::Vec3b(px[2], px[1], px[0]);
            }
        }

        std::vector<int> params;
        if (lowerExtension(imagePath) == ".png") {
            params = { cv::IMWRITE_PNG_COMPRESSION, kPngCompressionLevel };
        }

        const std::string staged = stagingPath(imagePath);
        bool ok = false;
        try {
            ok = cv::imwrite(staged, img, params);
        } catch (const cv::Exception& e) {
            std::cerr << "[save] OpenCV error: " << e.what() << std::endl;
            ok = false;
        }

        if (!ok) {
            std::cerr << "[save] Failed to save image: " << imagePath << std::endl;
            discardStaged(staged);
            return Status::SinkUnavailable;
        }
        if (!commitStaged(staged, imagePath)) {
            return Status::SinkUnavailable;
        }
        return Status::Ok;
    }

    Status encodeBytesToImage(const std::vector<uint8_t>& payload,
                              const std::string& imagePath)
    {
        if (!isLosslessImagePath(imagePath)) {
            std::cerr << "[encode] Output must be a lossless image (png/bmp/ppm/tiff): "
                      << imagePath << std::endl;
            return Status::LossyFormat;
        }

        PixelGrid grid;
        Status st = encodeToGrid(payload, grid);
        if (st != Status::Ok) {
            std::cerr << "[encode] Packing failed: " << statusName(st) << std::endl;
            return st;
        }

        st = saveGrid(grid, imagePath);
        if (st != Status::Ok) {
            return st;
        }

        std::cout << "[encode] " << payload.size() << " bytes -> "
                  << grid.width << "x" << grid.height << " px, sha256 "
                  << fingerprint(payload) << std::endl;
        std::cout << "[encode] Done. Saved: " << imagePath << std::endl;
        return Status::Ok;
    }

    Status decodeImageToBytes(const std::string& imagePath,
                              std::vector<uint8_t>& outPayload)
    {
        outPayload.clear();

        PixelGrid grid;
        Status st = loadGrid(imagePath, grid);
        if (st != Status::Ok) {
            return st;
        }

        st = decodeFromGrid(grid, outPayload);
        if (st != Status::Ok) {
            std::cerr << "[decode] Invalid frame in " << imagePath << ": "
                      << statusName(st) << std::endl;
            return st;
        }
        return Status::Ok;
    }

    Status encodeFileToImage(const std::string& filePath,
                             const std::string& imagePath)
    {
        if (!isLosslessImagePath(imagePath)) {
            std::cerr << "[encode] Output must be a lossless image (png/bmp/ppm/tiff): "
                      << imagePath << std::endl;
            return Status::LossyFormat;
        }

        std::vector<uint8_t> payload;
        Status st = readFileBytes(filePath, payload);
        if (st != Status::Ok) {
            return st;
        }
        return encodeBytesToImage(payload, imagePath);
    }

    Status decodeImageToFile(const std::string& imagePath,
                             const std::string& filePath)
    {
        std::vector<uint8_t> payload;
        Status st = decodeImageToBytes(imagePath, payload);
        if (st != Status::Ok) {
            return st;
        }

        // 全部在内存里解完才写输出
        st = writeFileBytes(filePath, payload);
        if (st != Status::Ok) {
            return st;
        }

        std::cout << "[decode] " << payload.size() << " bytes, sha256 "
                  << fingerprint(payload) << std::endl;
        std::cout << "[decode] Done. Saved: " << filePath << std::endl;
        return Status::Ok;
    }

    Status inspectImage(const std::string& imagePath, ImageInfo& outInfo)
    {
        outInfo = ImageInfo{};

        PixelGrid grid;
        Status st = loadGrid(imagePath, grid);
        if (st != Status::Ok) {
            return st;
        }

        ImageInfo info;
        info.width = grid.width;
        info.height = grid.height;
        info.capacityBytes = grid.capacity();

        std::vector<uint8_t> bytes;
        st = unpack(grid, bytes);
        if (st != Status::Ok) {
            outInfo = info;
            return st;
        }
        st = readFrameLength(bytes.data(), bytes.size(), info.payloadBytes);
        if (st != Status::Ok) {
            outInfo = info;
            return st;
        }

        const uint64_t room = info.capacityBytes - kFrameHeaderBytes;
        if (info.payloadBytes > room) {
            outInfo = info;
            return Status::TruncatedPayload;
        }
        info.paddingBytes = room - info.payloadBytes;

        outInfo = info;
        return Status::Ok;
    }

}
