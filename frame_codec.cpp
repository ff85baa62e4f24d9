#include "frame_codec.hpp"

namespace filepix {

    std::vector<uint8_t> encodeFrame(const std::vector<uint8_t>& payload)
    {
        const uint64_t len = static_cast<uint64_t>(payload.size());

        std::vector<uint8_t> frame;
        frame.reserve(kFrameHeaderBytes + payload.size());

        // Length header (64-bit, big-endian)
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<uint8_t>((len >> (i * 8)) & 0xFF));
        }
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }

    Status readFrameLength(const uint8_t* data, size_t size, uint64_t& outLength)
    {
        outLength = 0;
        if (data == nullptr || size < kFrameHeaderBytes) {
            return Status::TruncatedHeader;
        }

        uint64_t len = 0;
        for (size_t i = 0; i < kFrameHeaderBytes; ++i) {
            len = (len << 8) | data[i];
        }
        outLength = len;
        return Status::Ok;
    }

    Status decodeFrame(const uint8_t* data, size_t size, std::vector<uint8_t>& outPayload)
    {
        outPayload.clear();

        uint64_t len = 0;
        Status st = readFrameLength(data, size, len);
        if (st != Status::Ok) {
            return st;
        }

        // size >= 8 here
        const uint64_t available = static_cast<uint64_t>(size - kFrameHeaderBytes);
        if (len > available) {
            return Status::TruncatedPayload;
        }

        const uint8_t* begin = data + kFrameHeaderBytes;
        outPayload.assign(begin, begin + static_cast<size_t>(len));
        return Status::Ok;
    }

    Status decodeFrame(const std::vector<uint8_t>& bytes, std::vector<uint8_t>& outPayload)
    {
        return decodeFrame(bytes.data(), bytes.size(), outPayload);
    }

}
