#include "dimension_solver.hpp"
#include "frame_codec.hpp"
#include "pixel_codec.hpp"
#include "pixel_packer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <vector>

using filepix::Dimensions;
using filepix::PixelGrid;
using filepix::Status;

namespace {

std::vector<uint8_t> randomBytes(size_t n, uint32_t seed)
{
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<uint8_t> out(n);
    for (auto& b : out) b = static_cast<uint8_t>(dist(rng));
    return out;
}

std::vector<uint8_t> roundTrip(const std::vector<uint8_t>& payload)
{
    PixelGrid grid;
    EXPECT_EQ(filepix::encodeToGrid(payload, grid), Status::Ok);
    std::vector<uint8_t> out;
    EXPECT_EQ(filepix::decodeFromGrid(grid, out), Status::Ok);
    return out;
}

} // namespace

TEST(PixelPacker, PackIsRowMajorRgb)
{
    std::vector<uint8_t> frame = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13 };
    Dimensions dims;
    dims.width = 3;
    dims.height = 2;

    PixelGrid grid;
    ASSERT_EQ(filepix::pack(frame, dims, grid), Status::Ok);
    ASSERT_EQ(grid.rgb.size(), 18u);

    // (x=1, y=0) -> offset 3
    EXPECT_EQ(grid.pixel(1, 0)[0], 4);
    EXPECT_EQ(grid.pixel(1, 0)[2], 6);
    // (x=0, y=1) -> offset 9
    EXPECT_EQ(grid.pixel(0, 1)[0], 10);
    EXPECT_EQ(grid.pixel(1, 1)[0], 13);
    EXPECT_EQ(grid.pixel(1, 1)[1], 0);
    EXPECT_EQ(grid.pixel(2, 1)[2], 0);
}

TEST(PixelPacker, UnpackIsInverseOfPack)
{
    std::vector<uint8_t> frame = randomBytes(40, 7);
    Dimensions dims;
    dims.width = 4;
    dims.height = 4;

    PixelGrid grid;
    ASSERT_EQ(filepix::pack(frame, dims, grid), Status::Ok);
    std::vector<uint8_t> flat;
    ASSERT_EQ(filepix::unpack(grid, flat), Status::Ok);

    ASSERT_EQ(flat.size(), 48u);
    EXPECT_TRUE(std::equal(frame.begin(), frame.end(), flat.begin()));
    for (size_t i = frame.size(); i < flat.size(); ++i) {
        EXPECT_EQ(flat[i], 0) << "pad byte " << i;
    }
}

TEST(PixelPacker, FrameLargerThanGridIsCapacityExceeded)
{
    std::vector<uint8_t> frame(13, 0xAB);
    Dimensions dims;
    dims.width = 2;
    dims.height = 2;

    PixelGrid grid;
    grid.width = 99;
    EXPECT_EQ(filepix::pack(frame, dims, grid), Status::CapacityExceeded);
    EXPECT_EQ(grid.width, 99u);
}

TEST(PixelPacker, ExactFitHasNoPadding)
{
    std::vector<uint8_t> frame(12, 0xFF);
    Dimensions dims;
    dims.width = 2;
    dims.height = 2;

    PixelGrid grid;
    ASSERT_EQ(filepix::pack(frame, dims, grid), Status::Ok);
    std::vector<uint8_t> flat;
    ASSERT_EQ(filepix::unpack(grid, flat), Status::Ok);
    EXPECT_EQ(flat, frame);
}

TEST(PixelPacker, ShortBufferIsMalformedGrid)
{
    PixelGrid grid;
    grid.width = 2;
    grid.height = 2;
    grid.rgb = { 0, 0, 0, 0, 0, 0, 0, 1, 'z' };   // 9 of 12 bytes

    std::vector<uint8_t> flat = { 7 };
    EXPECT_EQ(filepix::unpack(grid, flat), Status::MalformedGrid);
    EXPECT_TRUE(flat.empty());

    std::vector<uint8_t> out;
    EXPECT_EQ(filepix::decodeFromGrid(grid, out), Status::MalformedGrid);

    grid.rgb.resize(15, 0);
    EXPECT_EQ(filepix::unpack(grid, flat), Status::MalformedGrid);
}

TEST(PixelCodec, TwoBytePayloadUsesTwoByTwoGrid)
{
    std::vector<uint8_t> payload = { 'A', 'B' };

    PixelGrid grid;
    ASSERT_EQ(filepix::encodeToGrid(payload, grid), Status::Ok);
    EXPECT_EQ(grid.width, 2u);
    EXPECT_EQ(grid.height, 2u);

    std::vector<uint8_t> expected = { 0, 0, 0, 0, 0, 0, 0, 2, 'A', 'B', 0, 0 };
    EXPECT_EQ(grid.rgb, expected);

    std::vector<uint8_t> out;
    ASSERT_EQ(filepix::decodeFromGrid(grid, out), Status::Ok);
    EXPECT_EQ(out, payload);
}

TEST(PixelCodec, EmptyPayloadRoundTrips)
{
    PixelGrid grid;
    ASSERT_EQ(filepix::encodeToGrid({}, grid), Status::Ok);
    EXPECT_EQ(grid.width, 1u);
    EXPECT_EQ(grid.height, 3u);
    EXPECT_TRUE(roundTrip({}).empty());
}

TEST(PixelCodec, SmallLengthsRoundTrip)
{
    for (size_t n : { 1u, 2u, 3u, 4u, 1000u }) {
        std::vector<uint8_t> p = randomBytes(n, static_cast<uint32_t>(n));
        EXPECT_EQ(roundTrip(p), p) << "n=" << n;
        EXPECT_EQ(roundTrip(std::vector<uint8_t>(n, 0x00)), std::vector<uint8_t>(n, 0x00)) << "n=" << n;
        EXPECT_EQ(roundTrip(std::vector<uint8_t>(n, 0xFF)), std::vector<uint8_t>(n, 0xFF)) << "n=" << n;
    }
}

TEST(PixelCodec, OneMegabyteRoundTrips)
{
    std::vector<uint8_t> p = randomBytes(1000000, 42);
    EXPECT_EQ(roundTrip(p), p);
}

TEST(PixelCodec, TrailingZeroBytesSurvive)
{
    std::vector<uint8_t> p = { 'd', 'a', 't', 'a', 0, 0, 0 };
    EXPECT_EQ(roundTrip(p), p);

    std::vector<uint8_t> single = { 0 };
    EXPECT_EQ(roundTrip(single), single);
}

TEST(PixelCodec, GridTooSmallForHeaderIsTruncatedHeader)
{
    PixelGrid grid;
    grid.width = 1;
    grid.height = 2;
    grid.rgb.assign(6, 0);

    std::vector<uint8_t> out;
    EXPECT_EQ(filepix::decodeFromGrid(grid, out), Status::TruncatedHeader);
}

TEST(PixelCodec, ForeignGridIsTruncatedPayload)
{
    // declares 100 bytes in a 4-pixel grid
    PixelGrid grid;
    grid.width = 2;
    grid.height = 2;
    grid.rgb = { 0, 0, 0, 0, 0, 0, 0, 100, 1, 2, 3, 4 };

    std::vector<uint8_t> out;
    EXPECT_EQ(filepix::decodeFromGrid(grid, out), Status::TruncatedPayload);
}
