#include "test.hpp"
#include "scratch.hpp"
#include "fakes.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <thread>

#include "fv/core/io/ContainerCodec.hpp"
#include "fv/core/io/Converter.hpp"
#include "fv/core/types/Backend.hpp"
#include "fv/core/types/Exceptions.hpp"

using namespace fv;
namespace fs = std::filesystem;

namespace {

std::vector<char> readBytes(const fs::path& p)
{
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::size_t countFiles(const fs::path& dir)
{
    return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

FrameBlock readContainer(const fs::path& p)
{
    MappedBackend b(p, true);
    std::vector<std::size_t> all(b.shape().frames);
    for (std::size_t i = 0; i < all.size(); ++i) all[i] = i;
    return b.readFrames(all);
}

} // namespace

TEST(Converter, ChunkedOutputMatchesSingleShot)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{10, 10, 1, 8}, ElementType::Float64);

    io::ConvertOptions whole;
    whole.mode = BackendMode::MappedContainer;
    io::convertToContainer(data, dir / "whole.dat", whole);

    io::ConvertOptions chunked = whole;
    chunked.chunkBudgetMiB = 2000.0 / (1024.0 * 1024.0);  // under three frames
    fv_test::LogCapture log;
    io::convertToContainer(data, dir / "chunked.dat", chunked);

    EXPECT_TRUE(readBytes(dir / "whole.dat") == readBytes(dir / "chunked.dat"));
    EXPECT_EQ(fs::file_size(dir / "whole.dat"), io::kContainerHeaderBytes + 10u * 10u * 8u * 8u);
}

TEST(Converter, ModeIsInferredFromBudget)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{16, 16, 1, 4}, ElementType::UInt8);

    io::convertToContainer(data, dir / "small.dat");
    EXPECT_EQ(io::probeContainer(dir / "small.dat")->mode, BackendMode::InMemory);

    io::ConvertOptions tight;
    tight.chunkBudgetMiB = 512.0 / (1024.0 * 1024.0);
    io::convertToContainer(data, dir / "large.dat", tight);
    EXPECT_EQ(io::probeContainer(dir / "large.dat")->mode, BackendMode::MappedContainer);
    EXPECT_TRUE(readContainer(dir / "large.dat") == data);
}

TEST(Converter, BudgetOnlyChangesTheModeWord)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{12, 9, 2, 5}, ElementType::UInt16);

    io::ConvertOptions roomy;
    io::convertToContainer(data, dir / "roomy.dat", roomy);
    io::ConvertOptions tight;
    tight.chunkBudgetMiB = 600.0 / (1024.0 * 1024.0);
    io::convertToContainer(data, dir / "tight.dat", tight);

    auto a = readBytes(dir / "roomy.dat");
    auto b = readBytes(dir / "tight.dat");
    ASSERT_EQ(a.size(), b.size());
    // Word 5 holds the recorded backend mode
    const std::size_t modeBegin = 5 * sizeof(std::uint64_t);
    const std::size_t modeEnd = modeBegin + sizeof(std::uint64_t);
    std::size_t differing = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) {
            EXPECT_TRUE(i >= modeBegin && i < modeEnd);
            ++differing;
        }
    }
    EXPECT_EQ(differing, 1u);
    EXPECT_EQ(io::probeContainer(dir / "roomy.dat")->mode, BackendMode::InMemory);
    EXPECT_EQ(io::probeContainer(dir / "tight.dat")->mode, BackendMode::MappedContainer);

    // With the mode fixed the budget leaves no trace
    tight.mode = BackendMode::InMemory;
    io::convertToContainer(data, dir / "fixed.dat", tight);
    EXPECT_TRUE(readBytes(dir / "fixed.dat") == a);
}

TEST(Converter, DecoderModesCannotBeRecorded)
{
    fv_test::ScratchDir dir;
    io::ConvertOptions o;
    o.mode = BackendMode::StreamDecoder;
    EXPECT_THROW(io::convertToContainer(fv_test::patternBlock(Shape{2, 2, 1, 1}, ElementType::UInt8),
                                        dir / "x.dat", o),
                 InputError);
    EXPECT_FALSE(fs::exists(dir / "x.dat"));
}

TEST(Converter, UpToDateContainerIsLeftAlone)
{
    fv_test::ScratchDir dir;
    auto p = dir / "same.dat";
    io::convertToContainer(fv_test::patternBlock(Shape{4, 4, 2, 3}, ElementType::UInt16), p);
    const auto bytes = readBytes(p);
    const auto stamp = fs::last_write_time(p);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    fv_test::LogCapture log;
    EXPECT_EQ(io::convertToContainer(p), p);
    EXPECT_TRUE(fs::last_write_time(p) == stamp);
    EXPECT_TRUE(readBytes(p) == bytes);
}

TEST(Converter, InPlaceTransformRewritesContainer)
{
    fv_test::ScratchDir dir;
    auto p = dir / "crop.dat";
    auto data = fv_test::patternBlock(Shape{6, 6, 1, 4}, ElementType::UInt8);
    io::convertToContainer(data, p);

    io::ConvertOptions o;
    o.transform = makeCropTransform(cv::Rect(1, 2, 3, 2), 0, 1);
    EXPECT_EQ(io::convertToContainer(p, o), p);

    auto out = readContainer(p);
    EXPECT_EQ(out.shape(), (Shape{2, 3, 1, 4}));
    EXPECT_EQ(out.value(0, 0, 0, 3), data.value(2, 1, 0, 3));
    EXPECT_EQ(countFiles(dir.path()), 1u);
}

TEST(Converter, FailedInPlaceRewriteRestoresOriginal)
{
    fv_test::ScratchDir dir;
    auto p = dir / "keep.dat";
    auto data = fv_test::patternBlock(Shape{8, 8, 1, 6}, ElementType::UInt8);
    io::ConvertOptions first;
    first.mode = BackendMode::MappedContainer;
    io::convertToContainer(data, p, first);
    const auto bytes = readBytes(p);

    // Probe frame and first chunk succeed, the second chunk fails
    auto calls = std::make_shared<int>(0);
    io::ConvertOptions o;
    o.mode = BackendMode::MappedContainer;
    o.chunkBudgetMiB = 128.0 / (1024.0 * 1024.0);  // two frames per chunk
    o.transform = std::make_shared<FunctionTransform>([calls](const cv::Mat& m) {
        if (++*calls > 3) throw InputError("transform gave up");
        return m.clone();
    });
    EXPECT_THROW(io::convertToContainer(p, o), InputError);
    EXPECT_TRUE(readBytes(p) == bytes);
    EXPECT_EQ(countFiles(dir.path()), 1u);
}

TEST(Converter, NonContainerDestinationIsRefused)
{
    fv_test::ScratchDir dir;
    auto p = dir / "notes.dat";
    {
        std::ofstream out(p);
        out << "not a container";
    }
    EXPECT_THROW(io::convertToContainer(fv_test::patternBlock(Shape{2, 2, 1, 1}, ElementType::UInt8), p),
                 FormatError);
    EXPECT_EQ(fs::file_size(p), 15u);
}

TEST(Converter, FrameSubsetDropsMissingFrames)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{3, 3, 1, 5}, ElementType::Float32);
    io::ConvertOptions o;
    o.frames = std::vector<std::size_t>{1, 3, 9};
    fv_test::LogCapture log;
    io::convertToContainer(data, dir / "sub.dat", o);
    EXPECT_EQ(log.count(), 1u);

    auto out = readContainer(dir / "sub.dat");
    EXPECT_EQ(out.shape().frames, 2u);
    EXPECT_EQ(out.value(2, 2, 0, 1), data.value(2, 2, 0, 3));
}

TEST(Converter, FramesMustIncrease)
{
    fv_test::ScratchDir dir;
    io::ConvertOptions o;
    o.frames = std::vector<std::size_t>{2, 1};
    EXPECT_THROW(io::convertToContainer(fv_test::patternBlock(Shape{2, 2, 1, 3}, ElementType::UInt8),
                                        dir / "bad.dat", o),
                 InputError);
}

TEST(Converter, NoFramesLeftSkipsConversion)
{
    fv_test::ScratchDir dir;
    io::ConvertOptions o;
    o.frames = std::vector<std::size_t>{7, 8};
    fv_test::LogCapture log;
    auto out = io::convertToContainer(fv_test::patternBlock(Shape{2, 2, 1, 3}, ElementType::UInt8),
                                      dir / "none.dat", o);
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(fs::exists(dir / "none.dat"));
}

TEST(Converter, VideoSourceNextToItsContainer)
{
    fv_test::ScratchDir dir;
    {
        std::ofstream out(dir / "clip.avi");
        out << "x";
    }
    auto stats = std::make_shared<fv_test::DecoderStats>();
    io::ConvertOptions o;
    o.videoFactory = fv_test::scriptedVideoFactory(4, 6, 1, 12, 24.0, stats);
    auto p = io::convertToContainer(dir / "clip", o);
    EXPECT_EQ(p, dir / "clip.dat");

    auto out = readContainer(p);
    EXPECT_EQ(out.shape(), (Shape{4, 6, 1, 12}));
    EXPECT_EQ(out.value(3, 5, 0, 11), fv_test::videoValue(3, 5, 11));
    // Sequential chunks never seek backwards
    EXPECT_EQ(stats->seeks, 2u);
}
