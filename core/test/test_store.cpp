#include "test.hpp"
#include "scratch.hpp"
#include "fakes.hpp"

#include <cstring>
#include <fstream>
#include <initializer_list>
#include <iterator>

#include <nlohmann/json.hpp>

#include "fv/core/io/ContainerCodec.hpp"
#include "fv/core/io/Converter.hpp"
#include "fv/core/types/Exceptions.hpp"
#include "fv/core/types/Store.hpp"

using namespace fv;
namespace fs = std::filesystem;

namespace {

void touch(const fs::path& p)
{
    std::ofstream out(p, std::ios::binary);
    out << "x";
}

std::vector<char> readBytes(const fs::path& p)
{
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void writeContainer(const fs::path& p, const FrameBlock& data, BackendMode mode)
{
    io::ConvertOptions o;
    o.mode = mode;
    io::convertToContainer(data, p, o);
}

// Header words as given, zero padded to a full header
void writeHeaderWords(const fs::path& p, std::initializer_list<std::uint64_t> words)
{
    std::ofstream out(p, std::ios::binary);
    for (auto w : words) {
        out.write(reinterpret_cast<const char*>(&w), sizeof(w));
    }
    std::vector<char> pad(io::kContainerHeaderBytes - words.size() * sizeof(std::uint64_t), 0);
    out.write(pad.data(), static_cast<std::streamsize>(pad.size()));
}

FrameBlock frameOf(const FrameBlock& data, std::size_t f)
{
    const auto& s = data.shape();
    FrameBlock out(Shape{s.rows, s.cols, s.slices, 1}, data.elementType());
    std::memcpy(out.data(), data.frameData(f), out.frameBytes());
    return out;
}

} // namespace

// --- indexing ----------------------------------------------------------------

TEST(Store, SingleFrameOfAContainer)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{10, 10, 1, 5}, ElementType::UInt8);
    writeContainer(dir / "a.dat", data, BackendMode::InMemory);
    touch(dir / "a.avi");

    fv_test::LogCapture log;
    Store s(dir / "a");
    EXPECT_TRUE(log.contains("a.avi"));
    EXPECT_EQ(s.backendMode(), BackendMode::InMemory);

    auto frame = s.get(Index::all(), Index::all(), 0, 3);
    EXPECT_EQ(frame.shape(), (Shape{10, 10, 1, 1}));
    EXPECT_TRUE(frame == frameOf(data, 3));
}

TEST(Store, FrameIndexedValuesThroughAMapping)
{
    fv_test::ScratchDir dir;
    FrameBlock data(Shape{10, 10, 1, 5}, ElementType::UInt8);
    for (std::size_t f = 0; f < 5; ++f) {
        data.frame(f).setTo(cv::Scalar::all(static_cast<double>(f)));
    }
    {
        Store s(data);
        s.setBasename(dir / "v");
        s.store();
    }

    StoreOptions o;
    o.backendMode = BackendMode::MappedContainer;
    Store s(dir / "v", o);
    EXPECT_EQ(s.backendMode(), BackendMode::MappedContainer);
    auto frame = s.get(Index::all(), Index::all(), 0, 3);
    ASSERT_EQ(frame.shape(), (Shape{10, 10, 1, 1}));
    FrameBlock threes(Shape{10, 10, 1, 1}, ElementType::UInt8);
    threes.fill(3);
    EXPECT_TRUE(frame == threes);
}

TEST(Store, PartialIndicesMeanWholeAxes)
{
    auto data = fv_test::patternBlock(Shape{4, 5, 2, 3}, ElementType::Float32);
    Store s(data);
    auto rows = s.get({Index::range(1, 3)});
    EXPECT_EQ(rows.shape(), (Shape{2, 5, 2, 3}));
    EXPECT_EQ(rows.value(0, 4, 1, 2), data.value(1, 4, 1, 2));
    EXPECT_TRUE(s.get() == data);

    auto picked = s.get(Index::list({3, 0}), 2, Index::all(), Index::list({2, 2}));
    EXPECT_EQ(picked.shape(), (Shape{2, 1, 2, 2}));
    EXPECT_EQ(picked.value(0, 0, 1, 1), data.value(3, 2, 1, 2));
    EXPECT_EQ(picked.value(1, 0, 0, 0), data.value(0, 2, 0, 2));
}

TEST(Store, OutOfRangeIndexIsInputError)
{
    Store s(fv_test::patternBlock(Shape{2, 2, 1, 2}, ElementType::UInt8));
    EXPECT_THROW(s.get(2, 0, 0, 0), InputError);
    EXPECT_THROW(s.get({Index::range(0, 3)}), InputError);
    EXPECT_THROW(Index::range(2, 1), InputError);
}

TEST(Store, EmptyStoreHasNoData)
{
    fv_test::ScratchDir dir;
    fv_test::LogCapture log;
    Store s(dir / "nothing");
    EXPECT_EQ(log.count(), 1u);
    EXPECT_FALSE(s.hasData());
    EXPECT_EQ(s.shape(), Shape{});
    EXPECT_EQ(s.elementType(), ElementType::Unknown);
    EXPECT_THROW(s.get(), InputError);
    EXPECT_NE(s.describe().find("empty"), std::string::npos);
}

TEST(Store, ForcedModeNeedsAFile)
{
    fv_test::ScratchDir dir;
    StoreOptions o;
    o.backendMode = BackendMode::MappedContainer;
    EXPECT_THROW((Store(dir / "nothing", o)), NotFoundError);
}

TEST(Store, LargeReadsAreReported)
{
    Store s(fv_test::patternBlock(Shape{8, 8, 1, 4}, ElementType::Float64));
    EXPECT_THROW(s.setChunkBudgetMiB(0), InputError);
    s.setChunkBudgetMiB(1.0 / (1024.0 * 1024.0));
    fv_test::LogCapture log;
    s.get();
    EXPECT_EQ(log.count(), 1u);
}

// --- writing -----------------------------------------------------------------

TEST(Store, GrowingThenStoringKeepsHeaderInStep)
{
    fv_test::ScratchDir dir;
    Store s(dir / "grow");
    auto first = fv_test::patternBlock(Shape{4, 5, 2, 1}, ElementType::UInt16);
    s.set({Index::all(), Index::all(), Index::all(), 0}, first);
    EXPECT_EQ(s.shape(), (Shape{4, 5, 2, 1}));

    s.set({1, 2, 0, 3}, 7.0);
    EXPECT_EQ(s.shape(), (Shape{4, 5, 2, 4}));
    EXPECT_TRUE(s.isChanged());
    s.store();
    EXPECT_FALSE(s.isChanged());

    auto header = io::probeContainer(dir / "grow.dat");
    ASSERT_TRUE(header.has_value());
    EXPECT_TRUE(io::headerMatches(*header, s.shape(), s.elementType()));

    Store again(dir / "grow");
    EXPECT_EQ(again.get(1, 2, 0, 3).value(0, 0, 0, 0), 7.0);
    EXPECT_EQ(again.get(0, 0, 0, 2).value(0, 0, 0, 0), 0.0);
    EXPECT_EQ(again.get(3, 4, 1, 0).value(0, 0, 0, 0), first.value(3, 4, 1, 0));
}

TEST(Store, ValuesAreBroadcastOrMustFit)
{
    Store s(fv_test::patternBlock(Shape{3, 3, 1, 2}, ElementType::UInt8));
    s.set({Index::range(0, 2), Index::all(), 0, 1}, 9.0);
    EXPECT_EQ(s.get(1, 2, 0, 1).value(0, 0, 0, 0), 9.0);
    EXPECT_NE(s.get(2, 2, 0, 1).value(0, 0, 0, 0), 9.0);

    FrameBlock wrong(Shape{2, 2, 1, 1}, ElementType::UInt8);
    EXPECT_THROW(s.set({Index::all(), Index::all(), 0, 0}, wrong), InputError);
}

TEST(Store, MismatchedTypeIsConvertedWithWarning)
{
    Store s(fv_test::patternBlock(Shape{2, 2, 1, 1}, ElementType::UInt8));
    FrameBlock v(Shape{1, 1, 1, 1}, ElementType::Float64);
    v.fill(3.7);
    fv_test::LogCapture log;
    s.set({0, 0, 0, 0}, v);
    EXPECT_EQ(log.count(), 1u);
    EXPECT_EQ(s.elementType(), ElementType::UInt8);
    EXPECT_EQ(s.get(0, 0, 0, 0).value(0, 0, 0, 0), 4.0);
}

TEST(Store, LockedStoreRefusesMutation)
{
    auto data = fv_test::patternBlock(Shape{3, 3, 1, 2}, ElementType::UInt8);
    Store s(data);
    s.setLocked(true);
    EXPECT_THROW(s.set({0, 0, 0, 0}, 9.0), InputError);
    EXPECT_THROW(s.setData(data), InputError);
    EXPECT_THROW(s.crop(CropRect::area(0, 0, 2, 2)), InputError);
    EXPECT_THROW(s.resize(2.0), InputError);
    EXPECT_THROW(s.setTransform(nullptr), InputError);
    EXPECT_THROW(s.store(), InputError);
    EXPECT_THROW(s.setBackendMode(BackendMode::MappedContainer), InputError);
    EXPECT_TRUE(s.get() == data);

    s.setLocked(false);
    s.set({0, 0, 0, 0}, 9.0);
    EXPECT_EQ(s.get(0, 0, 0, 0).value(0, 0, 0, 0), 9.0);
}

TEST(Store, LockedMappedStoreLeavesEverythingAlone)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{4, 4, 1, 3}, ElementType::UInt8);
    writeContainer(dir / "l.dat", data, BackendMode::MappedContainer);
    writeContainer(dir / "other.dat", data, BackendMode::MappedContainer);
    const auto before = readBytes(dir / "l.dat");

    Store s(dir / "l");
    s.setLocked(true);
    EXPECT_THROW(s.set({0, 0, 0, 0}, 1.0), InputError);
    EXPECT_THROW(s.crop(CropRect::area(0, 0, 2, 2)), InputError);
    EXPECT_THROW(s.resize(0.5), InputError);
    EXPECT_THROW(s.store(), InputError);
    EXPECT_THROW(s.recall(), InputError);
    EXPECT_THROW(s.setBasename(dir / "other"), InputError);
    EXPECT_THROW(s.setBackendMode(BackendMode::InMemory), InputError);
    EXPECT_THROW(s.setChunkBudgetMiB(8.0), InputError);
    EXPECT_THROW(s.writeExtra({{"note", "x"}}), InputError);

    EXPECT_EQ(s.basename(), dir / "l");
    EXPECT_EQ(s.backendMode(), BackendMode::MappedContainer);
    EXPECT_EQ(s.chunkBudgetMiB(), io::kDefaultChunkBudgetMiB);
    EXPECT_FALSE(s.isChanged());
    EXPECT_FALSE(fs::exists(dir / "l.json"));
    EXPECT_TRUE(s.get() == data);
    EXPECT_TRUE(readBytes(dir / "l.dat") == before);
}

TEST(Store, MappedWritesPersist)
{
    fv_test::ScratchDir dir;
    writeContainer(dir / "m.dat", fv_test::patternBlock(Shape{4, 4, 1, 3}, ElementType::UInt8),
                   BackendMode::MappedContainer);
    {
        Store s(dir / "m");
        EXPECT_EQ(s.backendMode(), BackendMode::MappedContainer);
        EXPECT_TRUE(s.isLinked());
        s.set({1, 1, 0, 2}, 99.0);
        EXPECT_THROW(s.set({9, 0, 0, 0}, 1.0), InputError);
        s.store();
    }
    Store again(dir / "m");
    EXPECT_EQ(again.get(1, 1, 0, 2).value(0, 0, 0, 0), 99.0);
    EXPECT_EQ(again.shape(), (Shape{4, 4, 1, 3}));
}

// --- transforms --------------------------------------------------------------

TEST(Store, TransformAppliesOnReadOnly)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{6, 6, 1, 3}, ElementType::UInt8);
    writeContainer(dir / "t.dat", data, BackendMode::InMemory);
    const auto before = readBytes(dir / "t.dat");

    StoreOptions o;
    o.transform = makeCropTransform(cv::Rect(0, 0, 3, 2), 0, 1);
    Store s(dir / "t", o);
    EXPECT_EQ(s.shape(), (Shape{2, 3, 1, 3}));
    EXPECT_EQ(s.diskShape(), (Shape{6, 6, 1, 3}));

    auto b = s.get(Index::all(), Index::all(), Index::all(), 1);
    EXPECT_EQ(b.shape(), (Shape{2, 3, 1, 1}));
    EXPECT_EQ(b.value(1, 2, 0, 0), data.value(1, 2, 0, 1));

    EXPECT_THROW(s.get(), InputError);
    EXPECT_THROW(s.set({0, 0, 0, 0}, 1.0), InputError);
    s.store();
    EXPECT_TRUE(readBytes(dir / "t.dat") == before);
}

TEST(Store, MetadataFollowsTheTransform)
{
    Store s(fv_test::patternBlock(Shape{4, 4, 1, 2}, ElementType::UInt8));
    EXPECT_EQ(s.elementType(), ElementType::UInt8);
    EXPECT_TRUE(s.metadataCached());

    s.setTransform(std::make_shared<FunctionTransform>([](const cv::Mat& m) {
        cv::Mat out;
        m.convertTo(out, CV_32F);
        return out;
    }));
    EXPECT_FALSE(s.metadataCached());
    EXPECT_EQ(s.elementType(), ElementType::Float32);
    EXPECT_EQ(s.diskElementType(), ElementType::UInt8);
    EXPECT_NEAR(s.memoryMiB(), 4.0 * s.diskMiB(), 1e-12);
}

// --- decoder backends --------------------------------------------------------

TEST(Store, VideoIsDecodedOnDemand)
{
    fv_test::ScratchDir dir;
    touch(dir / "clip.avi");
    auto stats = std::make_shared<fv_test::DecoderStats>();
    StoreOptions o;
    o.videoFactory = fv_test::scriptedVideoFactory(4, 4, 1, 10, 25.0, stats);

    Store s(dir / "clip", o);
    EXPECT_EQ(s.backendMode(), BackendMode::StreamDecoder);
    EXPECT_FALSE(s.isLinked());
    EXPECT_EQ(stats->opens, 0u);

    auto b = s.get(Index::all(), Index::all(), 0, Index::range(2, 5));
    EXPECT_EQ(b.shape(), (Shape{4, 4, 1, 3}));
    EXPECT_EQ(b.value(1, 1, 0, 2), fv_test::videoValue(1, 1, 4));

    EXPECT_THROW(s.get(), InputError);
    EXPECT_THROW(s.set({0, 0, 0, 0}, 1.0), InputError);
    EXPECT_NO_THROW(s.store());
}

TEST(Store, TiledReadsOnlyTheWindow)
{
    fv_test::ScratchDir dir;
    touch(dir / "stack.tif");
    auto data = fv_test::patternBlock(Shape{5, 6, 2, 4}, ElementType::UInt16);
    auto stats = std::make_shared<fv_test::DecoderStats>();
    StoreOptions o;
    o.tiledFactory = fv_test::scriptedTiledFactory(data, stats);

    Store s(dir / "stack", o);
    EXPECT_EQ(s.backendMode(), BackendMode::TiledDecoder);
    auto b = s.get(Index::range(1, 3), Index::list({0, 4}), Index::all(), Index::list({3, 1}));
    EXPECT_EQ(b.shape(), (Shape{2, 2, 2, 2}));
    EXPECT_EQ(b.value(1, 1, 1, 0), data.value(2, 4, 1, 3));
    EXPECT_EQ(b.value(0, 0, 0, 1), data.value(1, 0, 0, 1));
}

TEST(Store, IgnoringTheContainerPrefersTheSource)
{
    fv_test::ScratchDir dir;
    writeContainer(dir / "a.dat", fv_test::patternBlock(Shape{10, 10, 1, 5}, ElementType::UInt8),
                   BackendMode::InMemory);
    touch(dir / "a.avi");
    auto stats = std::make_shared<fv_test::DecoderStats>();
    StoreOptions o;
    o.ignoreCachedContainer = true;
    o.videoFactory = fv_test::scriptedVideoFactory(4, 4, 1, 6, 30.0, stats);

    Store s(dir / "a", o);
    EXPECT_EQ(s.backendMode(), BackendMode::StreamDecoder);
    EXPECT_EQ(s.shape(), (Shape{4, 4, 1, 6}));

    s.recall();
    EXPECT_EQ(s.backendMode(), BackendMode::InMemory);
    EXPECT_EQ(s.shape(), (Shape{10, 10, 1, 5}));
}

TEST(Store, VideoIntoMemoryRespectsLoadLimit)
{
    fv_test::ScratchDir dir;
    touch(dir / "clip.avi");
    auto stats = std::make_shared<fv_test::DecoderStats>();
    StoreOptions o;
    o.backendMode = BackendMode::InMemory;
    o.videoFactory = fv_test::scriptedVideoFactory(32, 32, 1, 8, 25.0, stats);
    o.maxLoadMiB = 1.0 / 1024.0;  // 1 KiB, the clip needs 8 KiB
    EXPECT_THROW((Store(dir / "clip", o)), InputError);

    o.maxLoadMiB = 1.0;
    Store s(dir / "clip", o);
    EXPECT_EQ(s.backendMode(), BackendMode::InMemory);
    EXPECT_EQ(s.get(5, 6, 0, 7).value(0, 0, 0, 0), fv_test::videoValue(5, 6, 7));
}

// --- backend changes ---------------------------------------------------------

TEST(Store, SwitchingBackendsKeepsTheData)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{3, 3, 1, 4}, ElementType::UInt8);
    Store s(data);
    EXPECT_THROW(s.setBackendMode(BackendMode::MappedContainer), InputError);

    s.setBasename(dir / "sw");
    s.setBackendMode(BackendMode::MappedContainer);
    EXPECT_EQ(s.backendMode(), BackendMode::MappedContainer);
    EXPECT_EQ(io::probeContainer(dir / "sw.dat")->mode, BackendMode::MappedContainer);
    EXPECT_TRUE(s.get() == data);

    s.set({0, 0, 0, 0}, 42.0);
    s.setBackendMode(BackendMode::InMemory);
    EXPECT_EQ(s.backendMode(), BackendMode::InMemory);
    EXPECT_FALSE(s.isChanged());
    EXPECT_EQ(s.get(0, 0, 0, 0).value(0, 0, 0, 0), 42.0);

    EXPECT_THROW(s.setBackendMode(BackendMode::StreamDecoder), InputError);
}

TEST(Store, VideoToMappedConvertsOnce)
{
    fv_test::ScratchDir dir;
    touch(dir / "clip.avi");
    auto stats = std::make_shared<fv_test::DecoderStats>();
    StoreOptions o;
    o.videoFactory = fv_test::scriptedVideoFactory(4, 4, 1, 6, 30.0, stats);

    Store s(dir / "clip", o);
    s.setBackendMode(BackendMode::MappedContainer);
    EXPECT_TRUE(fs::exists(dir / "clip.dat"));
    EXPECT_EQ(s.get(2, 3, 0, 5).value(0, 0, 0, 0), fv_test::videoValue(2, 3, 5));

    s.setBackendMode(BackendMode::StreamDecoder);
    EXPECT_EQ(s.backendMode(), BackendMode::StreamDecoder);
}

TEST(Store, RenamingAMappedStoreNeedsAContainer)
{
    fv_test::ScratchDir dir;
    writeContainer(dir / "one.dat", fv_test::patternBlock(Shape{2, 2, 1, 1}, ElementType::UInt8),
                   BackendMode::MappedContainer);
    Store s(dir / "one");
    EXPECT_THROW(s.setBasename(dir / "two"), NotFoundError);
    EXPECT_EQ(s.basename(), dir / "one");
    EXPECT_TRUE(s.isLinked());
}

TEST(Store, FailedRenameKeepsTheOldFile)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{3, 3, 1, 2}, ElementType::UInt8);
    writeContainer(dir / "a.dat", data, BackendMode::MappedContainer);
    writeHeaderWords(dir / "b.dat", {3, 3, 1, 2, 12, 1});
    const auto badBytes = readBytes(dir / "b.dat");

    Store s(dir / "a");
    s.set({0, 0, 0, 1}, 200.0);
    EXPECT_EQ(s.shape(), (Shape{3, 3, 1, 2}));

    EXPECT_THROW(s.setBasename(dir / "b"), FormatError);
    EXPECT_EQ(s.basename(), dir / "a");
    EXPECT_EQ(s.files().container, dir / "a.dat");
    EXPECT_EQ(s.backendMode(), BackendMode::MappedContainer);
    EXPECT_TRUE(s.isLinked());
    EXPECT_TRUE(s.isChanged());
    EXPECT_EQ(s.get(0, 0, 0, 1).value(0, 0, 0, 0), 200.0);

    s.store();
    EXPECT_TRUE(readBytes(dir / "b.dat") == badBytes);
    Store again(dir / "a");
    EXPECT_EQ(again.get(0, 0, 0, 1).value(0, 0, 0, 0), 200.0);
    EXPECT_EQ(again.get(2, 2, 0, 0).value(0, 0, 0, 0), data.value(2, 2, 0, 0));
}

TEST(Store, FailedRecallKeepsTheMapping)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{2, 2, 1, 1}, ElementType::UInt8);
    writeContainer(dir / "m.dat", data, BackendMode::MappedContainer);
    touch(dir / "m.avi");
    auto stats = std::make_shared<fv_test::DecoderStats>();
    StoreOptions o;
    o.videoFactory = fv_test::scriptedVideoFactory(32, 32, 1, 8, 25.0, stats);
    o.maxLoadMiB = 1.0 / 1024.0;

    Store s(dir / "m", o);
    EXPECT_EQ(s.backendMode(), BackendMode::MappedContainer);
    EXPECT_EQ(s.shape(), (Shape{2, 2, 1, 1}));
    EXPECT_THROW(s.recall(RecallOptions{true, BackendMode::InMemory}), InputError);

    EXPECT_EQ(s.backendMode(), BackendMode::MappedContainer);
    EXPECT_TRUE(s.isLinked());
    EXPECT_TRUE(s.metadataCached());
    EXPECT_TRUE(s.get() == data);
}

// --- copies and derived state ------------------------------------------------

TEST(Store, CloneIsIndependent)
{
    auto data = fv_test::patternBlock(Shape{2, 2, 1, 2}, ElementType::Float32);
    Store s(data);
    auto c = s.clone();
    c->set({0, 0, 0, 0}, 5.0);
    EXPECT_TRUE(s.get() == data);
    EXPECT_EQ(c->get(0, 0, 0, 0).value(0, 0, 0, 0), 5.0);

    auto t = makeResizeTransform(2.0, 1);
    Store withTransform(data);
    withTransform.setTransform(t);
    auto tc = withTransform.clone();
    EXPECT_EQ(tc->transform().get(), withTransform.transform().get());
    EXPECT_FALSE(tc->metadataCached());
}

TEST(Store, MappedCloneStartsUnlinked)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{3, 2, 1, 2}, ElementType::UInt16);
    writeContainer(dir / "c.dat", data, BackendMode::MappedContainer);
    Store s(dir / "c");
    auto c = s.clone();
    EXPECT_FALSE(c->isLinked());
    EXPECT_TRUE(c->get() == data);
    EXPECT_TRUE(c->isLinked());
}

TEST(Store, ObserverSeesResetsWhileOwnerLives)
{
    Store s(fv_test::patternBlock(Shape{2, 2, 1, 1}, ElementType::UInt8));
    int hits = 0;
    auto owner = std::make_shared<int>(0);
    s.setInvalidationObserver([&hits] { ++hits; }, owner);

    s.setData(fv_test::patternBlock(Shape{3, 3, 1, 1}, ElementType::UInt8));
    EXPECT_EQ(hits, 1);
    s.shape();
    EXPECT_TRUE(s.metadataCached());
    s.resetDerived();
    EXPECT_FALSE(s.metadataCached());
    EXPECT_EQ(hits, 2);

    owner.reset();
    s.resetDerived();
    EXPECT_EQ(hits, 2);
}

// --- reshaping ---------------------------------------------------------------

TEST(Store, CropAndResizeInMemory)
{
    auto data = fv_test::patternBlock(Shape{6, 8, 3, 5}, ElementType::UInt8);
    Store s(data);
    s.crop(CropRect{1, 2, 1, 1, 3, 4, 2, 3});
    EXPECT_EQ(s.shape(), (Shape{3, 4, 2, 3}));
    EXPECT_EQ(s.get(0, 0, 0, 0).value(0, 0, 0, 0), data.value(1, 2, 1, 1));
    EXPECT_EQ(s.get(2, 3, 1, 2).value(0, 0, 0, 0), data.value(3, 5, 2, 3));
    EXPECT_THROW(s.crop(CropRect::area(2, 2, 5, 5)), InputError);

    s.resize(2.0);
    EXPECT_EQ(s.shape(), (Shape{6, 8, 2, 3}));
    EXPECT_THROW(s.resize(0.0), InputError);
}

TEST(Store, CropRewritesAMappedContainer)
{
    fv_test::ScratchDir dir;
    auto data = fv_test::patternBlock(Shape{6, 6, 1, 4}, ElementType::UInt8);
    writeContainer(dir / "c.dat", data, BackendMode::MappedContainer);

    Store s(dir / "c");
    s.crop(CropRect{0, 0, 0, 1, 2, 3, 0, 2});
    EXPECT_EQ(s.backendMode(), BackendMode::MappedContainer);
    EXPECT_EQ(s.shape(), (Shape{2, 3, 1, 2}));
    EXPECT_EQ(s.get(1, 2, 0, 1).value(0, 0, 0, 0), data.value(1, 2, 0, 2));
    EXPECT_TRUE(io::headerMatches(*io::probeContainer(dir / "c.dat"), s.shape(), s.elementType()));
    EXPECT_EQ(std::distance(fs::directory_iterator(dir.path()), fs::directory_iterator()), 1);
}

// --- sidecar, checks and export ----------------------------------------------

TEST(Store, SidecarValues)
{
    fv_test::ScratchDir dir;
    Store s(dir / "meta");
    s.writeExtra({{"fps", 30}, {"camera", "left"}});
    EXPECT_EQ(s.listExtra().size(), 2u);

    fv_test::LogCapture log;
    auto values = s.readExtra({"fps", "missing"});
    EXPECT_EQ(values["fps"].get<int>(), 30);
    EXPECT_FALSE(values.contains("missing"));
    EXPECT_EQ(log.count(), 1u);
    EXPECT_TRUE(fs::exists(dir / "meta.json"));
}

TEST(Store, CheckFindsTruncatedContainer)
{
    fv_test::ScratchDir dir;
    writeContainer(dir / "k.dat", fv_test::patternBlock(Shape{8, 8, 1, 4}, ElementType::UInt8),
                   BackendMode::InMemory);
    Store s(dir / "k");
    EXPECT_TRUE(s.check().empty());

    fs::resize_file(dir / "k.dat", io::kContainerHeaderBytes + 10);
    fv_test::LogCapture log;
    auto problems = s.check(true);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("truncated"), std::string::npos);
    EXPECT_TRUE(s.metadataCached());
}
