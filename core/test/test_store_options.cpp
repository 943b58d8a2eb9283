#include "test.hpp"
#include "scratch.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "fv/core/types/Exceptions.hpp"
#include "fv/core/types/StoreOptions.hpp"

using namespace fv;

TEST(StoreOptions, DefaultsFromAnEmptyObject)
{
    auto opts = parseStoreOptions(nlohmann::json::object());
    EXPECT_FALSE(opts.backendMode.has_value());
    EXPECT_FALSE(opts.ignoreCachedContainer);
    EXPECT_FLOAT_EQ(opts.chunkBudgetMiB, io::kDefaultChunkBudgetMiB);
    EXPECT_FLOAT_EQ(opts.maxLoadMiB, kDefaultMaxLoadMiB);
    EXPECT_TRUE(opts.transform == nullptr);
}

TEST(StoreOptions, ParsesEveryKey)
{
    auto j = nlohmann::json::parse(R"({
        "backend_mode": 1,
        "ignore_cached_container": true,
        "chunk_budget_mib": 64,
        "max_load_mib": "512",
        "transform": {"type": "affine", "matrix": [0, -1, 9, 1, 0, 0]}
    })");
    auto opts = parseStoreOptions(j);
    ASSERT_TRUE(opts.backendMode.has_value());
    EXPECT_EQ(*opts.backendMode, BackendMode::MappedContainer);
    EXPECT_TRUE(opts.ignoreCachedContainer);
    EXPECT_FLOAT_EQ(opts.chunkBudgetMiB, 64.0);
    EXPECT_FLOAT_EQ(opts.maxLoadMiB, 512.0);
    auto* affine = dynamic_cast<const AffineTransform*>(opts.transform.get());
    ASSERT_TRUE(affine != nullptr);
    EXPECT_FLOAT_EQ(affine->matrix()(0, 2), 9.0);
}

TEST(StoreOptions, InvalidValuesAreRejected)
{
    EXPECT_THROW(parseStoreOptions(nlohmann::json::parse(R"({"backend_mode": 4})")), InputError);
    EXPECT_THROW(parseStoreOptions(nlohmann::json::parse(R"({"backend_mode": "mapped"})")),
                 InputError);
    EXPECT_THROW(parseStoreOptions(nlohmann::json::parse(R"({"chunk_budget_mib": 0})")),
                 InputError);
    EXPECT_THROW(parseStoreOptions(nlohmann::json::parse(R"({"max_load_mib": -1})")), InputError);
    EXPECT_THROW(parseStoreOptions(nlohmann::json::array()), InputError);
}

TEST(StoreOptions, TransformsFromJson)
{
    EXPECT_TRUE(parseTransform(nullptr) == nullptr);

    auto u = parseTransform(nlohmann::json::parse(R"({
        "type": "undistort",
        "camera_matrix": [100, 0, 32, 0, 100, 24, 0, 0, 1],
        "dist_coeffs": [0.1, 0, 0, 0, 0]
    })"));
    auto* undistort = dynamic_cast<const UndistortTransform*>(u.get());
    ASSERT_TRUE(undistort != nullptr);
    EXPECT_EQ(undistort->distCoeffs().size(), 5u);

    EXPECT_THROW(parseTransform(nlohmann::json::parse(R"({"type": "warp"})")), InputError);
    EXPECT_THROW(parseTransform(nlohmann::json::parse(R"({"matrix": [1, 0, 0, 0, 1, 0]})")),
                 InputError);
    EXPECT_THROW(parseTransform(nlohmann::json::parse(R"({"type": "affine", "matrix": [1, 0]})")),
                 InputError);
    EXPECT_THROW(parseTransform(nlohmann::json::parse(
                     R"({"type": "undistort", "camera_matrix": [1,0,0,0,1,0,0,0,1], "dist_coeffs": [1, 2]})")),
                 InputError);
}

TEST(StoreOptions, JsonRoundTripKeepsSettings)
{
    StoreOptions opts;
    opts.backendMode = BackendMode::TiledDecoder;
    opts.chunkBudgetMiB = 16;
    opts.transform = std::make_shared<AffineTransform>(cv::Matx23d(1, 0, 2, 0, 1, 3));

    auto back = parseStoreOptions(toJson(opts));
    EXPECT_EQ(*back.backendMode, BackendMode::TiledDecoder);
    EXPECT_FLOAT_EQ(back.chunkBudgetMiB, 16.0);
    auto* affine = dynamic_cast<const AffineTransform*>(back.transform.get());
    ASSERT_TRUE(affine != nullptr);
    EXPECT_FLOAT_EQ(affine->matrix()(1, 2), 3.0);

    // Function transforms are not written out
    opts.transform = makeResizeTransform(0.5, 1);
    EXPECT_FALSE(toJson(opts).contains("transform"));
}

TEST(StoreOptions, LoadFromFile)
{
    fv_test::ScratchDir dir;
    EXPECT_THROW(loadStoreOptions(dir / "missing.json"), NotFoundError);

    {
        std::ofstream out(dir / "bad.json");
        out << "{ backend_mode: 1 }";
    }
    EXPECT_THROW(loadStoreOptions(dir / "bad.json"), FormatError);

    {
        std::ofstream out(dir / "ok.json");
        out << R"({"backend_mode": 0, "max_load_mib": 8})";
    }
    auto opts = loadStoreOptions(dir / "ok.json");
    EXPECT_EQ(*opts.backendMode, BackendMode::InMemory);
    EXPECT_FLOAT_EQ(opts.maxLoadMiB, 8.0);
}
