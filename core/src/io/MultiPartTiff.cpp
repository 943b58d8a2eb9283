#include "fv/core/io/MultiPartTiff.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <numeric>
#include <stdexcept>
#include <string>

#include "fv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace fv::io
{

namespace
{

// Numeric suffix of `stem` under `scheme` relative to `series`, -1 if none
long parseSuffix(const std::string& stem, const std::string& series, const PartScheme& scheme)
{
    const auto n = static_cast<std::size_t>(scheme.digits);
    if (stem.size() != series.size() + 1 + n) return -1;
    if (stem.compare(0, series.size(), series) != 0) return -1;
    if (stem[series.size()] != scheme.separator) return -1;
    auto digits = stem.substr(series.size() + 1);
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return -1;
    }
    return std::stol(digits);
}

// Series name: the stem with a trailing scheme suffix removed
std::string seriesName(const std::string& stem, const PartScheme& scheme)
{
    const auto n = static_cast<std::size_t>(scheme.digits);
    if (stem.size() < n + 2) return stem;
    auto series = stem.substr(0, stem.size() - n - 1);
    return parseSuffix(stem, series, scheme) >= 0 ? series : stem;
}

}  // namespace

std::size_t MultiPartSequence::totalFrames() const
{
    return std::accumulate(framesPerFile.begin(), framesPerFile.end(), std::size_t{0});
}

std::pair<std::size_t, std::size_t> MultiPartSequence::locate(std::size_t frame) const
{
    std::size_t first = 0;
    for (std::size_t i = 0; i < framesPerFile.size(); ++i) {
        if (frame < first + framesPerFile[i]) {
            return {i, frame - first};
        }
        first += framesPerFile[i];
    }
    throw std::out_of_range("frame " + std::to_string(frame) + " is beyond the " +
                            std::to_string(first) + " frames of the sequence");
}

std::vector<fs::path> matchPartScheme(const fs::path& tif, const PartScheme& scheme)
{
    const auto stem = tif.stem().string();
    const auto ext = tif.extension();
    const auto series = seriesName(stem, scheme);
    const auto dir = tif.parent_path().empty() ? fs::path(".") : tif.parent_path();

    // suffix -> file; a map both deduplicates and sorts
    std::map<long, fs::path> found;

    std::error_code ec;
    if (fs::is_regular_file(tif, ec)) {
        found.emplace(parseSuffix(stem, series, scheme), tif);
    }

    if (fs::is_directory(dir, ec)) {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ext) continue;
            auto suffix = parseSuffix(entry.path().stem().string(), series, scheme);
            if (suffix < 0) continue;
            auto p = tif.parent_path().empty() ? entry.path().filename() : entry.path();
            found.emplace(suffix, p);
        }
    }

    std::vector<fs::path> files;
    files.reserve(found.size());
    for (auto& [suffix, p] : found) {
        files.push_back(p);
    }
    return files;
}

MultiPartSequence detectMultiPart(const fs::path& tif)
{
    auto first = matchPartScheme(tif, kPartSchemes[0]);
    auto second = matchPartScheme(tif, kPartSchemes[1]);

    MultiPartSequence seq;
    if (second.size() > first.size()) {
        if (first.size() > 1) {
            Logger()->warn("Found {} files named with '{}' and {} named with '{}' for {}, using '{}'",
                           first.size(), kPartSchemes[0].separator, second.size(),
                           kPartSchemes[1].separator, tif.string(), kPartSchemes[1].separator);
        }
        seq.files = std::move(second);
        seq.scheme = kPartSchemes[1];
    } else {
        if (second.size() > 1) {
            Logger()->warn("Found {} files named with '{}' and {} named with '{}' for {}, using '{}'",
                           first.size(), kPartSchemes[0].separator, second.size(),
                           kPartSchemes[1].separator, tif.string(), kPartSchemes[0].separator);
        }
        seq.files = std::move(first);
        seq.scheme = kPartSchemes[0];
    }
    return seq;
}

}  // namespace fv::io
