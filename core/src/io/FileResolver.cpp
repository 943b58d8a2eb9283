#include "fv/core/io/FileResolver.hpp"

#include <algorithm>

#include "fv/core/io/ContainerCodec.hpp"
#include "fv/core/io/MultiPartTiff.hpp"
#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace fv::io
{

namespace
{

fs::path withExtension(const fs::path& base, const std::string& ext)
{
    return fs::path(base.string() + ext);
}

// A .tif dataset also exists when only its numbered parts do
bool datasetExists(const fs::path& p)
{
    std::error_code ec;
    if (fs::is_regular_file(p, ec)) return true;
    if (!isTiledExtension(p.extension().string())) return false;
    return std::any_of(std::begin(kPartSchemes), std::end(kPartSchemes),
                       [&](const PartScheme& s) { return !matchPartScheme(p, s).empty(); });
}

}  // namespace

const std::vector<std::string>& supportedExtensions()
{
    static const std::vector<std::string> exts{kContainerExtension, ".tif", ".mj2", ".mp4",
                                               ".avi"};
    return exts;
}

bool isSupportedExtension(const std::string& ext)
{
    const auto& exts = supportedExtensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

bool isVideoExtension(const std::string& ext)
{
    return ext == ".mj2" || ext == ".mp4" || ext == ".avi";
}

bool isTiledExtension(const std::string& ext)
{
    return ext == ".tif";
}

bool Resolution::sourceIsContainer() const
{
    return source == container;
}

bool Resolution::containerExists() const
{
    std::error_code ec;
    return fs::is_regular_file(container, ec);
}

bool Resolution::sourceExists() const
{
    return !source.empty() && datasetExists(source);
}

std::optional<fs::path> Resolution::richerSource() const
{
    for (const auto& c : candidates) {
        if (c != container) return c;
    }
    return std::nullopt;
}

fs::path stripExtension(const fs::path& name)
{
    fs::path p = name;
    if (p.extension() == kSidecarExtension) {
        p.replace_extension();
    }
    if (isSupportedExtension(p.extension().string())) {
        p.replace_extension();
    }
    return p;
}

Resolution resolveFiles(const fs::path& name, bool allowCreate)
{
    fs::path p = name;
    if (p.extension() == kSidecarExtension) {
        p.replace_extension();
    }
    const auto ext = p.extension().string();
    const bool explicitExt = isSupportedExtension(ext);

    Resolution r;
    r.basename = explicitExt ? fs::path(p).replace_extension() : p;
    r.container = withExtension(r.basename, kContainerExtension);
    r.sidecar = withExtension(r.basename, kSidecarExtension);

    for (const auto& e : supportedExtensions()) {
        auto candidate = withExtension(r.basename, e);
        if (datasetExists(candidate)) {
            r.candidates.push_back(candidate);
        }
    }

    if (explicitExt && datasetExists(p)) {
        r.source = p;
        return r;
    }

    if (r.candidates.empty()) {
        if (!allowCreate) {
            throw NotFoundError("no source or container file found for " + name.string());
        }
        r.source = r.container;
        return r;
    }

    r.source = r.candidates.front();
    if (r.candidates.size() > 1) {
        std::string listing;
        for (const auto& c : r.candidates) {
            listing += (listing.empty() ? "" : ", ") + c.filename().string();
        }
        r.ambiguity = "several files exist for " + r.basename.string() + " (" + listing +
                      "), using " + r.source.filename().string();
        Logger()->warn("{}", *r.ambiguity);
    } else if (explicitExt) {
        Logger()->warn("{} does not exist, using {}", p.string(), r.source.string());
    }
    return r;
}

}  // namespace fv::io
