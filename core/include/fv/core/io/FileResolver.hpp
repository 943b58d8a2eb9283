#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fv::io
{

constexpr const char* kSidecarExtension = ".json";

// Source extensions, highest priority first: container, tiled image, media
const std::vector<std::string>& supportedExtensions();

bool isSupportedExtension(const std::string& ext);
bool isVideoExtension(const std::string& ext);
bool isTiledExtension(const std::string& ext);

/** Which sibling files represent one dataset */
struct Resolution {
    std::filesystem::path basename;   // without extension
    std::filesystem::path source;     // canonical source, may be the container
    std::filesystem::path container;  // <basename>.dat
    std::filesystem::path sidecar;    // <basename>.json
    // Existing siblings in priority order; a split .tif counts through its first part
    std::vector<std::filesystem::path> candidates;
    // Set when several siblings existed and one was chosen by priority
    std::optional<std::string> ambiguity;

    [[nodiscard]] bool sourceIsContainer() const;
    [[nodiscard]] bool containerExists() const;
    [[nodiscard]] bool sourceExists() const;

    // First existing candidate that is not the container
    [[nodiscard]] std::optional<std::filesystem::path> richerSource() const;
};

/**
 * Resolve a basename, optionally carrying an extension, to its files.
 *
 * An existing exact extension wins. Otherwise all supported extensions are
 * scanned: one hit is used, several hits are resolved by priority with an
 * ambiguity warning.
 *
 * @param allowCreate when nothing exists, resolve to a fresh container
 *                    instead of throwing
 * @throws NotFoundError if nothing exists and allowCreate is false
 */
Resolution resolveFiles(const std::filesystem::path& name, bool allowCreate = false);

// Strip a supported or sidecar extension, leaving dotted basenames intact
std::filesystem::path stripExtension(const std::filesystem::path& name);

}  // namespace fv::io
