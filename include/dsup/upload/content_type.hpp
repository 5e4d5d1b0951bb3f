#pragma once

#include "dsup/core/result.hpp"

#include <filesystem>
#include <string>

namespace dsup::upload {

/**
 * @brief Declared kind of an upload; selects the MIME type sent to initiate
 */
enum class UploadKind {
    Csv,
    Xls,
    Xlsx,
    Tsv,
    Shapefile,
    Kml,
    GeoJson,
    Blob
};

const char* content_type_for(UploadKind kind) noexcept;

const char* kind_name(UploadKind kind) noexcept;

/// Accepts the names returned by kind_name(), case-insensitively
dsup::Result<UploadKind> parse_upload_kind(const std::string& name);

/// Infers the kind from a file extension; unknown extensions are blobs
UploadKind kind_from_extension(const std::filesystem::path& path);

} // namespace dsup::upload
