#include "dsup/upload/content_type.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace dsup::upload {
namespace {

struct KindEntry {
    UploadKind kind;
    const char* name;
    const char* content_type;
};

constexpr std::array<KindEntry, 8> kKinds{{
    {UploadKind::Csv, "csv", "text/csv"},
    {UploadKind::Xls, "xls", "application/vnd.ms-excel"},
    {UploadKind::Xlsx, "xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {UploadKind::Tsv, "tsv", "text/tab-separated-values"},
    {UploadKind::Shapefile, "shapefile", "application/zip"},
    {UploadKind::Kml, "kml", "application/vnd.google-earth.kml+xml"},
    {UploadKind::GeoJson, "geojson", "application/vnd.geo+json"},
    {UploadKind::Blob, "blob", "application/octet-stream"},
}};

const KindEntry& entry_for(UploadKind kind) noexcept {
    for (const auto& entry : kKinds) {
        if (entry.kind == kind) {
            return entry;
        }
    }
    return kKinds.back();
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

const char* content_type_for(UploadKind kind) noexcept {
    return entry_for(kind).content_type;
}

const char* kind_name(UploadKind kind) noexcept {
    return entry_for(kind).name;
}

dsup::Result<UploadKind> parse_upload_kind(const std::string& name) {
    const auto wanted = lowercase(name);
    for (const auto& entry : kKinds) {
        if (wanted == entry.name) {
            return dsup::Ok(entry.kind);
        }
    }
    return dsup::Err<UploadKind>(ErrorCode::InvalidArgument, "Unknown upload kind: " + name);
}

UploadKind kind_from_extension(const std::filesystem::path& path) {
    static const std::array<std::pair<const char*, UploadKind>, 7> extensions{{
        {".csv", UploadKind::Csv},
        {".xls", UploadKind::Xls},
        {".xlsx", UploadKind::Xlsx},
        {".tsv", UploadKind::Tsv},
        {".zip", UploadKind::Shapefile},
        {".kml", UploadKind::Kml},
        {".geojson", UploadKind::GeoJson},
    }};

    const auto extension = lowercase(path.extension().string());
    for (const auto& [suffix, kind] : extensions) {
        if (extension == suffix) {
            return kind;
        }
    }
    return UploadKind::Blob;
}

} // namespace dsup::upload
