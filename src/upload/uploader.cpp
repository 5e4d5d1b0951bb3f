#include "dsup/upload/uploader.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace dsup::upload {

SourceUploader::SourceUploader(api::SourceApi& api, events::EventBus* bus, CoordinatorOptions options)
    : api_(api), bus_(bus), coordinator_(api, bus, options) {
}

dsup::Result<UploadReport> SourceUploader::csv(std::istream& input) {
    return upload(UploadKind::Csv, input);
}

dsup::Result<UploadReport> SourceUploader::xls(std::istream& input) {
    return upload(UploadKind::Xls, input);
}

dsup::Result<UploadReport> SourceUploader::xlsx(std::istream& input) {
    return upload(UploadKind::Xlsx, input);
}

dsup::Result<UploadReport> SourceUploader::tsv(std::istream& input) {
    return upload(UploadKind::Tsv, input);
}

dsup::Result<UploadReport> SourceUploader::shapefile(std::istream& input) {
    return upload(UploadKind::Shapefile, input);
}

dsup::Result<UploadReport> SourceUploader::kml(std::istream& input) {
    return upload(UploadKind::Kml, input);
}

dsup::Result<UploadReport> SourceUploader::geojson(std::istream& input) {
    return upload(UploadKind::GeoJson, input);
}

dsup::Result<UploadReport> SourceUploader::blob(std::istream& input) {
    return upload(UploadKind::Blob, input);
}

dsup::Result<UploadReport> SourceUploader::upload(UploadKind kind, std::istream& input) {
    if (kind == UploadKind::Blob) {
        if (auto res = ensure_blob_mode(); res.is_error()) {
            return dsup::Err<UploadReport>(res.error());
        }
    }
    return bytes(input, content_type_for(kind));
}

dsup::Result<UploadReport> SourceUploader::upload_file(const std::filesystem::path& path,
                                                       std::optional<UploadKind> kind) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return dsup::Err<UploadReport>(ErrorCode::InvalidArgument, "Cannot open " + path.string());
    }

    const UploadKind resolved = kind.value_or(kind_from_extension(path));
    spdlog::info("Uploading {} as {}", path.string(), kind_name(resolved));
    return upload(resolved, input);
}

dsup::Result<UploadReport> SourceUploader::bytes(std::istream& input, const std::string& content_type) {
    return coordinator_.upload(input, content_type);
}

dsup::Result<api::WaitOutcome> SourceUploader::wait_for_finish(const api::WaitOptions& options) {
    api::WaitOptions effective = options;
    if (!effective.bus) {
        effective.bus = bus_;
    }
    return api::wait_for_finish([this]() { return api_.show(); }, effective);
}

dsup::Result<void> SourceUploader::ensure_blob_mode() {
    auto current = api_.show();
    if (current.is_error()) {
        return dsup::Err<void>(current.error());
    }
    if (!current.value().parse_source) {
        return dsup::Ok();
    }

    spdlog::debug("Disabling parse_source on source {}", current.value().id);
    auto updated = api_.disable_parse_source();
    if (updated.is_error()) {
        return dsup::Err<void>(updated.error());
    }
    return dsup::Ok();
}

} // namespace dsup::upload
