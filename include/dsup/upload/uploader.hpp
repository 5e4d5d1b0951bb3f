#pragma once

#include "dsup/api/source_api.hpp"
#include "dsup/api/wait.hpp"
#include "dsup/core/result.hpp"
#include "dsup/events/event_bus.hpp"
#include "dsup/upload/content_type.hpp"
#include "dsup/upload/coordinator.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace dsup::upload {

/**
 * @brief Typed upload entry points for one source
 *
 * Each method picks the MIME type for its kind and runs the chunked upload
 * through an UploadCoordinator. blob() first turns off server-side parsing
 * when the source still has it enabled.
 *
 * Example:
 * ```cpp
 * SourceUploader uploader(api, &bus);
 * std::ifstream in("data.csv", std::ios::binary);
 * auto report = uploader.csv(in);
 * auto outcome = uploader.wait_for_finish({});
 * ```
 */
class SourceUploader {
public:
    explicit SourceUploader(api::SourceApi& api,
                            events::EventBus* bus = nullptr,
                            CoordinatorOptions options = {});

    dsup::Result<UploadReport> csv(std::istream& input);
    dsup::Result<UploadReport> xls(std::istream& input);
    dsup::Result<UploadReport> xlsx(std::istream& input);
    dsup::Result<UploadReport> tsv(std::istream& input);
    dsup::Result<UploadReport> shapefile(std::istream& input);
    dsup::Result<UploadReport> kml(std::istream& input);
    dsup::Result<UploadReport> geojson(std::istream& input);
    dsup::Result<UploadReport> blob(std::istream& input);

    dsup::Result<UploadReport> upload(UploadKind kind, std::istream& input);

    /**
     * @brief Upload a local file; the kind defaults to one inferred from the extension
     */
    dsup::Result<UploadReport> upload_file(const std::filesystem::path& path,
                                           std::optional<UploadKind> kind = std::nullopt);

    /// Upload with an explicit MIME type
    dsup::Result<UploadReport> bytes(std::istream& input, const std::string& content_type);

    /// Poll show() until the source finishes or fails
    dsup::Result<api::WaitOutcome> wait_for_finish(const api::WaitOptions& options);

    const UploadCoordinator& coordinator() const noexcept { return coordinator_; }

private:
    dsup::Result<void> ensure_blob_mode();

    api::SourceApi& api_;
    events::EventBus* bus_;
    UploadCoordinator coordinator_;
};

} // namespace dsup::upload
