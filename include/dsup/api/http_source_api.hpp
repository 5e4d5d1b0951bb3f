#pragma once

#include "dsup/api/source_api.hpp"
#include "dsup/network/http_client.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace dsup::api {

/**
 * @brief SourceApi backed by the publishing HTTP endpoints
 *
 * Every request URL comes from the snapshot's links. The "chunk" and
 * "commit" links are templates containing "{seq_num}" and "{byte_offset}".
 *
 * THREAD SAFETY:
 * send_chunk() may run on several workers at once. The stored snapshot is
 * guarded by a mutex and replaced whenever show() or an update succeeds.
 */
class HttpSourceApi : public SourceApi {
public:
    HttpSourceApi(const network::HttpClient& client, SourceSnapshot snapshot);

    dsup::Result<upload::UploadPlan> initiate(const std::string& content_type) override;

    dsup::Result<void> send_chunk(std::uint64_t seq_num,
                                  std::uint64_t byte_offset,
                                  const std::vector<std::uint8_t>& payload) override;

    dsup::Result<void> commit(std::uint64_t seq_num, std::uint64_t end_byte_offset) override;

    dsup::Result<SourceSnapshot> show() override;

    dsup::Result<SourceSnapshot> disable_parse_source() override;

    SourceSnapshot snapshot() const;

    /// POST /api/publishing/v1/source for a new upload-type source
    static dsup::Result<SourceSnapshot> create_upload(const network::HttpClient& client,
                                                      const std::string& filename);

    /// GET /api/publishing/v1/source/{id}
    static dsup::Result<SourceSnapshot> lookup(const network::HttpClient& client, std::int64_t id);

    /**
     * @brief Substitute {seq_num} and {byte_offset} in a link template
     */
    static std::string expand_link(std::string link, std::uint64_t seq_num, std::uint64_t byte_offset);

private:
    dsup::Result<std::string> require_link(const std::string& name) const;
    dsup::Result<SourceSnapshot> store(const network::HttpResponse& response);

    const network::HttpClient& client_;
    mutable std::mutex mutex_;
    SourceSnapshot snapshot_;
};

} // namespace dsup::api
