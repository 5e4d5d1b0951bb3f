#include "dsup/api/snapshot.hpp"
#include "dsup/api/http_source_api.hpp"

#include <gtest/gtest.h>

using dsup::ErrorCode;
using dsup::api::HttpSourceApi;
using dsup::api::SourceSnapshot;

TEST(SourceSnapshotTest, ParsesResourceAndLinks) {
    auto snapshot = SourceSnapshot::parse(R"({
        "resource": {
            "id": 17,
            "finished_at": null,
            "failed_at": null,
            "parse_options": {"parse_source": false},
            "failure_details": null
        },
        "links": {
            "show": "/api/publishing/v1/source/17",
            "chunk": "/api/publishing/v1/source/17/chunk/{seq_num}/{byte_offset}",
            "ignored": 5
        }
    })");

    ASSERT_TRUE(snapshot.is_ok()) << snapshot.error().describe();
    const auto& s = snapshot.value();
    EXPECT_EQ(s.id, 17);
    EXPECT_FALSE(s.is_finished());
    EXPECT_FALSE(s.is_failed());
    EXPECT_FALSE(s.parse_source);
    EXPECT_EQ(s.link("show").value(), "/api/publishing/v1/source/17");
    EXPECT_FALSE(s.link("ignored").has_value());
    EXPECT_FALSE(s.link("commit").has_value());
    EXPECT_EQ(s.raw["resource"]["id"], 17);
}

TEST(SourceSnapshotTest, ReadsCompletionMarkers) {
    auto finished = SourceSnapshot::parse(
        R"({"resource": {"id": 1, "finished_at": "2024-05-01T10:00:00Z"}})");
    ASSERT_TRUE(finished.is_ok());
    EXPECT_TRUE(finished.value().is_finished());
    EXPECT_EQ(*finished.value().finished_at, "2024-05-01T10:00:00Z");
    EXPECT_TRUE(finished.value().parse_source);

    auto failed = SourceSnapshot::parse(
        R"({"resource": {"id": 1, "failed_at": 1714557600, "failure_details": {"message": "bad header"}}})");
    ASSERT_TRUE(failed.is_ok());
    EXPECT_TRUE(failed.value().is_failed());
    EXPECT_EQ(*failed.value().failed_at, "1714557600");
    EXPECT_EQ(failed.value().failure_details["message"], "bad header");
}

TEST(SourceSnapshotTest, RejectsMalformedDocuments) {
    auto not_json = SourceSnapshot::parse("<html>");
    ASSERT_TRUE(not_json.is_error());
    EXPECT_EQ(not_json.error().code, ErrorCode::Protocol);

    auto no_resource = SourceSnapshot::parse(R"({"links": {}})");
    ASSERT_TRUE(no_resource.is_error());
    EXPECT_EQ(no_resource.error().code, ErrorCode::Protocol);

    auto wrong_id = SourceSnapshot::parse(R"({"resource": {"id": "seven"}})");
    ASSERT_TRUE(wrong_id.is_error());
    EXPECT_EQ(wrong_id.error().code, ErrorCode::Protocol);
}

TEST(HttpSourceApiTest, ExpandsLinkTemplates) {
    EXPECT_EQ(HttpSourceApi::expand_link("/source/3/chunk/{seq_num}/{byte_offset}", 4, 400),
              "/source/3/chunk/4/400");
    EXPECT_EQ(HttpSourceApi::expand_link("/source/3/commit/{seq_num}/{byte_offset}", 2, 250),
              "/source/3/commit/2/250");
    EXPECT_EQ(HttpSourceApi::expand_link("/plain", 1, 2), "/plain");
}
