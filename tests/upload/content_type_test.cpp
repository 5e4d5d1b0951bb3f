#include "dsup/upload/content_type.hpp"

#include <gtest/gtest.h>

#include <string>

using dsup::ErrorCode;
using dsup::upload::UploadKind;
using dsup::upload::content_type_for;
using dsup::upload::kind_from_extension;
using dsup::upload::kind_name;
using dsup::upload::parse_upload_kind;

TEST(ContentTypeTest, MapsEveryKindToItsMimeType) {
    EXPECT_STREQ(content_type_for(UploadKind::Csv), "text/csv");
    EXPECT_STREQ(content_type_for(UploadKind::Xls), "application/vnd.ms-excel");
    EXPECT_STREQ(content_type_for(UploadKind::Xlsx),
                 "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet");
    EXPECT_STREQ(content_type_for(UploadKind::Tsv), "text/tab-separated-values");
    EXPECT_STREQ(content_type_for(UploadKind::Shapefile), "application/zip");
    EXPECT_STREQ(content_type_for(UploadKind::Kml), "application/vnd.google-earth.kml+xml");
    EXPECT_STREQ(content_type_for(UploadKind::GeoJson), "application/vnd.geo+json");
    EXPECT_STREQ(content_type_for(UploadKind::Blob), "application/octet-stream");
}

TEST(ContentTypeTest, ParsesKindNamesCaseInsensitively) {
    for (auto kind : {UploadKind::Csv, UploadKind::Xls, UploadKind::Xlsx, UploadKind::Tsv,
                      UploadKind::Shapefile, UploadKind::Kml, UploadKind::GeoJson, UploadKind::Blob}) {
        auto parsed = parse_upload_kind(kind_name(kind));
        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value(), kind);
    }

    auto upper = parse_upload_kind("GeoJSON");
    ASSERT_TRUE(upper.is_ok());
    EXPECT_EQ(upper.value(), UploadKind::GeoJson);
}

TEST(ContentTypeTest, UnknownKindIsInvalidArgument) {
    auto parsed = parse_upload_kind("parquet");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}

TEST(ContentTypeTest, InfersKindFromExtension) {
    EXPECT_EQ(kind_from_extension("data/crimes.csv"), UploadKind::Csv);
    EXPECT_EQ(kind_from_extension("Budget.XLSX"), UploadKind::Xlsx);
    EXPECT_EQ(kind_from_extension("old.xls"), UploadKind::Xls);
    EXPECT_EQ(kind_from_extension("rows.tsv"), UploadKind::Tsv);
    EXPECT_EQ(kind_from_extension("parcels.zip"), UploadKind::Shapefile);
    EXPECT_EQ(kind_from_extension("routes.kml"), UploadKind::Kml);
    EXPECT_EQ(kind_from_extension("wards.geojson"), UploadKind::GeoJson);
    EXPECT_EQ(kind_from_extension("photo.jpg"), UploadKind::Blob);
    EXPECT_EQ(kind_from_extension("README"), UploadKind::Blob);
}
