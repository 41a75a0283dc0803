#include "stash/upload/metadata.hpp"

#include <gtest/gtest.h>

using stash::ErrorKind;
using stash::upload::UploadMetadata;

namespace {

UploadMetadata complete_metadata() {
    UploadMetadata metadata;
    metadata.primary_file_path = "/tmp/app.apk";
    metadata.version_major = "1";
    metadata.version_minor = "2";
    metadata.version_patch = "3";
    metadata.platform = "android";
    metadata.stream = "default";
    return metadata;
}

} // namespace

TEST(MetadataValidationTest, AcceptsCompleteMetadata) {
    EXPECT_TRUE(stash::upload::validate_metadata(complete_metadata()).is_ok());
}

TEST(MetadataValidationTest, RejectsBlankRequiredFields) {
    struct Case {
        void (*blank)(UploadMetadata&);
        const char* message;
    };
    const Case cases[] = {
        {[](UploadMetadata& m) { m.primary_file_path = ""; }, "Primary file path is required"},
        {[](UploadMetadata& m) { m.version_major = " "; }, "Major version component is required"},
        {[](UploadMetadata& m) { m.version_minor = ""; }, "Minor version component is required"},
        {[](UploadMetadata& m) { m.version_patch = "\t"; }, "Patch version component is required"},
        {[](UploadMetadata& m) { m.platform = ""; }, "Platform is required"},
        {[](UploadMetadata& m) { m.stream = "  "; }, "Stream is required"},
    };

    for (const auto& c : cases) {
        auto metadata = complete_metadata();
        c.blank(metadata);
        auto result = stash::upload::validate_metadata(metadata);
        ASSERT_TRUE(result.is_error()) << c.message;
        EXPECT_EQ(result.error().kind, ErrorKind::Validation);
        EXPECT_EQ(result.error().message, c.message);
    }
}

TEST(MetadataValidationTest, RejectsBlankApiKey) {
    auto result = stash::upload::validate_api_key("   ");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
    EXPECT_EQ(result.error().message, "API key is required");
    EXPECT_TRUE(stash::upload::validate_api_key("secret").is_ok());
}

TEST(ParseListTest, SplitsOnCommasAndNewlines) {
    auto items = stash::upload::parse_list(" beta, nightly\r\nqa,,\n  release candidate \n");
    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0], "beta");
    EXPECT_EQ(items[1], "nightly");
    EXPECT_EQ(items[2], "qa");
    EXPECT_EQ(items[3], "release candidate");

    EXPECT_TRUE(stash::upload::parse_list(" , \n ").empty());
}

TEST(BuildDurationTest, FormatsHoursMinutesSeconds) {
    EXPECT_EQ(stash::upload::format_build_duration(0), "00:00:00");
    EXPECT_EQ(stash::upload::format_build_duration(3723000), "01:02:03");
    EXPECT_EQ(stash::upload::format_build_duration(59999), "00:00:59");
    EXPECT_EQ(stash::upload::format_build_duration(90000000), "25:00:00");
}

TEST(CiEnvironmentTest, FillsFromJenkinsVariables) {
    auto metadata = complete_metadata();
    metadata.ci_run_id = "manual-7";

    auto env = stash::fixed_environment({
        {"JENKINS_URL", "https://ci.example.com/"},
        {"JOB_NAME", "mobile/release"},
        {"BUILD_NUMBER", "42"},
        {"BUILD_URL", "https://ci.example.com/job/mobile/42/"},
        {"JOB_URL", "https://ci.example.com/job/mobile/"},
    });

    stash::upload::apply_ci_environment(metadata, env);

    EXPECT_EQ(metadata.source.value_or(""), "jenkins");
    EXPECT_EQ(metadata.ci_pipeline.value_or(""), "mobile/release");
    EXPECT_EQ(metadata.ci_run_id.value_or(""), "manual-7");
    EXPECT_EQ(metadata.ci_run_url.value_or(""), "https://ci.example.com/job/mobile/42/");
    EXPECT_EQ(metadata.ci_pipeline_url.value_or(""), "https://ci.example.com/job/mobile/");
}

TEST(CiEnvironmentTest, FallbackSourceOutsideJenkins) {
    auto metadata = complete_metadata();
    stash::upload::apply_ci_environment(metadata, stash::fixed_environment({}));

    EXPECT_EQ(metadata.source.value_or(""), "cli");
    EXPECT_FALSE(metadata.ci_pipeline.has_value());
}
