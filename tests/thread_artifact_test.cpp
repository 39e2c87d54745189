#include <gtest/gtest.h>

#include "dat/ThreadArtifact.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace dat;

static ThreadArtifact sample_artifact() {
    ParseOptions opts;
    opts.malformed = MalformedLinePolicy::SkipWithDiagnostic;

    ThreadArtifact art;
    art.source_path = "thread.dat";
    art.thread = DatThread::parse({
        "名無し<>sage<>2023/10/10 12:00:00 ID:abc<>one<>スレ",
        "garbage",
        "名無し<><>2023/10/10 12:01:00 BE:7<>&gt;&gt;1 two<>",
    }, opts);
    return art;
}

TEST(ThreadArtifact, SerializesPostsWithNumbers) {
    nlohmann::json j = sample_artifact().to_json();

    EXPECT_EQ(j["source_path"], "thread.dat");
    EXPECT_EQ(j["num_posts"], 2);
    EXPECT_EQ(j["title"], "スレ");

    const auto& posts = j["posts"];
    ASSERT_EQ(posts.size(), 2u);
    EXPECT_EQ(posts[0]["number"], 1);
    EXPECT_EQ(posts[0]["user_id"], "abc");
    EXPECT_TRUE(posts[0]["be_id"].is_null());
    EXPECT_EQ(posts[0]["deleted"], false);

    EXPECT_EQ(posts[1]["number"], 2);
    EXPECT_TRUE(posts[1]["user_id"].is_null());
    EXPECT_EQ(posts[1]["be_id"], "7");
    EXPECT_EQ(posts[1]["body"], ">>1 two");
    EXPECT_EQ(posts[1]["title"], "");
    EXPECT_EQ(posts[1]["reply_targets"], nlohmann::json::array({1}));
}

TEST(ThreadArtifact, SerializesSkippedLines) {
    nlohmann::json j = sample_artifact().to_json();

    const auto& skipped = j["skipped_lines"];
    ASSERT_EQ(skipped.size(), 1u);
    EXPECT_EQ(skipped[0]["line_index"], 1);
    EXPECT_EQ(skipped[0]["field_count"], 1);
}

TEST(ThreadArtifact, UntitledThreadHasNullTitle) {
    ThreadArtifact art;
    art.thread = DatThread::parse({"a<>b<>c<>d"});
    EXPECT_TRUE(art.to_json()["title"].is_null());
}

TEST(ThreadArtifact, WriteCreatesParentDirectories) {
    fs::path dir = fs::temp_directory_path() / "dat_reader_artifact_test";
    fs::remove_all(dir);
    fs::path out = dir / "nested" / "thread.json";

    sample_artifact().write_to(out);

    std::ifstream in(out);
    ASSERT_TRUE(static_cast<bool>(in));
    nlohmann::json j;
    in >> j;
    EXPECT_EQ(j["num_posts"], 2);

    fs::remove_all(dir);
}

TEST(ThreadArtifact, DeletedFlagOnlyForMarkerLines) {
    const std::string& m = kDeletedMarker;
    ThreadArtifact art;
    art.thread = DatThread::parse({
        m + "<>" + m + "<>" + m + "<>" + m + "<>",
        m + "<>" + m + "<>" + m + "<><>",
    });

    nlohmann::json j = art.to_json();
    ASSERT_EQ(j["posts"].size(), 2u);
    EXPECT_EQ(j["posts"][0]["deleted"], true);
    EXPECT_EQ(j["posts"][1]["deleted"], false);
}
