#include <gtest/gtest.h>

#include "dat/DatThread.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace dat;

namespace {

std::string deleted_line(const std::string& title) {
    const std::string& m = kDeletedMarker;
    return m + "<>" + m + "<>" + m + "<>" + m + "<>" + title;
}

std::vector<std::string> sample_lines() {
    return {
        "名無しさん<>sage<>2023/10/10(火) 12:34:56 ID:abcdefgh12<> 立てた <>テストスレ",
        "broken<>line",
        "名無しさん<><>2023/10/10(火) 12:35:00 ID:zzz BE:42<> &gt;&gt;1 乙 <br> 次の行 <>",
        "only<>three<>fields",
        deleted_line(""),
    };
}

}  // namespace

TEST(DatThread, SkipsMalformedLinesAndKeepsOrder) {
    DatThread t = DatThread::parse(sample_lines());
    ASSERT_EQ(t.size(), 3u);
    EXPECT_TRUE(t.skipped().empty());

    EXPECT_EQ(t.post(1).body, "立てた");
    EXPECT_EQ(t.post(2).reply_targets, (std::vector<long long>{1}));
    EXPECT_TRUE(t.post(3).is_deleted());
}

TEST(DatThread, AssemblesAllFields) {
    DatThread t = DatThread::parse(sample_lines());
    const DatEntry& e = t.post(2);

    EXPECT_EQ(e.name, "名無しさん");
    EXPECT_EQ(e.email, "");
    EXPECT_EQ(e.date_time, "2023/10/10(火) 12:35:00");
    EXPECT_EQ(*e.user_id, "zzz");
    EXPECT_EQ(*e.be_id, "42");
    EXPECT_EQ(e.body, ">>1 乙\n次の行");
    ASSERT_TRUE(e.title.has_value());
    EXPECT_EQ(*e.title, "");
    EXPECT_FALSE(e.is_deleted());
}

TEST(DatThread, ThreadTitleComesFromFirstPost) {
    DatThread t = DatThread::parse(sample_lines());
    ASSERT_TRUE(t.title().has_value());
    EXPECT_EQ(*t.title(), "テストスレ");

    DatThread untitled = DatThread::parse({"a<>b<>c<>d<>"});
    EXPECT_FALSE(untitled.title().has_value());

    DatThread none;
    EXPECT_FALSE(none.title().has_value());
    EXPECT_TRUE(none.empty());
}

TEST(DatThread, PostNumberOutOfRangeThrows) {
    DatThread t = DatThread::parse(sample_lines());
    EXPECT_THROW(t.post(0), std::out_of_range);
    EXPECT_THROW(t.post(4), std::out_of_range);
    EXPECT_NO_THROW(t.post(3));
}

TEST(DatThread, DiagnosticPolicyRecordsSkippedLines) {
    ParseOptions opts;
    opts.malformed = MalformedLinePolicy::SkipWithDiagnostic;
    DatThread t = DatThread::parse(sample_lines(), opts);

    ASSERT_EQ(t.size(), 3u);
    ASSERT_EQ(t.skipped().size(), 2u);
    EXPECT_EQ(t.skipped()[0].line_index, 1u);
    EXPECT_EQ(t.skipped()[0].field_count, 2u);
    EXPECT_EQ(t.skipped()[1].line_index, 3u);
    EXPECT_EQ(t.skipped()[1].field_count, 3u);
    EXPECT_FALSE(t.skipped()[0].reason.empty());
}

TEST(DatThread, DeletedPostTitleRules) {
    const std::string& m = kDeletedMarker;

    auto with_marker_title = parse_line(deleted_line(m));
    ASSERT_TRUE(with_marker_title.has_value());
    EXPECT_FALSE(with_marker_title->title.has_value());
    EXPECT_EQ(with_marker_title->name, m);
    EXPECT_EQ(with_marker_title->email, m);
    EXPECT_EQ(with_marker_title->date_time, m);
    EXPECT_EQ(with_marker_title->body, "");
    EXPECT_FALSE(with_marker_title->user_id.has_value());
    EXPECT_FALSE(with_marker_title->be_id.has_value());
    EXPECT_TRUE(with_marker_title->reply_targets.empty());

    auto with_real_title = parse_line(deleted_line("スレタイ"));
    ASSERT_TRUE(with_real_title.has_value());
    ASSERT_TRUE(with_real_title->title.has_value());
    EXPECT_EQ(*with_real_title->title, "スレタイ");

    auto four_fields = parse_line(m + "<>" + m + "<>" + m + "<>" + m);
    ASSERT_TRUE(four_fields.has_value());
    EXPECT_FALSE(four_fields->title.has_value());
    EXPECT_TRUE(four_fields->is_deleted());
}

TEST(DatThread, DeletedMarkerSkipsBodyPipeline) {
    const std::string& m = kDeletedMarker;
    // a marker in only some fields is an ordinary post
    auto e = parse_line(m + "<>" + m + "<>" + m + " ID:x<>&gt;&gt;2");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(*e->user_id, "x");
    EXPECT_EQ(e->reply_targets, (std::vector<long long>{2}));
    EXPECT_FALSE(e->is_deleted());
}

TEST(DatThread, MarkerFieldsWithEmptyBodyAreNotDeleted) {
    const std::string& m = kDeletedMarker;
    auto e = parse_line(m + "<>" + m + "<>" + m + "<><>");
    ASSERT_TRUE(e.has_value());
    EXPECT_FALSE(e->is_deleted());
    EXPECT_EQ(e->body, "");
    EXPECT_EQ(e->date_time, m);
}

TEST(DatThread, ThreeFieldLineYieldsNoRecord) {
    EXPECT_FALSE(parse_line("a<>b<>c").has_value());
    EXPECT_TRUE(DatThread::parse({"a<>b<>c"}).empty());
}

TEST(DatThread, RecordCountMatchesWellFormedLines) {
    std::vector<std::string> lines;
    for (int i = 0; i < 20; ++i) {
        lines.push_back(i % 3 == 0 ? "x<>y" : "n<>e<>d<>b");
    }
    DatThread t = DatThread::parse(lines);
    EXPECT_EQ(t.size(), 13u);
}
