#include <gtest/gtest.h>
#include "receiver/chunk_collector.hpp"
#include "common/chunk_codec.hpp"
#include "common/errors.hpp"
#include "test_util.hpp"

namespace {

std::vector<std::string> wire_texts(const std::string& name, const std::vector<std::string>& bodies) {
    std::vector<std::string> out;
    for (auto& c : testutil::make_chunks(name, bodies)) out.push_back(codec::encode(c, nullptr));
    return out;
}

} // namespace

TEST(ChunkCollector, GroupsRecordsByFilename) {
    auto a = wire_texts("a.txt", {"a1\n", "a2\n"});
    auto b = wire_texts("b.txt", {"b1\n"});

    ChunkCollector col;
    EXPECT_TRUE(col.add_text(a[1]));
    EXPECT_TRUE(col.add_text(b[0]));
    EXPECT_TRUE(col.add_text(a[0]));

    ASSERT_EQ(col.sets().size(), 2u);
    EXPECT_TRUE(col.sets().at("a.txt").is_complete());
    EXPECT_TRUE(col.sets().at("b.txt").is_complete());
    EXPECT_EQ(col.stats().records, 3u);
    EXPECT_FALSE(col.any_encrypted());
}

TEST(ChunkCollector, IdenticalPayloadDropped) {
    auto a = wire_texts("a.txt", {"a1\n", "a2\n"});
    ChunkCollector col;
    EXPECT_TRUE(col.add_text(a[0]));
    EXPECT_FALSE(col.add_text(a[0]));
    EXPECT_EQ(col.stats().duplicates, 1u);
    EXPECT_EQ(col.stats().records, 1u);
    EXPECT_EQ(col.stats().sources, 2u);
}

TEST(ChunkCollector, MalformedRecordCountedAndSkipped) {
    auto a = wire_texts("a.txt", {"a1\n"});
    ChunkCollector col;
    EXPECT_FALSE(col.add_text("not a record"));
    EXPECT_FALSE(col.add_text("not a record"));
    EXPECT_TRUE(col.add_text(a[0]));
    EXPECT_EQ(col.stats().format_errors, 2u);
    EXPECT_EQ(col.stats().duplicates, 0u);
    EXPECT_EQ(col.sets().size(), 1u);
}

TEST(ChunkCollector, DirectoryScanReadsTextFiles) {
    testutil::TempDir dir;
    auto a = wire_texts("notes.txt", {"x\n", "y\n", "z\n"});
    testutil::write_file(dir.str("notes_part_01_of_03.txt"), a[0]);
    testutil::write_file(dir.str("notes_part_03_of_03.txt"), a[2]);
    testutil::write_file(dir.str("readme.txt"), "unrelated text\n");
    testutil::write_file(dir.str("photo.png"), "not scanned without a decoder");

    ChunkCollector col;
    EXPECT_EQ(col.add_directory(dir.str()), 2u);
    EXPECT_EQ(col.stats().format_errors, 1u);
    EXPECT_EQ(col.sets().at("notes.txt").missing_parts(), (std::vector<u32>{2}));
    EXPECT_EQ(col.add_file(dir.str("absent.txt")), 0u);
}

TEST(ChunkCollector, ImagesRequireDecoder) {
    ChunkCollector col;
    EXPECT_THROW(col.add_image(testutil::FakeSymbolCodec::image_of({"x"})), InputError);
}

TEST(ChunkCollector, ImageWithSeveralSymbols) {
    auto a = wire_texts("notes.txt", {"x\n", "y\n"});
    testutil::FakeSymbolCodec symbols;
    ChunkCollector col(&symbols);

    EXPECT_EQ(col.add_image(testutil::FakeSymbolCodec::image_of({a[0], "garbage", a[1]})), 2u);
    EXPECT_EQ(col.add_image(testutil::FakeSymbolCodec::image_of({})), 0u);
    EXPECT_EQ(col.stats().images, 2u);
    EXPECT_EQ(col.stats().symbols_found, 3u);
    EXPECT_EQ(col.stats().format_errors, 1u);
    EXPECT_TRUE(col.sets().at("notes.txt").is_complete());
}

TEST(ChunkCollector, DirectoryScanIncludesImagesWithDecoder) {
    testutil::TempDir dir;
    auto a = wire_texts("notes.txt", {"x\n", "y\n"});
    testutil::write_file(dir.str("notes_part_01_of_02.txt"), a[0]);
    auto img = testutil::FakeSymbolCodec::image_of({a[1]});
    testutil::write_file(dir.str("scan.PNG"), std::string(img.begin(), img.end()));

    testutil::FakeSymbolCodec symbols;
    ChunkCollector col(&symbols);
    EXPECT_EQ(col.add_directory(dir.str()), 2u);
    EXPECT_TRUE(col.sets().at("notes.txt").is_complete());
}

TEST(ChunkCollector, SaveChunksAsText) {
    testutil::TempDir dir;
    auto a = wire_texts("notes.txt", {"x\n", "y\n"});
    ChunkCollector col;
    col.add_text(a[0]);
    col.add_text(a[1]);

    auto written = col.save_chunks_as_text(dir.str("saved"));
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(testutil::read_file(dir.str("saved/notes_part_01_of_02.txt")), a[0]);
    EXPECT_EQ(testutil::read_file(dir.str("saved/notes_part_02_of_02.txt")), a[1]);
}

TEST(ChunkCollector, ReportListsPresentAndMissing) {
    testutil::TempDir dir;
    auto a = wire_texts("notes.txt", {"1\n", "2\n", "3\n", "4\n"});
    ChunkCollector col;
    col.add_text(a[0]);
    col.add_text(a[3]);
    col.add_text("junk");

    std::string rep = col.report();
    EXPECT_NE(rep.find("records: 2\n"), std::string::npos);
    EXPECT_NE(rep.find("format errors: 1\n"), std::string::npos);
    EXPECT_NE(rep.find("file: notes.txt\n"), std::string::npos);
    EXPECT_NE(rep.find("  total: 4\n"), std::string::npos);
    EXPECT_NE(rep.find("  present: [1, 4]\n"), std::string::npos);
    EXPECT_NE(rep.find("  missing: [2, 3]\n"), std::string::npos);
    EXPECT_NE(rep.find("  state: collecting\n"), std::string::npos);

    col.write_report(dir.str("report.txt"));
    EXPECT_EQ(testutil::read_file(dir.str("report.txt")), rep);
}
