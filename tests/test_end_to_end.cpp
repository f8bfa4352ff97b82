#include <gtest/gtest.h>
#include "sender/sender_app.hpp"
#include "receiver/receiver_app.hpp"
#include "common/errors.hpp"
#include "test_util.hpp"

namespace {

// Small symbols so modest files span many chunks
Config small_config(const std::string& out_dir) {
    Config cfg;
    cfg.max_symbol_bytes   = 100;
    cfg.capacity_warning   = 1000;
    cfg.parallel_threshold = 2;
    cfg.max_workers        = 4;
    cfg.output_dir         = out_dir;
    return cfg;
}

std::string sample_text() {
    std::string s;
    for (int i = 1; i <= 60; ++i) {
        s += "record " + std::to_string(i) + ": caf\xC3\xA9 \xE2\x82\xAC " + std::string((size_t)(i % 17), '#') + "\n";
    }
    return s;
}

size_t count_entries(const std::string& dir) {
    size_t n = 0;
    for (auto& e : fs::directory_iterator(dir)) { (void)e; ++n; }
    return n;
}

} // namespace

class EndToEndTest : public ::testing::Test {
protected:
    testutil::TempDir    dir;
    crypto::CryptoEngine engine{testutil::TEST_ITERATIONS};

    SendResult send(const std::string& content, bool encrypt, SymbolCodec* symbols = nullptr,
                    const std::string& name = "notes.txt") {
        testutil::write_file(dir.str("src/" + name), content);
        SenderOptions so;
        so.input_path = dir.str("src/" + name);
        so.config     = small_config(dir.str("chunks"));
        so.encrypt    = encrypt;
        SenderApp app(so, &engine, symbols);
        if (encrypt) app.set_password(crypto::Password(std::string("password123")));
        return app.run();
    }

    BatchReport receive(const std::string& password, SymbolCodec* symbols = nullptr) {
        ReceiverOptions ro;
        ro.inputs = {dir.str("chunks")};
        ro.config = small_config(dir.str("rebuilt"));
        ReceiverApp app(ro, &engine, symbols);
        app.set_password_provider([password](crypto::Password& out, int) {
            out = crypto::Password(std::string(password));
            return true;
        });
        return app.run();
    }
};

TEST_F(EndToEndTest, PlainRoundTrip) {
    const std::string content = sample_text();
    SendResult sent = send(content, false);
    ASSERT_TRUE(sent.ok);
    EXPECT_GT(sent.total, 10u);
    EXPECT_EQ(sent.chunk_files.size(), sent.total);
    EXPECT_EQ(sent.file_hash, hash::file_hash(content));
    // Staging directory is gone, only chunk files remain
    EXPECT_EQ(count_entries(dir.str("chunks")), (size_t)sent.total);
    EXPECT_NE(sent.chunk_files.front().find("notes_part_01_of_"), std::string::npos);

    BatchReport rep = receive("");
    ASSERT_TRUE(rep.ok());
    EXPECT_EQ(testutil::read_file(dir.str("rebuilt/notes.txt")), content);
}

TEST_F(EndToEndTest, EncryptedRoundTrip) {
    const std::string content = sample_text();
    SendResult sent = send(content, true);
    ASSERT_TRUE(sent.ok);
    for (auto& f : sent.chunk_files) {
        EXPECT_NE(f.find("_encrypted_part_"), std::string::npos);
        EXPECT_EQ(testutil::read_file(f).find("record"), std::string::npos);
    }

    BatchReport rep = receive("password123");
    ASSERT_TRUE(rep.ok());
    EXPECT_TRUE(rep.files[0].encrypted);
    EXPECT_EQ(testutil::read_file(dir.str("rebuilt/notes.txt")), content);
}

TEST_F(EndToEndTest, EncryptedWithWrongPasswordWritesNothing) {
    ASSERT_TRUE(send(sample_text(), true).ok);
    BatchReport rep = receive("not-the-password");
    ASSERT_EQ(rep.files.size(), 1u);
    EXPECT_FALSE(rep.ok());
    EXPECT_FALSE(fs::exists(dir.str("rebuilt/notes.txt")));
}

TEST_F(EndToEndTest, EmptyFileTravelsAsOneChunk) {
    SendResult sent = send("", false, nullptr, "empty.txt");
    ASSERT_TRUE(sent.ok);
    EXPECT_EQ(sent.total, 1u);
    EXPECT_EQ(sent.file_hash, hash::sha256_hex(""));

    BatchReport rep = receive("");
    ASSERT_TRUE(rep.ok());
    EXPECT_TRUE(fs::exists(dir.str("rebuilt/empty.txt")));
    EXPECT_EQ(testutil::read_file(dir.str("rebuilt/empty.txt")), "");
}

TEST_F(EndToEndTest, BomIsStripped) {
    SendResult sent = send("\xEF\xBB\xBFhello\nworld\n", false);
    ASSERT_TRUE(sent.ok);
    EXPECT_EQ(sent.file_hash, hash::file_hash("hello\nworld\n"));
    ASSERT_TRUE(receive("").ok());
    EXPECT_EQ(testutil::read_file(dir.str("rebuilt/notes.txt")), "hello\nworld\n");
}

TEST_F(EndToEndTest, CapacityConfirmationDeclined) {
    testutil::write_file(dir.str("src/notes.txt"), sample_text());
    SenderOptions so;
    so.input_path = dir.str("src/notes.txt");
    so.config     = small_config(dir.str("chunks"));
    so.config.capacity_warning = 2;

    u32 asked_total = 0;
    SenderApp app(so);
    app.set_confirm([&asked_total](u32 total, u32 threshold) {
        asked_total = total;
        EXPECT_EQ(threshold, 2u);
        return false;
    });
    SendResult res = app.run();
    EXPECT_FALSE(res.ok);
    EXPECT_TRUE(res.declined);
    EXPECT_GT(asked_total, 2u);
    EXPECT_FALSE(fs::exists(dir.str("chunks")));

    so.force = true;
    SenderApp forced(so);
    EXPECT_TRUE(forced.run().ok);
}

TEST_F(EndToEndTest, BadRequestsRejectedUpFront) {
    SenderOptions so;
    so.input_path = dir.str("src/absent.txt");
    so.config     = small_config(dir.str("chunks"));
    EXPECT_THROW(SenderApp(so).run(), InputError);

    testutil::write_file(dir.str("src/notes.txt"), "x\n");
    so.input_path = dir.str("src/notes.txt");
    so.encrypt    = true;
    SenderApp no_password(so, &engine);
    EXPECT_THROW(no_password.run(), InputError);

    SenderApp weak(so, &engine);
    weak.set_password(crypto::Password(std::string("short")));
    EXPECT_THROW(weak.run(), InputError);

    ReceiverOptions ro;
    ro.inputs = {dir.str("nowhere")};
    EXPECT_THROW(ReceiverApp(ro).run(), InputError);
}

TEST_F(EndToEndTest, ImagesOnlyRoundTrip) {
    testutil::FakeSymbolCodec symbols;
    const std::string content = sample_text();
    SendResult sent = send(content, true, &symbols);
    ASSERT_TRUE(sent.ok);
    EXPECT_EQ(sent.image_files.size(), sent.chunk_files.size());
    EXPECT_EQ(symbols.encoded, (int)sent.total);
    EXPECT_EQ(symbols.last_options.error_correction, 'L');

    for (auto& f : sent.chunk_files) fs::remove(f);

    BatchReport rep = receive("password123", &symbols);
    ASSERT_TRUE(rep.ok());
    EXPECT_EQ(testutil::read_file(dir.str("rebuilt/notes.txt")), content);
}

TEST_F(EndToEndTest, ScanReportAndResavedChunks) {
    const std::string content = sample_text();
    SendResult sent = send(content, false);
    ASSERT_TRUE(sent.ok);
    fs::remove(sent.chunk_files[1]);

    ReceiverOptions ro;
    ro.inputs          = {dir.str("chunks")};
    ro.config          = small_config(dir.str("rebuilt"));
    ro.save_chunks_dir = dir.str("saved");
    ro.report_path     = dir.str("report.txt");
    ReceiverApp app(ro);
    BatchReport rep = app.run();

    ASSERT_EQ(rep.files.size(), 1u);
    EXPECT_EQ(rep.files[0].status, ReassemblyStatus::MISSING_PARTS);
    EXPECT_EQ(rep.files[0].missing, (std::vector<u32>{2}));
    EXPECT_EQ(count_entries(dir.str("saved")), (size_t)sent.total - 1);
    EXPECT_NE(testutil::read_file(dir.str("report.txt")).find("  missing: [2]\n"), std::string::npos);
    EXPECT_FALSE(fs::exists(dir.str("rebuilt/notes.txt")));
}

TEST_F(EndToEndTest, FailedPublishLeavesNothingBehind) {
    std::string content;
    for (int i = 0; i < 3; ++i) content += std::string(60, (char)('a' + i)) + "\n";
    // Occupy the second chunk's name so its rename fails
    fs::create_directories(dir.str("chunks/notes_part_02_of_03.txt"));

    testutil::write_file(dir.str("src/notes.txt"), content);
    SenderOptions so;
    so.input_path = dir.str("src/notes.txt");
    so.config     = small_config(dir.str("chunks"));
    SenderApp app(so);
    EXPECT_THROW(app.run(), std::runtime_error);

    EXPECT_FALSE(fs::exists(dir.str("chunks/notes_part_01_of_03.txt")));
    EXPECT_FALSE(fs::exists(dir.str("chunks/notes_part_03_of_03.txt")));
    EXPECT_EQ(count_entries(dir.str("chunks")), 1u);
}

TEST_F(EndToEndTest, SignalBindingReleasedWhenRunThrows) {
    SenderOptions so;
    so.input_path = dir.str("src/absent.txt");
    so.config     = small_config(dir.str("chunks"));
    SenderApp app(so);
    bool rejected = false;
    try {
        StopOnSignal on_signal(app);
        EXPECT_EQ(StopOnSignal::active(), &app);
        app.run();
    } catch (const InputError&) {
        rejected = true;
    }
    EXPECT_TRUE(rejected);
    EXPECT_EQ(StopOnSignal::active(), nullptr);
}
