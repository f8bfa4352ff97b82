#include <gtest/gtest.h>
#include "common/config.hpp"
#include "common/errors.hpp"
#include "test_util.hpp"
#include <cstdlib>

TEST(Config, DefaultCaps) {
    Config cfg;
    EXPECT_EQ(cfg.plain_cap(), 2362u);
    EXPECT_EQ(cfg.chunk_cap(false), 2362u);
    EXPECT_EQ(cfg.chunk_cap(true), 1721u);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(Config, EncryptedCapHasFloor) {
    Config cfg;
    cfg.max_symbol_bytes = 100;
    cfg.safety_margin    = 0.5;
    EXPECT_EQ(cfg.plain_cap(), 50u);
    EXPECT_EQ(cfg.chunk_cap(true), (size_t)MIN_ENCRYPTED_CAP);
}

TEST(Config, ValidateRejectsBadValues) {
    Config cfg;
    cfg.safety_margin = 0.0;
    EXPECT_THROW(cfg.validate(), InputError);
    cfg = Config();
    cfg.safety_margin = 1.5;
    EXPECT_THROW(cfg.validate(), InputError);
    cfg = Config();
    cfg.max_symbol_bytes = 10;
    EXPECT_THROW(cfg.validate(), InputError);
    cfg = Config();
    cfg.error_correction = 'X';
    EXPECT_THROW(cfg.validate(), InputError);
    cfg = Config();
    cfg.box_size = 0;
    EXPECT_THROW(cfg.validate(), InputError);
}

TEST(ConfigStore, ApplyKeepsConfigOnRejection) {
    Config cfg;
    EXPECT_TRUE(ConfigStore::apply(cfg, "error_correction", "q"));
    EXPECT_EQ(cfg.error_correction, 'Q');
    EXPECT_FALSE(ConfigStore::apply(cfg, "error_correction", "X"));
    EXPECT_EQ(cfg.error_correction, 'Q');
    EXPECT_FALSE(ConfigStore::apply(cfg, "safety_margin", "lots"));
    EXPECT_DOUBLE_EQ(cfg.safety_margin, DEFAULT_SAFETY_MARGIN);
    EXPECT_FALSE(ConfigStore::apply(cfg, "max_workers", "-2"));
    EXPECT_EQ(cfg.max_workers, 0u);
    EXPECT_FALSE(ConfigStore::apply(cfg, "no_such_key", "1"));
}

TEST(ConfigStore, LoadSkipsUnknownAndMalformedLines) {
    testutil::TempDir dir;
    testutil::write_file(dir.str("config"),
        "# comment\n"
        "\n"
        "max_symbol_bytes 1000\n"
        "colour blue\n"
        "safety_margin 7\n"
        "  capacity_warning   25  \n"
        "border\n");

    Config cfg;
    ConfigStore store(dir.str("config"));
    ASSERT_TRUE(store.load(cfg));
    EXPECT_EQ(cfg.max_symbol_bytes, 1000u);
    EXPECT_DOUBLE_EQ(cfg.safety_margin, DEFAULT_SAFETY_MARGIN);
    EXPECT_EQ(cfg.capacity_warning, 25u);
    EXPECT_EQ(cfg.border, 4u);
}

TEST(ConfigStore, MissingFileLeavesDefaults) {
    testutil::TempDir dir;
    Config cfg;
    EXPECT_FALSE(ConfigStore(dir.str("absent")).load(cfg));
    EXPECT_EQ(cfg.max_symbol_bytes, DEFAULT_MAX_SYMBOL_BYTES);
}

TEST(ConfigStore, SaveLoadRoundTrip) {
    testutil::TempDir dir;
    ConfigStore store(dir.str("qrcp/config"));

    Config cfg;
    cfg.max_symbol_bytes   = 1200;
    cfg.safety_margin      = 0.75;
    cfg.parallel_threshold = 10;
    cfg.max_workers        = 3;
    cfg.error_correction   = 'M';
    cfg.output_dir         = "/tmp/out dir";
    cfg.log_file           = "qrcp.log";
    store.save(cfg);

    Config back;
    ASSERT_TRUE(store.load(back));
    EXPECT_EQ(ConfigStore::dump(back), ConfigStore::dump(cfg));
    EXPECT_EQ(back.output_dir, "/tmp/out dir");

    Config fresh = store.reset();
    Config after_reset;
    ASSERT_TRUE(store.load(after_reset));
    EXPECT_EQ(ConfigStore::dump(after_reset), ConfigStore::dump(fresh));
    EXPECT_EQ(after_reset.max_symbol_bytes, DEFAULT_MAX_SYMBOL_BYTES);
}

TEST(ConfigStore, SampleParsesToDefaults) {
    testutil::TempDir dir;
    testutil::write_file(dir.str("sample"), ConfigStore::sample());
    Config cfg;
    cfg.max_symbol_bytes = 500;
    ASSERT_TRUE(ConfigStore(dir.str("sample")).load(cfg));
    EXPECT_EQ(ConfigStore::dump(cfg), ConfigStore::dump(Config()));
}

TEST(ConfigStore, DefaultPathHonoursXdg) {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old ? old : "";

    setenv("XDG_CONFIG_HOME", "/xdg/home", 1);
    EXPECT_EQ(ConfigStore::default_path(), "/xdg/home/qrcp/config");

    if (old) setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else unsetenv("XDG_CONFIG_HOME");
}
