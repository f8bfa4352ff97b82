// ============================================================
// sender/main.cpp -- qrcp sender entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/password_prompt.hpp"
#include "../common/utils.hpp"
#include "sender_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <file> [options]\n"
        << "       " << prog << " config show|reset [--config PATH]\n"
        << "       " << prog << " config sample <path>\n"
        << "\n"
        << "  file           text file to split into chunk files\n"
        << "\nOptions:\n"
        << "  --out DIR      output directory (default: config output_dir)\n"
        << "  --encrypt      encrypt every chunk (password is prompted twice)\n"
        << "  --force        do not ask when the chunk count exceeds capacity_warning\n"
        << "  --no-parallel  encode chunks sequentially\n"
        << "  --workers N    encoder threads (default: min(8, cores + 2))\n"
        << "  --config PATH  configuration file (default: " << ConfigStore::default_path() << ")\n"
        << "  --log FILE     also append log lines to FILE\n"
        << "  --verbose      enable debug logging\n"
        << "  --quiet        only warnings and errors\n"
        << "\nExample:\n"
        << "  " << prog << " notes.txt --out chunks --encrypt\n";
}

static int run_config_command(int argc, char* argv[]) {
    std::string sub = argc > 2 ? argv[2] : "";
    std::string config_path = ConfigStore::default_path();
    std::string sample_path;

    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (sub == "sample" && sample_path.empty() && argv[i][0] != '-') {
            sample_path = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    ConfigStore store(config_path);
    if (sub == "show") {
        Config cfg;
        bool found = store.load(cfg);
        std::cout << "# " << config_path << (found ? "" : " (not found, using defaults)") << "\n";
        std::cout << ConfigStore::dump(cfg);
        std::cout << "# chunk cap: " << cfg.chunk_cap(false) << " bytes plain, "
                  << cfg.chunk_cap(true) << " bytes encrypted\n";
        return 0;
    }
    if (sub == "reset") {
        store.reset();
        LOG_INFO("Configuration reset to defaults: " + config_path);
        return 0;
    }
    if (sub == "sample") {
        if (sample_path.empty()) {
            std::cerr << "ERROR: config sample needs a path\n";
            return 1;
        }
        file_io::write_file_atomic(sample_path, ConfigStore::sample());
        LOG_INFO("Sample configuration written to " + sample_path);
        return 0;
    }
    std::cerr << "Unknown config command: " << sub << "\n";
    print_usage(argv[0]);
    return 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    if (std::strcmp(argv[1], "config") == 0) {
        try {
            return run_config_command(argc, argv);
        } catch (const std::exception& e) {
            std::cerr << "FATAL: " << e.what() << "\n";
            return 2;
        }
    }

    SenderOptions opts;
    opts.input_path = argv[1];

    std::string config_path = ConfigStore::default_path();
    std::string out_dir, log_file;
    u32  workers = 0;
    bool workers_set = false;
    bool verbose = false, quiet = false;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--encrypt") == 0) {
            opts.encrypt = true;
        } else if (std::strcmp(argv[i], "--force") == 0) {
            opts.force = true;
        } else if (std::strcmp(argv[i], "--no-parallel") == 0) {
            opts.parallel = false;
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            if (!utils::parse_u32(argv[++i], workers) || workers < 1 || workers > 64) {
                std::cerr << "ERROR: --workers must be 1-64\n";
                return 1;
            }
            workers_set = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (verbose && quiet) {
        std::cerr << "ERROR: --verbose and --quiet are mutually exclusive\n";
        return 1;
    }
    Logger::get().set_level(verbose ? LogLevel::DEBUG : quiet ? LogLevel::WARN : LogLevel::INFO);

    try {
        ConfigStore store(config_path);
        store.load(opts.config);
        if (!out_dir.empty()) opts.config.output_dir = out_dir;
        if (workers_set) opts.config.max_workers = workers;

        if (log_file.empty()) log_file = opts.config.log_file;
        if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
            LOG_WARN("Cannot open log file " + log_file);
        }

        crypto::CryptoEngine engine;
        SenderApp app(opts, &engine, nullptr);
        if (opts.encrypt) {
            app.set_password(prompt::read_new_password(std::cin, std::cerr));
        }
        app.set_confirm([](u32 count, u32 threshold) {
            return prompt::confirm(std::to_string(count) + " chunks exceeds the warning threshold of " +
                                   std::to_string(threshold) + ". Continue?", std::cin, std::cerr);
        });

        StopOnSignal on_signal(app);
        SendResult res = app.run();
        return res.ok ? 0 : 1;
    } catch (const InputError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
