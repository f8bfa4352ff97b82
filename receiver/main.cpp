// ============================================================
// receiver/main.cpp -- qrcp receiver entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/password_prompt.hpp"
#include "receiver_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <filesystem>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <chunks_dir|chunk_file>... [options]\n"
        << "\n"
        << "  chunks_dir     directory of *.txt chunk files (scanned or generated)\n"
        << "\nOptions:\n"
        << "  --out DIR          output directory (default: config output_dir)\n"
        << "  --suffix STR       insert STR before the extension of rebuilt files\n"
        << "  --verify-only      check every hash but do not write files\n"
        << "  --force            overwrite existing files without asking\n"
        << "  --save-chunks DIR  save every accepted record as a chunk file in DIR\n"
        << "  --report FILE      write a scan report to FILE\n"
        << "  --config PATH      configuration file (default: " << ConfigStore::default_path() << ")\n"
        << "  --log FILE         also append log lines to FILE\n"
        << "  --verbose          enable debug logging\n"
        << "  --quiet            only warnings and errors\n"
        << "\nExample:\n"
        << "  " << prog << " scanned_chunks --out restored\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    ReceiverOptions opts;
    std::string config_path = ConfigStore::default_path();
    std::string out_dir, log_file;
    bool verbose = false, quiet = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--suffix") == 0 && i + 1 < argc) {
            opts.suffix = argv[++i];
        } else if (std::strcmp(argv[i], "--verify-only") == 0) {
            opts.verify_only = true;
        } else if (std::strcmp(argv[i], "--force") == 0) {
            opts.overwrite = true;
        } else if (std::strcmp(argv[i], "--save-chunks") == 0 && i + 1 < argc) {
            opts.save_chunks_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--report") == 0 && i + 1 < argc) {
            opts.report_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            opts.inputs.push_back(argv[i]);
        }
    }

    if (opts.inputs.empty()) {
        print_usage(argv[0]);
        return 1;
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

        if (log_file.empty()) log_file = opts.config.log_file;
        if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
            LOG_WARN("Cannot open log file " + log_file);
        }
        if (!opts.verify_only) {
            std::error_code ec;
            std::filesystem::create_directories(opts.config.output_dir, ec);
            if (ec) LOG_WARN("Cannot create " + opts.config.output_dir + ": " + ec.message());
            Logger::get().set_integrity_log_dir(opts.config.output_dir);
        }

        crypto::CryptoEngine engine;
        ReceiverApp app(opts, &engine, nullptr);
        app.set_password_provider([](crypto::Password& out, int attempt) {
            std::string label = attempt > 1 ? "Password (attempt " + std::to_string(attempt) + "): "
                                            : "Password: ";
            try {
                out = prompt::read_password(label, std::cin, std::cerr);
            } catch (const InputError& e) {
                LOG_WARN(e.what());
                return false;
            }
            return true;
        });
        app.set_confirm_overwrite([](const std::string& path) {
            return prompt::confirm("File '" + path + "' exists. Overwrite?", std::cin, std::cerr);
        });

        BatchReport report = app.run();
        return report.ok() ? 0 : 1;
    } catch (const InputError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
