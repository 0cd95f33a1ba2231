#include "config/ConfigRegistry.hpp"
#include "files/FileManager.hpp"
#include "files/RetentionSweeper.hpp"
#include "files/errors.hpp"
#include "log/Registry.hpp"
#include "preview/pdf.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

using namespace fk;
namespace fs = std::filesystem;

namespace {

std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

constexpr const char* USAGE = R"(usage: filekeep [--config <path>] <command> [args...]

commands:
  upload <path> [--tag T]... [--by USER]   store a file
  download <id> <out>                      copy a ready file to <out>
  info <id>                                show one record
  list [--type T] [--status S] [--ext E] [--tag T]
  delete <id>                              delete a file and its derived assets
  tag <id> <tag>...                        add tags
  meta <id> <key>=<value>...               merge metadata
  stats                                    counts and sizes
  serve                                    run the retention sweeper until SIGINT/SIGTERM
)";

struct Args {
    std::optional<fs::path> config;
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;

    [[nodiscard]] std::optional<std::string> option(const std::string& key) const {
        for (const auto& [k, v] : options)
            if (k == key) return v;
        return std::nullopt;
    }

    [[nodiscard]] std::vector<std::string> all(const std::string& key) const {
        std::vector<std::string> out;
        for (const auto& [k, v] : options)
            if (k == key) out.push_back(v);
        return out;
    }
};

Args parseArgs(const int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.starts_with("--")) {
            std::string key = arg.substr(2), value;
            if (const auto eq = key.find('='); eq != std::string::npos) {
                value = key.substr(eq + 1);
                key.resize(eq);
            } else if (i + 1 < argc) value = argv[++i];
            else throw std::invalid_argument("Missing value for --" + key);

            if (key == "config") a.config = value;
            else a.options.emplace_back(key, value);
        } else if (a.command.empty()) a.command = arg;
        else a.positional.push_back(arg);
    }
    return a;
}

void requirePositional(const Args& a, const size_t n) {
    if (a.positional.size() < n)
        throw std::invalid_argument("'" + a.command + "' expects " + std::to_string(n) + " argument(s)");
}

void print(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

int upload(files::FileManager& fm, const Args& a) {
    requirePositional(a, 1);
    const fs::path src = a.positional[0];

    std::ifstream in(src, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open " + src.string());

    files::UploadOptions opts;
    opts.uploaded_by = a.option("by").value_or("");
    opts.tags = a.all("tag");
    std::error_code ec;
    if (const auto size = fs::file_size(src, ec); !ec) opts.expected_size = size;

    print(fm.uploadFile(in, src.filename().string(), nlohmann::json::object(), opts));
    return EXIT_SUCCESS;
}

int download(files::FileManager& fm, const Args& a) {
    requirePositional(a, 2);
    auto dl = fm.downloadFile(a.positional[0]);

    std::ofstream out(a.positional[1], std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write " + a.positional[1]);
    out << dl.stream->rdbuf();
    if (!out.good()) throw std::runtime_error("Failed writing " + a.positional[1]);

    print({{"id", dl.record.id}, {"written", a.positional[1]}, {"size_bytes", dl.record.size_bytes}});
    return EXIT_SUCCESS;
}

int info(const files::FileManager& fm, const Args& a) {
    requirePositional(a, 1);
    if (const auto rec = fm.getFileInfo(a.positional[0])) {
        print(*rec);
        return EXIT_SUCCESS;
    }
    if (const auto tomb = fm.getTombstone(a.positional[0])) {
        print(*tomb);
        return EXIT_SUCCESS;
    }
    throw files::NotFound("File not found: " + a.positional[0]);
}

int list(const files::FileManager& fm, const Args& a) {
    files::ListFilter filter;
    if (const auto t = a.option("type")) {
        filter.type = files::model::typeFromString(*t);
        if (!filter.type) throw std::invalid_argument("Unknown type: " + *t);
    }
    if (const auto s = a.option("status")) {
        filter.status = files::model::statusFromString(*s);
        if (!filter.status) throw std::invalid_argument("Unknown status: " + *s);
    }
    filter.extension = a.option("ext");
    filter.tag = a.option("tag");

    print(fm.listFiles(filter));
    return EXIT_SUCCESS;
}

int meta(files::FileManager& fm, const Args& a) {
    requirePositional(a, 2);
    nlohmann::json patch = nlohmann::json::object();
    for (size_t i = 1; i < a.positional.size(); ++i) {
        const auto& kv = a.positional[i];
        const auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) throw std::invalid_argument("Expected key=value, got: " + kv);
        patch[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    print(fm.updateMetadata(a.positional[0], patch));
    return EXIT_SUCCESS;
}

int serve(files::FileManager& fm) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const auto& cfg = fm.config();
    log::Registry::filekeep()->info("[*] Serving {}; sweeping every {}s, retention {} days",
                                    cfg.storage_dir.string(), cfg.cleanup_interval.count(), cfg.retention_days);

    // With a zero interval the manager runs no sweeper of its own; purge once at startup instead.
    if (cfg.cleanup_interval.count() == 0)
        files::RetentionSweeper(fm, std::chrono::hours(24), cfg.retention_days).sweepOnce();

    while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    log::Registry::filekeep()->info("[*] Signal received. Shutting down...");
    fm.shutdown();
    return EXIT_SUCCESS;
}

int run(files::FileManager& fm, const Args& a) {
    const auto& c = a.command;
    if (c == "upload") return upload(fm, a);
    if (c == "download") return download(fm, a);
    if (c == "info") return info(fm, a);
    if (c == "list") return list(fm, a);
    if (c == "delete") {
        requirePositional(a, 1);
        fm.deleteFile(a.positional[0]);
        print({{"deleted", a.positional[0]}});
        return EXIT_SUCCESS;
    }
    if (c == "tag") {
        requirePositional(a, 2);
        print(fm.addTags(a.positional[0], {a.positional.begin() + 1, a.positional.end()}));
        return EXIT_SUCCESS;
    }
    if (c == "meta") return meta(fm, a);
    if (c == "stats") {
        print(fm.getStats());
        return EXIT_SUCCESS;
    }
    if (c == "serve") return serve(fm);

    std::cerr << "Unknown command: " << c << "\n\n" << USAGE;
    return 2;
}

}

int main(const int argc, char** argv) {
    Args args;
    try {
        args = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n" << USAGE;
        return 2;
    }

    if (args.command.empty() || args.command == "help") {
        std::cout << USAGE;
        return args.command.empty() ? 2 : EXIT_SUCCESS;
    }

    try {
        config::ConfigRegistry::init(args.config.value_or(config::ConfigRegistry::defaultPath()));
        log::Registry::init(config::ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize filekeep: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    preview::pdf::initLibrary();

    int rc = EXIT_FAILURE;
    try {
        auto cfg = config::ConfigRegistry::get().file_manager;
        // One-shot commands leave sweeping to `serve`.
        if (args.command != "serve") cfg.cleanup_interval = std::chrono::seconds(0);

        files::FileManager fm(cfg);
        rc = run(fm, args);
    } catch (const std::exception& e) {
        const auto status = files::exitStatusFor(e);
        if (status.code == EXIT_FAILURE)
            log::Registry::filekeep()->error("[-] {} failed: {}", args.command, e.what());
        print({{"error", status.error}, {"message", e.what()}});
        rc = status.code;
    }

    preview::pdf::destroyLibrary();
    log::Registry::shutdown();
    return rc;
}
