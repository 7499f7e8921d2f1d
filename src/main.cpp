#include "codec/capabilities.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/types.hpp"
#include "vfs/cpath.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <spdlog/spdlog.h>

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

struct CliOptions {
    std::string command;
    std::string path;
    std::string member;
    std::string encoding = "utf-8";
    bool binary = false;
    std::optional<kmp::fs::path> log_file;
    kmp::Config config;
};

void print_usage() {
    std::cout << "kompress v0.1.0\n"
              << "Read compressed files and archives as if they were plain "
                 "files\n\n"
              << "Usage:\n"
              << "  kompress [options] <command> <path> [member]\n\n"
              << "Commands:\n"
              << "  cat    Print the content of path (or of member inside it)\n"
              << "  ls     List a directory or an archive\n"
              << "  stat   Print exists / is_file / is_dir / size\n"
              << "  kind   Print the codec chosen for the file name\n\n"
              << "Options:\n"
              << "  --encoding <name>    Text encoding for cat (default: utf-8)\n"
              << "  --binary             Write raw decoded bytes for cat\n"
              << "  --disable <engines>  Comma list of engines to treat as "
                 "unavailable\n"
              << "  --log-level <level>  trace|debug|info|warn|error|off\n"
              << "  --log-file <path>    Also write the log to a file\n"
              << "  --help               Show this help message\n\n"
              << "Environment:\n"
              << "  " << kmp::kDisableEnginesEnv << ", " << kmp::kLogLevelEnv
              << "\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    options.config = kmp::load_config_from_env();

    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--encoding") == 0 && i + 1 < argc) {
            options.encoding = argv[++i];
        } else if (std::strcmp(argv[i], "--binary") == 0) {
            options.binary = true;
        } else if (std::strcmp(argv[i], "--disable") == 0 && i + 1 < argc) {
            for (auto& name : kmp::split_list(argv[++i])) {
                options.config.disabled_engines.push_back(std::move(name));
            }
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            auto level = kmp::parse_log_level(argv[++i]);
            if (!level) {
                std::cerr << "Invalid --log-level value: " << argv[i] << "\n";
                return std::nullopt;
            }
            options.config.log_level = level;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            options.log_file = kmp::fs::path(argv[++i]);
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return std::nullopt;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.size() < 2 || positional.size() > 3) {
        return std::nullopt;
    }
    options.command = positional[0];
    options.path = positional[1];
    if (positional.size() == 3) options.member = positional[2];
    return options;
}

int fail(const kmp::Error& error) {
    spdlog::error("{}: {}", kmp::to_string(error.kind), error.message);
    return kExitFailure;
}

int run_cat(const kmp::vfs::CPath& path, const CliOptions& options) {
    if (options.binary) {
        auto stream = path.open_binary();
        if (!stream) return fail(stream.error());

        char buffer[64 * 1024];
        while (true) {
            auto got = stream.value()->read(buffer, sizeof(buffer));
            if (!got) return fail(got.error());
            if (got.value() == 0) break;
            std::cout.write(buffer, static_cast<std::streamsize>(got.value()));
        }
        return 0;
    }

    auto text = path.open_text(options.encoding);
    if (!text) return fail(text.error());

    std::string line;
    while (true) {
        auto more = text.value().read_line(line);
        if (!more) return fail(more.error());
        if (!more.value()) break;
        std::cout << line;
        if (text.value().line_terminated()) std::cout << '\n';
    }
    return 0;
}

int run_ls(const kmp::vfs::CPath& path) {
    auto children = path.iterate_directory();
    if (!children) return fail(children.error());

    for (const auto& child : children.value()) {
        auto dir = child.is_dir();
        bool is_dir = dir && dir.value();
        std::cout << child.name() << (is_dir ? "/" : "") << '\n';
    }
    return 0;
}

int run_stat(const kmp::vfs::CPath& path) {
    auto info = path.stat();
    if (!info) return fail(info.error());

    const auto& stat = info.value();
    std::cout << "path:    " << path.string() << '\n'
              << "codec:   " << kmp::codec::to_string(path.codec()) << '\n'
              << "exists:  " << (stat.exists ? "yes" : "no") << '\n'
              << "is_file: " << (stat.is_file ? "yes" : "no") << '\n'
              << "is_dir:  " << (stat.is_dir ? "yes" : "no") << '\n'
              << "size:    "
              << (stat.size ? std::to_string(*stat.size) : "unknown") << '\n';
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return kExitUsage;
    }

    kmp::log::init(options->config.log_level.value_or(spdlog::level::warn),
                   options->log_file);
    kmp::codec::apply_config(options->config);

    kmp::vfs::CPath path = options->member.empty()
                               ? kmp::vfs::CPath(options->path)
                               : kmp::vfs::CPath(options->path, options->member);

    int status = kExitUsage;
    if (options->command == "cat") {
        status = run_cat(path, *options);
    } else if (options->command == "ls") {
        status = run_ls(path);
    } else if (options->command == "stat") {
        status = run_stat(path);
    } else if (options->command == "kind") {
        std::cout << kmp::codec::to_string(path.codec()) << '\n';
        status = 0;
    } else {
        std::cerr << "Unknown command: " << options->command << "\n";
        print_usage();
    }

    kmp::log::shutdown();
    return status;
}
