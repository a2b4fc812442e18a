#include "cli_args.hpp"

#include "fsplit/errors.hpp"
#include "fsplit/log_sink.hpp"
#include "fsplit/merger.hpp"
#include "fsplit/paths.hpp"
#include "fsplit/splitter.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

using fsplit::cli::UsageError;

constexpr int kExitHashMismatch = 2;

struct SplitCommand {
    std::filesystem::path file;
    fsplit::SplitOptions options;
    bool verbose = false;
};

struct MergeCommand {
    std::filesystem::path dir;
    fsplit::MergeOptions options;
    bool verbose = false;
};

void print_usage() {
    std::cerr << "Usage:\n"
                 "  filesplitter split --file <path> (--parts <n> | --chunk-size <bytes>) "
                 "[--remove] [--compress] [-v]\n"
                 "  filesplitter merge --dir <path> [--remove] [-v]\n";
}

SplitCommand parse_split(int argc, char **argv) {
    SplitCommand cmd;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--file" || arg == "-f") && i + 1 < argc) {
            cmd.file = argv[++i];
        } else if ((arg == "--parts" || arg == "-p") && i + 1 < argc) {
            cmd.options.parts = fsplit::cli::parse_count(arg, argv[++i]);
        } else if ((arg == "--chunk-size" || arg == "-cs") && i + 1 < argc) {
            cmd.options.chunk_size = fsplit::cli::parse_count(arg, argv[++i]);
        } else if (arg == "--remove" || arg == "-R") {
            cmd.options.remove_original = true;
        } else if (arg == "--compress") {
            cmd.options.compress = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cmd.verbose = true;
        } else {
            throw UsageError("unknown or incomplete option: " + arg);
        }
    }
    if (cmd.file.empty()) {
        throw UsageError("missing --file option");
    }
    fsplit::cli::require_one_of_parts_or_chunk_size(cmd.options.parts, cmd.options.chunk_size);
    return cmd;
}

MergeCommand parse_merge(int argc, char **argv) {
    MergeCommand cmd;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--dir" || arg == "-d") && i + 1 < argc) {
            cmd.dir = argv[++i];
        } else if (arg == "--remove" || arg == "-R") {
            cmd.options.remove_after = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cmd.verbose = true;
        } else {
            throw UsageError("unknown or incomplete option: " + arg);
        }
    }
    if (cmd.dir.empty()) {
        throw UsageError("missing --dir option");
    }
    return cmd;
}

int run_split(const SplitCommand &cmd) {
    fsplit::ConsoleLogSink log(cmd.verbose);
    fsplit::Splitter splitter(log);
    auto descriptor = splitter.split(cmd.file, cmd.options);
    std::cout << descriptor.original_name << ": " << descriptor.part_count() << " parts -> "
              << fsplit::Splitter::split_directory_for(fsplit::resolve_path(cmd.file)).string()
              << std::endl;
    return EXIT_SUCCESS;
}

int run_merge(const MergeCommand &cmd) {
    fsplit::ConsoleLogSink log(cmd.verbose);
    fsplit::Merger merger(log);
    auto result = merger.merge(cmd.dir, cmd.options);
    if (!result.ok) {
        std::cerr << "error: hash verification failed for " << result.target.string() << std::endl;
        return kExitHashMismatch;
    }
    std::cout << result.target.string() << ": " << result.verified_hash << std::endl;
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    std::string mode = argv[1];
    try {
        if (mode == "split") {
            return run_split(parse_split(argc - 2, argv + 2));
        }
        if (mode == "merge") {
            return run_merge(parse_merge(argc - 2, argv + 2));
        }
        if (mode == "--help" || mode == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        }
        throw UsageError("unknown mode: " + mode);
    } catch (const UsageError &err) {
        std::cerr << "error: " << err.what() << std::endl;
        print_usage();
        return EXIT_FAILURE;
    } catch (const fsplit::Error &err) {
        std::cerr << "error: " << fsplit::to_string(err.code()) << ": " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
