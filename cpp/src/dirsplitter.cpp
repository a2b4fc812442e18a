#include "cli_args.hpp"

#include "fsplit/batch_processor.hpp"
#include "fsplit/errors.hpp"
#include "fsplit/log_sink.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

using fsplit::cli::UsageError;

struct TreeCommand {
    std::string operation;
    std::filesystem::path dir;
    std::vector<std::filesystem::path> ignore;
    fsplit::SplitOptions split;
    fsplit::MergeOptions merge;
    bool verbose = false;
};

void print_usage() {
    std::cerr << "Usage:\n"
                 "  dirsplitter split --dir <root> (--parts <n> | --chunk-size <bytes>) "
                 "[--remove] [--compress] [--ignore <file>]... [-v]\n"
                 "  dirsplitter merge --dir <root> [--remove] [--ignore <dir>]... [-v]\n"
                 "Relative --ignore paths are resolved against --dir.\n";
}

TreeCommand parse_tree(const std::string &operation, int argc, char **argv) {
    TreeCommand cmd;
    cmd.operation = operation;
    const bool splitting = operation == "split";
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--dir" || arg == "-d") && i + 1 < argc) {
            cmd.dir = argv[++i];
        } else if ((arg == "--ignore" || arg == "-i") && i + 1 < argc) {
            cmd.ignore.emplace_back(argv[++i]);
        } else if (splitting && (arg == "--parts" || arg == "-p") && i + 1 < argc) {
            cmd.split.parts = fsplit::cli::parse_count(arg, argv[++i]);
        } else if (splitting && (arg == "--chunk-size" || arg == "-cs") && i + 1 < argc) {
            cmd.split.chunk_size = fsplit::cli::parse_count(arg, argv[++i]);
        } else if (splitting && arg == "--compress") {
            cmd.split.compress = true;
        } else if (arg == "--remove" || arg == "-R") {
            cmd.split.remove_original = true;
            cmd.merge.remove_after = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cmd.verbose = true;
        } else {
            throw UsageError("unknown or incomplete option: " + arg);
        }
    }
    if (cmd.dir.empty()) {
        throw UsageError("missing --dir option");
    }
    if (splitting) {
        fsplit::cli::require_one_of_parts_or_chunk_size(cmd.split.parts, cmd.split.chunk_size);
    }
    return cmd;
}

int run_tree(const TreeCommand &cmd) {
    fsplit::ConsoleLogSink log(cmd.verbose);
    fsplit::BatchProcessor processor(log);
    auto report = cmd.operation == "split" ? processor.split_tree(cmd.dir, cmd.ignore, cmd.split)
                                           : processor.merge_tree(cmd.dir, cmd.ignore, cmd.merge);
    std::cout << cmd.operation << ": " << report.succeeded.size() << " succeeded, "
              << report.failed.size() << " failed" << std::endl;
    for (const auto &failure : report.failed) {
        std::cerr << "  " << failure.path.string() << " (" << fsplit::to_string(failure.code)
                  << ")" << std::endl;
    }
    return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    std::string mode = argv[1];
    try {
        if (mode == "split" || mode == "merge") {
            return run_tree(parse_tree(mode, argc - 2, argv + 2));
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
