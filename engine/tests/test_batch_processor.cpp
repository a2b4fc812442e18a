#include "fsplit/batch_processor.hpp"
#include "fsplit/descriptor.hpp"
#include "fsplit/errors.hpp"
#include "fsplit/log_sink.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace fs = std::filesystem;

class RecordingLogSink : public fsplit::LogSink {
  public:
    void emit(fsplit::LogLevel level, const std::string &message) override {
        messages_.emplace_back(level, message);
    }

    std::size_t count(fsplit::LogLevel level) const {
        return static_cast<std::size_t>(std::count_if(
            messages_.begin(), messages_.end(), [&](const auto &entry) { return entry.first == level; }));
    }

  private:
    std::vector<std::pair<fsplit::LogLevel, std::string>> messages_;
};

std::string contents_for(const std::string &name, std::size_t lines) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < lines; ++i) {
        oss << name << " line " << i << '\n';
    }
    return oss.str();
}

void write_text(const fs::path &path, const std::string &text) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << text;
}

std::string read_text(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    auto root = fs::weakly_canonical(fs::temp_directory_path()) / "fsplit_batch_test";
    fs::remove_all(root);

    const auto alpha = contents_for("alpha", 300);
    const auto beta = contents_for("beta", 50);
    const auto gamma = contents_for("gamma", 1000);
    write_text(root / "alpha.txt", alpha);
    write_text(root / "docs" / "beta.md", beta);
    write_text(root / "docs" / "deep" / "gamma.log", gamma);
    write_text(root / "keep" / "untouched.txt", "leave me");

    RecordingLogSink log;
    fsplit::BatchProcessor processor(log);

    fsplit::SplitOptions split;
    split.chunk_size = 1024;
    split.compress = true;
    split.remove_original = true;
    auto split_report = processor.split_tree(root, {"keep"}, split);
    assert(split_report.ok());
    assert(split_report.succeeded.size() == 3);
    assert(!fs::exists(root / "alpha.txt"));
    assert(fsplit::has_descriptor(root / "alpha"));
    assert(fsplit::has_descriptor(root / "docs" / "beta"));
    assert(fsplit::has_descriptor(root / "docs" / "deep" / "gamma"));
    assert(fs::exists(root / "keep" / "untouched.txt"));
    assert(!fs::exists(root / "keep" / "untouched"));

    // Splitting again only sees the ignored file; split directories are skipped.
    auto second = processor.split_tree(root, {}, split);
    assert(second.ok());
    assert(second.succeeded == std::vector<fs::path>({root / "keep" / "untouched.txt"}));
    fsplit::MergeOptions keep_parts;
    auto undo = processor.merge_tree(root / "keep", {}, keep_parts);
    assert(undo.ok());
    assert(read_text(root / "keep" / "untouched.txt") == "leave me");
    fs::remove_all(root / "keep" / "untouched");

    // One damaged directory does not stop the others.
    auto part = root / "docs" / "beta" / "beta.md.0.part";
    assert(fs::exists(part));
    write_text(part, "not a zlib stream");
    fs::remove(root / "alpha" / "alpha.txt.1.part");

    fsplit::MergeOptions merge;
    merge.remove_after = true;
    auto merge_report = processor.merge_tree(root, {}, merge);
    assert(!merge_report.ok());
    assert(merge_report.succeeded == std::vector<fs::path>({root / "docs" / "deep" / "gamma"}));
    assert(merge_report.failed.size() == 2);
    for (const auto &failure : merge_report.failed) {
        assert(failure.code == fsplit::ErrorCode::PartReadError);
        assert(failure.path == root / "alpha" || failure.path == root / "docs" / "beta");
    }
    assert(log.count(fsplit::LogLevel::Error) >= 2);
    assert(read_text(root / "docs" / "deep" / "gamma.log") == gamma);
    assert(!fs::exists(root / "docs" / "deep" / "gamma"));
    assert(fsplit::has_descriptor(root / "alpha"));
    assert(fsplit::has_descriptor(root / "docs" / "beta"));

    // Hash mismatches are reported per directory as well.
    write_text(root / "solo.bin", contents_for("solo", 20));
    fsplit::SplitOptions plain;
    plain.parts = 2;
    assert(processor.split_tree(root, {"alpha.txt", "docs"}, plain).ok());
    auto solo_part = root / "solo" / "solo.bin.0.part";
    auto bytes = read_text(solo_part);
    bytes[0] = bytes[0] == 'X' ? 'Y' : 'X';
    write_text(solo_part, bytes);
    auto mismatch = processor.merge_tree(root, {"alpha", "docs"}, fsplit::MergeOptions{});
    assert(mismatch.failed.size() == 1);
    assert(mismatch.failed.front().code == fsplit::ErrorCode::HashMismatch);
    assert(fs::exists(root / "solo.bin"));

    // Two files sharing a stem: the second one must not clobber the first split.
    const auto clash = root / "clash";
    const auto txt = contents_for("txt", 40);
    const auto csv = contents_for("csv", 60);
    write_text(clash / "a.txt", txt);
    write_text(clash / "a.csv", csv);
    auto clash_report = processor.split_tree(clash, {}, split);
    assert(clash_report.succeeded.size() == 1);
    assert(clash_report.failed.size() == 1);
    assert(clash_report.failed.front().code == fsplit::ErrorCode::InvalidArguments);
    const auto kept = clash_report.failed.front().path;
    assert(fs::exists(kept));
    assert(!fs::exists(clash_report.succeeded.front()));
    assert(processor.merge_tree(clash, {}, merge).ok());
    assert(read_text(clash / "a.txt") == txt);
    assert(read_text(clash / "a.csv") == csv);
    assert(!fs::exists(clash / "a"));

    // Failures outside the library's own error type are still recorded per item.
    write_text(root / "huge" / "one.txt", contents_for("one", 5));
    fsplit::SplitOptions huge;
    huge.parts = std::numeric_limits<std::uint64_t>::max() / 2;
    auto huge_report = processor.split_tree(root / "huge", {}, huge);
    assert(huge_report.succeeded.empty());
    assert(huge_report.failed.size() == 1);
    assert(huge_report.failed.front().code == fsplit::ErrorCode::IoError);
    assert(fs::exists(root / "huge" / "one.txt"));
    assert(!fs::exists(root / "huge" / "one"));

    bool threw = false;
    try {
        processor.split_tree(root, {}, fsplit::SplitOptions{});
    } catch (const fsplit::Error &err) {
        threw = err.code() == fsplit::ErrorCode::InvalidArguments;
    }
    assert(threw);

    fs::remove_all(root);
    return 0;
}
