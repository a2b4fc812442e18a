#include "fsplit/directory_walker.hpp"
#include "fsplit/errors.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <vector>

namespace {

namespace fs = std::filesystem;

void touch(const fs::path &path) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << "x";
}

bool contains(const std::vector<fs::path> &paths, const fs::path &path) {
    return std::find(paths.begin(), paths.end(), path) != paths.end();
}

std::vector<fs::path> sorted(std::vector<fs::path> paths) {
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace

int main() {
    auto root = fs::weakly_canonical(fs::temp_directory_path()) / "fsplit_walker_test";
    fs::remove_all(root);
    fs::create_directories(root);

    touch(root / "a.txt");
    touch(root / "skip.txt");
    touch(root / "sub" / "b.bin");
    touch(root / "sub" / "deep" / "c.dat");
    touch(root / "sub" / "deep" / "skip-too.dat");
    touch(root / "stray.part");
    touch(root / "private" / "secret.txt");
    // An existing split directory.
    touch(root / "video" / "config.ini");
    touch(root / "video" / "video.mp4.0.part");
    touch(root / "video" / "notes.txt");
    fs::create_directories(root / "empty");

    fsplit::DirectoryWalker walker;
    auto all = walker.collect_splittable(root, {});
    assert(sorted(all) == sorted({root / "a.txt", root / "private" / "secret.txt", root / "skip.txt",
                                  root / "sub" / "b.bin", root / "sub" / "deep" / "c.dat",
                                  root / "sub" / "deep" / "skip-too.dat"}));
    // Breadth-first: files directly under the root come before nested ones.
    assert(all.front().parent_path() == root);
    assert(all.back().parent_path() == root / "sub" / "deep");

    // The same files, spelled differently.
    auto ignoring = walker.collect_splittable(
        root, {"./skip.txt", "sub/../sub/deep/skip-too.dat", root / "private"});
    assert(!contains(ignoring, root / "skip.txt"));
    assert(!contains(ignoring, root / "sub" / "deep" / "skip-too.dat"));
    assert(!contains(ignoring, root / "private" / "secret.txt"));
    assert(contains(ignoring, root / "a.txt"));
    assert(contains(ignoring, root / "sub" / "deep" / "c.dat"));
    assert(ignoring.size() == 3);

    auto resolved = fsplit::DirectoryWalker::resolve_ignore_list(root, {"sub/./deep/", "", root / "a.txt"});
    assert(resolved.count(root / "sub" / "deep") == 1);
    assert(resolved.count(root / "a.txt") == 1);
    assert(resolved.size() == 2);

    // Split directories: stop at the first descriptor on every branch.
    touch(root / "A" / "config.ini");
    touch(root / "A" / "B" / "config.ini");
    touch(root / "nested" / "C" / "config.ini");
    touch(root / "nested" / "D" / "file.txt");
    touch(root / "ignored" / "E" / "config.ini");
    auto dirs = walker.collect_split_directories(root, {"ignored"});
    assert(sorted(dirs) == sorted({root / "A", root / "nested" / "C", root / "video"}));
    assert(!contains(dirs, root / "A" / "B"));
    assert(!contains(dirs, root / "ignored" / "E"));
    auto with_ignored = walker.collect_split_directories(root, {});
    assert(contains(with_ignored, root / "ignored" / "E"));
    assert(!contains(with_ignored, root / "A" / "B"));

    assert(walker.collect_split_directories(root / "empty", {}).empty());
    assert(walker.collect_splittable(root / "empty", {}).empty());
    assert(walker.collect_split_directories(root / "A", {}) == std::vector<fs::path>({root / "A"}));

    bool threw = false;
    try {
        walker.collect_split_directories(root / "does-not-exist", {});
    } catch (const fsplit::Error &err) {
        threw = err.code() == fsplit::ErrorCode::MissingDirectory;
    }
    assert(threw);

    fs::remove_all(root);
    return 0;
}
