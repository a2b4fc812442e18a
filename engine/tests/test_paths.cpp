#include "fsplit/paths.hpp"

#include <cassert>
#include <filesystem>

int main() {
    namespace fs = std::filesystem;
    auto base = fs::weakly_canonical(fs::temp_directory_path()) / "fsplit_paths_test";
    fs::remove_all(base);
    fs::create_directories(base / "sub");

    assert(fsplit::resolve_path("sub", base) == base / "sub");
    assert(fsplit::resolve_path("./sub/", base) == base / "sub");
    assert(fsplit::resolve_path("sub/../sub/./file.txt", base) == base / "sub" / "file.txt");
    assert(fsplit::resolve_path(base / "missing" / ".." / "sub", base) == base / "sub");
    assert(fsplit::resolve_path("not/there/yet.bin", base) == base / "not" / "there" / "yet.bin");
    assert(fsplit::resolve_path("/") == fs::path("/"));
    assert(fsplit::resolve_path("relative.txt").is_absolute());

    fs::create_directory_symlink(base / "sub", base / "link");
    assert(fsplit::resolve_path("link", base) == base / "sub");

    fs::remove_all(base);
    return 0;
}
