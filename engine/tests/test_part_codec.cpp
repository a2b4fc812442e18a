#include "fsplit/errors.hpp"
#include "fsplit/part_codec.hpp"

#include <algorithm>
#include <cassert>
#include <sstream>
#include <string>
#include <vector>

namespace {

bool is_part_read_error(const std::vector<char> &compressed) {
    try {
        fsplit::PartCodec::decompress(compressed);
    } catch (const fsplit::Error &err) {
        return err.code() == fsplit::ErrorCode::PartReadError;
    }
    return false;
}

} // namespace

int main() {
    std::vector<char> data;
    for (int i = 0; i < 200000; ++i) {
        data.push_back(static_cast<char>('a' + (i % 7)));
    }
    auto compressed = fsplit::PartCodec::compress(data);
    assert(!compressed.empty());
    assert(compressed != data);
    assert(compressed.size() < data.size());
    assert(fsplit::PartCodec::decompress(compressed) == data);

    auto empty = fsplit::PartCodec::compress({});
    assert(!empty.empty());
    assert(fsplit::PartCodec::decompress(empty).empty());

    // Feeding the stream in small pieces gives the same result.
    std::ostringstream out;
    fsplit::PartCodec::Inflater inflater;
    for (std::size_t offset = 0; offset < compressed.size(); offset += 5) {
        auto size = std::min<std::size_t>(5, compressed.size() - offset);
        inflater.update(compressed.data() + offset, size, out);
    }
    inflater.finish();
    assert(inflater.finished());
    auto streamed = out.str();
    assert(std::vector<char>(streamed.begin(), streamed.end()) == data);

    auto truncated = compressed;
    truncated.resize(truncated.size() / 2);
    assert(is_part_read_error(truncated));

    auto trailing = compressed;
    trailing.push_back('x');
    assert(is_part_read_error(trailing));

    std::vector<char> garbage(64, '\x5a');
    assert(is_part_read_error(garbage));
    return 0;
}
