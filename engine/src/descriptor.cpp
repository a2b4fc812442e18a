#include "fsplit/descriptor.hpp"

#include "fsplit/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>

namespace fsplit {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string &value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

[[noreturn]] void malformed(const std::string &what) {
    throw Error(ErrorCode::MissingDescriptor, "malformed descriptor: " + what);
}

using Section = std::map<std::string, std::string>;
using Document = std::map<std::string, Section>;

Document parse_ini(std::istream &in) {
    Document document;
    Section *current = nullptr;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        auto text = trim(line);
        if (text.empty() || text[0] == '#' || text[0] == ';') {
            continue;
        }
        if (text.front() == '[') {
            if (text.back() != ']') {
                malformed("bad section header on line " + std::to_string(line_number));
            }
            current = &document[lower(trim(text.substr(1, text.size() - 2)))];
            continue;
        }
        const auto separator = text.find_first_of("=:");
        if (separator == std::string::npos || current == nullptr) {
            malformed("unexpected line " + std::to_string(line_number));
        }
        (*current)[lower(trim(text.substr(0, separator)))] = trim(text.substr(separator + 1));
    }
    if (in.bad()) {
        throw Error(ErrorCode::MissingDescriptor, "failed to read descriptor");
    }
    return document;
}

const std::string &require(const Document &document, const std::string &section,
                           const std::string &key) {
    auto section_it = document.find(section);
    if (section_it == document.end()) {
        malformed("missing section [" + section + "]");
    }
    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        malformed("missing key '" + key + "' in [" + section + "]");
    }
    return key_it->second;
}

std::optional<std::uint64_t> parse_unsigned(const std::string &text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

std::uint64_t require_unsigned(const Document &document, const std::string &section,
                               const std::string &key) {
    const auto &text = require(document, section, key);
    auto value = parse_unsigned(text);
    if (!value) {
        malformed("'" + key + "' is not a non-negative integer: " + text);
    }
    return *value;
}

bool parse_flag(const std::string &text) {
    const auto value = lower(text);
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    malformed("'compress' is not a boolean: " + text);
}

} // namespace

std::string part_file_name(const std::string &original_name, std::size_t index) {
    return original_name + "." + std::to_string(index) + part_file_suffix;
}

bool is_part_file_of(const std::string &file_name, const std::string &original_name) {
    const std::string prefix = original_name + ".";
    const std::string suffix = part_file_suffix;
    if (file_name.size() <= prefix.size() + suffix.size() ||
        file_name.compare(0, prefix.size(), prefix) != 0 ||
        file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    const auto index = file_name.substr(prefix.size(), file_name.size() - prefix.size() - suffix.size());
    return std::all_of(index.begin(), index.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool has_descriptor(const fs::path &directory) {
    std::error_code ec;
    return fs::is_regular_file(directory / descriptor_file_name, ec);
}

void write_descriptor(std::ostream &out, const SplitDescriptor &descriptor) {
    out << "[ORIGINAL]\n"
        << "filename = " << descriptor.original_name << '\n'
        << "size = " << descriptor.original_size << '\n'
        << "hash = " << descriptor.original_hash << "\n\n"
        << "[OPERATION]\n"
        << "compress = " << (descriptor.compressed ? "true" : "false") << "\n\n"
        << "[PARTS]\n"
        << "parts = " << descriptor.parts.size() << '\n';
    for (std::size_t i = 0; i < descriptor.parts.size(); ++i) {
        out << i << " = " << descriptor.parts[i] << '\n';
    }
}

SplitDescriptor parse_descriptor(std::istream &in) {
    const auto document = parse_ini(in);

    SplitDescriptor descriptor;
    descriptor.original_name = require(document, "original", "filename");
    if (descriptor.original_name.empty() ||
        fs::path(descriptor.original_name).filename().string() != descriptor.original_name) {
        malformed("'filename' must be a bare file name: " + descriptor.original_name);
    }
    descriptor.original_size = require_unsigned(document, "original", "size");
    descriptor.original_hash = lower(require(document, "original", "hash"));
    descriptor.compressed = parse_flag(require(document, "operation", "compress"));

    const auto count = require_unsigned(document, "parts", "parts");
    const auto &section = document.at("parts");
    if (section.size() != count + 1) {
        malformed("[PARTS] declares " + std::to_string(count) + " parts but lists " +
                  std::to_string(section.size() - 1));
    }
    descriptor.parts.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t index = 0; index < count; ++index) {
        auto it = section.find(std::to_string(index));
        if (it == section.end() || it->second.empty()) {
            malformed("missing part index " + std::to_string(index));
        }
        descriptor.parts.push_back(it->second);
    }
    return descriptor;
}

void save_descriptor(const fs::path &directory, const SplitDescriptor &descriptor) {
    const auto final_path = directory / descriptor_file_name;
    auto temp_path = final_path;
    temp_path += descriptor_temp_suffix;
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out) {
            throw Error(ErrorCode::IoError, "failed to create descriptor: " + temp_path.string());
        }
        write_descriptor(out, descriptor);
        out.flush();
        if (!out) {
            throw Error(ErrorCode::IoError, "failed to write descriptor: " + temp_path.string());
        }
    }
    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(temp_path, ec);
        throw Error(ErrorCode::IoError,
                    "failed to move descriptor into place: " + final_path.string() + ": " + reason);
    }
}

SplitDescriptor load_descriptor(const fs::path &directory) {
    const auto path = directory / descriptor_file_name;
    if (!has_descriptor(directory)) {
        throw Error(ErrorCode::MissingDescriptor, "no descriptor in " + directory.string());
    }
    std::ifstream in(path);
    if (!in) {
        throw Error(ErrorCode::MissingDescriptor, "cannot open descriptor: " + path.string());
    }
    return parse_descriptor(in);
}

} // namespace fsplit
