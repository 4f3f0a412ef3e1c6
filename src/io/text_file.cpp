// =============================================================================
// docsan - Text File I/O Implementation
// =============================================================================

#include "docsan/io/text_file.h"

#include <fstream>
#include <iostream>
#include <iterator>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"
#include "docsan/io/atomic_file.h"

namespace docsan::io {

namespace {

template <typename Container>
Container readWholeFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw IOError(ErrorCode::kFileNotFound, "Input file not found: " + path.string());
    }
    if (std::filesystem::is_directory(path, ec)) {
        throw IOError("Input path is a directory: " + path.string(), ErrorContext(path.string()));
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw IOError("Failed to open input file", ErrorContext(path.string()));
    }

    Container data;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
        data.reserve(static_cast<std::size_t>(size));
    }
    data.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        throw IOError("Failed to read input file", ErrorContext(path.string()));
    }

    DOCSAN_LOG_DEBUG("Read {} bytes from {}", data.size(), path.string());
    return data;
}

}  // namespace

std::string readTextFile(const std::filesystem::path& path) {
    return readWholeFile<std::string>(path);
}

std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path& path) {
    return readWholeFile<std::vector<std::uint8_t>>(path);
}

void writeTextFile(const std::filesystem::path& path, std::string_view text, bool overwrite) {
    AtomicFileWriter writer(path, overwrite);
    writer.write(text);
    writer.commit();
}

void writeToStdout(std::string_view text) {
    std::cout.write(text.data(), static_cast<std::streamsize>(text.size()));
    std::cout.flush();
    if (!std::cout.good()) {
        throw IOError("Failed to write to stdout");
    }
}

std::filesystem::path derivePath(const std::filesystem::path& input, std::string_view suffix,
                                 std::string_view extension,
                                 const std::filesystem::path& outputDir) {
    std::filesystem::path dir = outputDir.empty() ? input.parent_path() : outputDir;
    std::string name = input.stem().string();
    name.append(suffix);
    name.append(extension);
    return dir / name;
}

}  // namespace docsan::io
