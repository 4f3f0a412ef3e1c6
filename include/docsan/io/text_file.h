// =============================================================================
// docsan - Text File I/O
// =============================================================================
// Whole-file reading and atomic writing of UTF-8 documents. Content is kept
// byte-for-byte: no newline translation, no BOM handling.
// =============================================================================

#ifndef DOCSAN_IO_TEXT_FILE_H
#define DOCSAN_IO_TEXT_FILE_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace docsan::io {

/// @brief Path that selects stdin/stdout.
inline constexpr std::string_view kStdStreamPath = "-";

/// @brief Read a whole file as bytes.
/// @throws IOError (kFileNotFound) if the file does not exist.
/// @throws IOError on read failure.
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

/// @brief Read a whole file as raw bytes.
[[nodiscard]] std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path& path);

/// @brief Write text atomically (temporary file + rename).
/// @param overwrite Allow replacing an existing file.
void writeTextFile(const std::filesystem::path& path, std::string_view text, bool overwrite);

/// @brief Write text to stdout and flush.
void writeToStdout(std::string_view text);

/// @brief "<dir>/<stem><suffix><ext>" derived from an input path.
/// @param outputDir Target directory; empty keeps the input's directory.
[[nodiscard]] std::filesystem::path derivePath(const std::filesystem::path& input,
                                               std::string_view suffix, std::string_view extension,
                                               const std::filesystem::path& outputDir = {});

}  // namespace docsan::io

#endif  // DOCSAN_IO_TEXT_FILE_H
