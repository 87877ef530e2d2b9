/**
 * @file file_utils.hpp
 * @brief Filesystem helpers shared by the scanner and the command line.
 */

#pragma once

#include "font_parser.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace FontGrep {

/**
 * @brief Check whether a path has a font-like extension.
 *
 * Matches .ttf .otf .ttc .otc .woff .woff2 .dfont .pfa .pfb .eot,
 * case-insensitively. Only the name is inspected; the file is not opened.
 */
bool isFontFile(const std::filesystem::path& path);

/**
 * @brief Read modification time and size of a regular file.
 * @throws IoError if the file cannot be stat'ed
 */
FileStamp readFileStamp(const std::filesystem::path& path);

/**
 * @brief Load the complete contents of a file.
 * @throws IoError if the file cannot be opened or read
 */
std::vector<uint8_t> readFileBytes(const std::filesystem::path& path);

/**
 * @brief Directory holding the cache database when none is given.
 *
 * $XDG_DATA_HOME/fontgrep, else $HOME/.local/share/fontgrep, else
 * /tmp/fontgrep. The directory is not created.
 */
std::filesystem::path defaultCacheDirectory();

} // namespace FontGrep
