/**
 * @file font_report.hpp
 * @brief Human-readable reports for single fonts and cache contents.
 */

#pragma once

#include "font_parser.hpp"
#include "result_sink.hpp"
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <set>
#include <string>

namespace FontGrep {

class MetadataStore;

/**
 * @brief Collapse codepoints into "U+0041-005A, U+20AC" style ranges.
 */
std::string formatCodepointRanges(const std::set<uint32_t>& codepoints);

/**
 * @brief Print the metadata of one font.
 *
 * Names and the variable flag are always printed. With detailed set the
 * axes, features, scripts, tables and charset follow, one line each. The
 * charset line forces the codepoint coverage to be computed.
 *
 * @par Example output:
 * @code
 * Names: DejaVu Sans, Book
 * Variable: false
 * Axes:
 * Features: kern, liga
 * Scripts: DFLT, latn
 * Tables: GPOS, GSUB, cmap, head
 * Charset: U+0020-007E, U+00A0-0180
 * @endcode
 */
void writeFontInfo(std::ostream& out, ParsedFont& font, bool detailed);

/**
 * @brief Emit every cached path in sorted order.
 * @return Number of emitted paths
 */
size_t listCachedFonts(MetadataStore& store, ResultSink& sink);

/**
 * @brief Database file addressed by a cache target.
 *
 * A directory names `<dir>/fontcache.db`, anything else is the file itself.
 *
 * @throws ConfigError if the database file does not exist
 */
std::filesystem::path existingDatabasePath(const std::filesystem::path& cacheTarget);

} // namespace FontGrep
