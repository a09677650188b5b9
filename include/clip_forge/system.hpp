/**
 * @file system.hpp
 * @brief Naming, time and filesystem utilities
 *
 * @details Provides:
 *
 *          - Collision-resistant suffixes for generated files and tokens
 *
 *          - Wall-clock conversions (epoch milliseconds, ISO-8601)
 *
 *          - Time formatting for log output
 *
 *          - Byte-size queries that map errors to ClipError
 */

#ifndef CLIP_FORGE_SYSTEM_HPP
#define CLIP_FORGE_SYSTEM_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace clip_forge {

// **---- Naming ----**

/**
 * @brief Lowercase base-36 string of random digits.
 * @param length Number of characters
 * @note Seeded per thread from std::random_device. Not a cryptographic
 *       source; uniqueness comes from combining it with a timestamp.
 */
std::string random_base36(size_t length);

/**
 * @brief "<epoch-ms>-<random>" suffix used in generated file names.
 */
std::string unique_suffix();

/**
 * @brief Output path for a trim: `<dir>/<base>-trimmed-<suffix><ext>`.
 */
std::string trimmed_output_path(const std::string &source_path);

/**
 * @brief Output path for a merge: `<dir>/merged-<suffix>.raw`.
 */
std::string merged_output_path(const std::string &directory);

// **---- Time ----**

/**
 * @brief Milliseconds since the Unix epoch.
 */
int64_t to_epoch_ms(SystemClock::time_point tp);

/**
 * @brief Inverse of to_epoch_ms.
 */
SystemClock::time_point from_epoch_ms(int64_t ms);

/**
 * @brief Format a time point as `YYYY-MM-DDTHH:MM:SS.mmmZ` (UTC).
 */
std::string format_iso8601(SystemClock::time_point tp);

/**
 * @brief Format seconds as HH:MM:SS.mmm string.
 * @param seconds Time in seconds
 */
std::string format_time(double seconds);

// **---- Filesystem ----**

/**
 * @brief Size of a regular file in bytes.
 * @throws ClipError NotFound if the file does not exist, IOFailure if it
 *         cannot be queried
 */
uint64_t file_size_or_throw(const std::string &path);

} // namespace clip_forge

#endif // CLIP_FORGE_SYSTEM_HPP
