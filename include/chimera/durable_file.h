/**
 * @file durable_file.h
 * @brief Crash-safe whole-file I/O shared by the JSON stores
 */

#ifndef CHIMERA_DURABLE_FILE_H
#define CHIMERA_DURABLE_FILE_H

#include "chimera/logger.h"

#include <optional>
#include <string>

namespace chimera {

/**
 * @brief Replace path with content
 *
 * Writes <path>.tmp, fsyncs it and renames it over path, then syncs the
 * containing directory. A failed directory sync is only logged; the file
 * is already in place.
 *
 * @throws StorageError if any step up to the rename fails; path is left
 *         as it was
 */
void replaceFileDurably(const std::string& path, const std::string& content, Logger& logger);

/**
 * @brief Read a whole file
 * @return nullopt if path does not exist
 * @throws StorageError if it exists but cannot be read
 */
std::optional<std::string> readWholeFile(const std::string& path);

} // namespace chimera

#endif // CHIMERA_DURABLE_FILE_H
