#pragma once

#include <HashCoreUtilsExports.h>
#include <absl/status/statusor.h>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <vector>

namespace InputReader {

/**
 * readFile - Reads a whole file in binary mode.
 *
 * @param path file to read
 * @return the file contents, or
 *         - NotFoundError if path does not exist
 *         - InvalidArgumentError if path is a directory
 *         - InternalError if opening or reading fails
 */
HashCoreUtils_API absl::StatusOr<std::vector<uint8_t>> readFile(
    const std::filesystem::path& path);

/**
 * readStream - Reads a stream until EOF.
 *
 * @param stream source stream, e.g. std::cin
 * @return the bytes read, or InternalError if the stream went bad
 */
HashCoreUtils_API absl::StatusOr<std::vector<uint8_t>> readStream(
    std::istream& stream);

}  // namespace InputReader
