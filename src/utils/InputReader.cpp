#include "InputReader.hpp"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include <LogCompat.hpp>
#include <array>
#include <fstream>
#include <system_error>

namespace InputReader {

absl::StatusOr<std::vector<uint8_t>> readFile(
    const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    // A missing path reports not_found with ec set; anything else is an error.
    if (ec && status.type() != std::filesystem::file_type::not_found) {
        return absl::InternalError(
            absl::StrCat(path.string(), ": ", ec.message()));
    }
    if (!std::filesystem::exists(status)) {
        return absl::NotFoundError(
            absl::StrCat(path.string(), ": No such file or directory"));
    }
    if (std::filesystem::is_directory(status)) {
        return absl::InvalidArgumentError(
            absl::StrCat(path.string(), ": Is a directory"));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return absl::InternalError(
            absl::StrCat(path.string(), ": Can't open file for reading"));
    }
    auto result = readStream(file);
    if (!result.ok()) {
        return absl::InternalError(
            absl::StrCat(path.string(), ": ", result.status().message()));
    }
    DLOG(INFO) << "Read " << result->size() << " bytes from " << path;
    return result;
}

absl::StatusOr<std::vector<uint8_t>> readStream(std::istream& stream) {
    constexpr std::size_t kChunkSize = 64 * 1024;
    std::vector<uint8_t> data;
    std::array<char, kChunkSize> chunk{};

    while (stream.read(chunk.data(), chunk.size()) || stream.gcount() > 0) {
        const auto* begin = reinterpret_cast<const uint8_t*>(chunk.data());
        data.insert(data.end(), begin, begin + stream.gcount());
        if (stream.eof()) {
            break;
        }
    }
    if (stream.bad()) {
        return absl::InternalError("Failed to read from stream");
    }
    return data;
}

}  // namespace InputReader
