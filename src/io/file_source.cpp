/**
 * @file file_source.cpp
 * @brief File-backed seekable source
 */

#include "dcmstream/io/file_source.hpp"

#include <dcmstream/compat/format.hpp>

#include <system_error>

namespace dcmstream::io {

file_source::file_source(std::filesystem::path path, std::ifstream stream, uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

auto file_source::open(const std::filesystem::path& path)
    -> Result<std::unique_ptr<file_source>> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_stream_error<std::unique_ptr<file_source>>(
            error_codes::file_not_found, "File not found: " + path.string(), ec.message());
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return make_stream_error<std::unique_ptr<file_source>>(
            error_codes::file_read_error, "Failed to open file: " + path.string());
    }

    return Result<std::unique_ptr<file_source>>::ok(std::unique_ptr<file_source>(
        new file_source(path, std::move(stream), static_cast<uint64_t>(size))));
}

auto file_source::do_read(std::span<uint8_t> buffer) -> Result<std::size_t> {
    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    if (stream_.bad()) {
        return make_stream_error<std::size_t>(error_codes::file_read_error,
                                              "Failed to read file: " + path_.string());
    }
    const auto count = static_cast<std::size_t>(stream_.gcount());
    // A short read sets eof and fail; keep the stream usable for seeks.
    if (stream_.eof()) {
        stream_.clear();
    }
    return Result<std::size_t>::ok(count);
}

auto file_source::do_position() const -> Result<uint64_t> {
    const auto pos = stream_.tellg();
    if (pos < 0) {
        return make_stream_error<uint64_t>(error_codes::position_error,
                                           "Cannot query position in " + path_.string());
    }
    return Result<uint64_t>::ok(static_cast<uint64_t>(pos));
}

auto file_source::do_seek(uint64_t offset) -> VoidResult {
    if (offset > size_) {
        return make_stream_void_error(
            error_codes::seek_error,
            compat::format("Seek to {} beyond end of {}-byte file", offset, size_));
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_) {
        return make_stream_void_error(error_codes::seek_error,
                                      "Failed to seek in " + path_.string());
    }
    return ok();
}

auto file_source::do_size() const -> Result<uint64_t> {
    return Result<uint64_t>::ok(size_);
}

}  // namespace dcmstream::io
