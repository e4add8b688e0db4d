/**
 * @file istream_source.cpp
 * @brief Sequential std::istream source
 */

#include "dcmstream/io/istream_source.hpp"

namespace dcmstream::io {

auto istream_source::do_read(std::span<uint8_t> buffer) -> Result<std::size_t> {
    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    if (stream_.bad()) {
        return make_stream_error<std::size_t>(error_codes::file_read_error,
                                              "Input stream read failed");
    }
    const auto count = static_cast<std::size_t>(stream_.gcount());
    consumed_ += count;
    return Result<std::size_t>::ok(count);
}

auto istream_source::do_position() const -> Result<uint64_t> {
    return Result<uint64_t>::ok(consumed_);
}

auto istream_source::do_at_end() -> Result<bool> {
    if (stream_.bad()) {
        return make_stream_error<bool>(error_codes::file_read_error,
                                       "Input stream is in a bad state");
    }
    if (!stream_.good()) {
        return Result<bool>::ok(true);
    }
    return Result<bool>::ok(stream_.peek() == std::istream::traits_type::eof());
}

}  // namespace dcmstream::io
