/**
 * @file file_source.hpp
 * @brief Seekable byte source reading a file on demand
 */

#pragma once

#include "dcmstream/io/byte_source.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

namespace dcmstream::io {

/**
 * @brief Seekable source backed by a binary std::ifstream
 *
 * Only the bytes actually requested are read, which is what makes lazy
 * element markers worthwhile for large pixel data.
 */
class file_source final : public seekable_source {
public:
    /**
     * @brief Open a file for reading
     * @return The source, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> Result<std::unique_ptr<file_source>>;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }

protected:
    auto do_read(std::span<uint8_t> buffer) -> Result<std::size_t> override;
    auto do_position() const -> Result<uint64_t> override;
    auto do_seek(uint64_t offset) -> VoidResult override;
    auto do_size() const -> Result<uint64_t> override;

private:
    file_source(std::filesystem::path path, std::ifstream stream, uint64_t size);

    std::filesystem::path path_;
    mutable std::ifstream stream_;
    uint64_t size_;
};

}  // namespace dcmstream::io
