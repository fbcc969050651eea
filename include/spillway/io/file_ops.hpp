#pragma once

/** \file file_ops.hpp
 *  \brief Path-level file helpers used around the append pipeline.
 *
 * Errors are returned via std::expected with component "io.file".
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

#include "spillway/error.hpp"

namespace spillway::io {

/** Current length of the file; a missing file has length 0. */
auto file_length(const std::filesystem::path& p) -> std::expected<std::uint64_t, core::error>;

/** Opens an independent append handle and shrinks (or extends) the file to exactly length bytes. */
auto truncate_file(const std::filesystem::path& p, std::uint64_t length) -> std::expected<void, core::error>;

/** OS-level sync of the file's data through a separate read-only handle. */
auto fsync_path(const std::filesystem::path& p) -> std::expected<void, core::error>;

/** Reads exactly length bytes starting at offset; out_of_range if the file is shorter. */
auto read_range(const std::filesystem::path& p, std::uint64_t offset, std::uint64_t length)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace spillway::io
