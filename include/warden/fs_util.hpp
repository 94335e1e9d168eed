#pragma once

#include "types.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace warden::fs
{

    /**
     * Write `contents` to `path` through a temporary sibling and rename, so
     * readers see either the old or the new file. Parent directories are created.
     */
    Result<void> atomic_write_file(const std::filesystem::path &path, const std::string &contents);

    /** Whole file as a string; NotFound when it does not exist. */
    Result<std::string> read_file(const std::filesystem::path &path);

    /** `path` with ".N" appended, e.g. daemon.log.2 */
    std::filesystem::path numbered(const std::filesystem::path &path, std::size_t index);

    /**
     * Shift path.(max_files-1) -> path.max_files, ..., path -> path.1.
     * Whatever sat at path.max_files is discarded.
     */
    Result<void> rotate_numbered(const std::filesystem::path &path, std::size_t max_files);

} // namespace warden::fs
