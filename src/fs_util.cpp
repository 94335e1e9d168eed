#include "warden/fs_util.hpp"
#include <atomic>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace warden::fs
{

    namespace
    {
        std::atomic<std::uint64_t> g_temp_sequence{0};
    } // namespace

    Result<void> atomic_write_file(const std::filesystem::path &path, const std::string &contents)
    {
        std::error_code ec;
        const auto parent = path.parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                return std::unexpected(WardenError::io(
                    std::format("Failed to create {}: {}", parent.string(), ec.message())));
            }
        }

        auto tmp = path;
        // Unique per call so concurrent writers never share a temp file
        tmp += std::format(".tmp.{}.{}", static_cast<int>(::getpid()), g_temp_sequence.fetch_add(1));
        {
            std::ofstream out(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
            if (!out.is_open())
            {
                return std::unexpected(WardenError::io("Unable to open " + tmp.string()));
            }
            out << contents;
            out.flush();
            if (!out)
            {
                out.close();
                std::filesystem::remove(tmp, ec);
                return std::unexpected(WardenError::io("Failed to write " + tmp.string()));
            }
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec)
        {
            std::error_code cleanup;
            std::filesystem::remove(tmp, cleanup);
            return std::unexpected(WardenError::io(
                std::format("Failed to rename {} into place: {}", path.string(), ec.message())));
        }
        return {};
    }

    Result<std::string> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
                return std::unexpected(WardenError::not_found("No such file: " + path.string()));
            return std::unexpected(WardenError::io("Unable to open " + path.string()));
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::filesystem::path numbered(const std::filesystem::path &path, std::size_t index)
    {
        auto out = path;
        out += "." + std::to_string(index);
        return out;
    }

    Result<void> rotate_numbered(const std::filesystem::path &path, std::size_t max_files)
    {
        if (max_files == 0)
            max_files = 1;

        std::error_code ec;
        std::filesystem::remove(numbered(path, max_files), ec);
        if (ec)
        {
            return std::unexpected(WardenError::io("Failed to discard oldest rotation: " + ec.message()));
        }

        // Shift existing rotations: .(max_files-1) -> .max_files, ..., .1 -> .2
        for (std::size_t i = max_files; i >= 2; --i)
        {
            const auto src = numbered(path, i - 1);
            if (std::filesystem::exists(src, ec))
            {
                std::filesystem::rename(src, numbered(path, i), ec);
                if (ec)
                    return std::unexpected(WardenError::io("Failed to shift " + src.string() + ": " + ec.message()));
            }
        }

        if (std::filesystem::exists(path, ec))
        {
            std::filesystem::rename(path, numbered(path, 1), ec);
            if (ec)
                return std::unexpected(WardenError::io("Failed to rotate " + path.string() + ": " + ec.message()));
        }
        return {};
    }

} // namespace warden::fs
