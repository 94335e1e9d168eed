#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace warden::crypto
{

    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /** SHA-256 over libsodium; used for file baselines and the audit chain. */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);
        static SHA256Hash hash(const std::string &data);

        /**
         * Stream a file through SHA-256 in fixed-size chunks.
         * Fails with NotFound when the file does not exist.
         */
        static Result<SHA256Hash> hash_file(const std::filesystem::path &path);

        /** Lowercase hex, 64 characters. */
        static std::string to_hex(const SHA256Hash &hash);
        static Result<SHA256Hash> from_hex(const std::string &hex);

        /** Shorthand for to_hex(hash(data)). */
        static std::string hex_digest(const std::string &data);
    };

} // namespace warden::crypto
