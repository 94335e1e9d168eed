#include "warden/crypto.hpp"
#include <sodium.h>
#include <format>
#include <fstream>

namespace warden::crypto
{

    // libsodium must be initialized before any hashing
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    namespace
    {
        constexpr std::size_t kFileChunkSize = 8192;

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    } // namespace

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    Result<SHA256Hash> SHA256::hash_file(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto st = std::filesystem::status(path, ec);
        if (!std::filesystem::exists(st))
        {
            return std::unexpected(WardenError::not_found("File not found: " + path.string()));
        }
        if (!std::filesystem::is_regular_file(st))
        {
            return std::unexpected(WardenError::io("Not a regular file: " + path.string()));
        }

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            return std::unexpected(WardenError::io("Unable to open file for hashing: " + path.string()));
        }

        crypto_hash_sha256_state state;
        crypto_hash_sha256_init(&state);

        std::array<char, kFileChunkSize> buffer{};
        while (in)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = in.gcount();
            if (got > 0)
            {
                crypto_hash_sha256_update(&state,
                                          reinterpret_cast<const uint8_t *>(buffer.data()),
                                          static_cast<unsigned long long>(got));
            }
        }
        if (in.bad())
        {
            return std::unexpected(WardenError::io("Read error while hashing: " + path.string()));
        }

        SHA256Hash output;
        crypto_hash_sha256_final(&state, output.data());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex;
        hex.reserve(64);
        for (uint8_t byte : hash)
        {
            hex += std::format("{:02x}", byte);
        }
        return hex;
    }

    Result<SHA256Hash> SHA256::from_hex(const std::string &hex)
    {
        if (hex.size() != 64)
        {
            return std::unexpected(WardenError::crypto("Invalid SHA-256 hex length"));
        }

        SHA256Hash hash;
        for (size_t i = 0; i < 32; ++i)
        {
            int hi = hex_value(hex[i * 2]);
            int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0)
            {
                return std::unexpected(WardenError::crypto("Invalid hex character"));
            }
            hash[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return hash;
    }

    std::string SHA256::hex_digest(const std::string &data)
    {
        return to_hex(hash(data));
    }

} // namespace warden::crypto
