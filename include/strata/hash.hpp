#pragma once

#include <strata/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace strata {

using Digest = std::array<uint8_t, 32>;

// Streaming SHA-256 (FIPS 180-4)
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest. The object must not be fed afterwards.
    Digest finalize();

    static std::string hex(const std::string& input);
    static std::string to_hex(const Digest& digest);

private:
    void compress(const uint8_t block[64]);

    std::array<uint32_t, 8> h_;
    uint64_t length_ = 0;
    std::array<uint8_t, 64> pending_{};
    size_t pending_len_ = 0;
};

// Canonical field encoder for fingerprints. Every field is tagged and
// length-prefixed so that ("ab","c") and ("a","bc") never collide.
class Hasher {
public:
    Hasher& field(const std::string& tag, const std::string& value);
    Hasher& field(const std::string& tag, int64_t value);
    Hasher& field(const std::string& tag, bool value);
    Hasher& field(const std::string& tag, const std::vector<std::string>& values);

    std::string hex();

private:
    void put_len(uint64_t n);

    Sha256 sha_;
};

// Hex digest of a file's bytes
Result<std::string> hash_file(const std::filesystem::path& path);

// Hex digest over the sorted relative paths, kinds and contents of a tree.
// Entries under any path in `exclude` are skipped, as is every .git directory.
Result<std::string> hash_tree(const std::filesystem::path& root,
                              const std::vector<std::filesystem::path>& exclude = {});

} // namespace strata
