#include <strata/hash.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace strata {

namespace {

constexpr uint32_t K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16)
         | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

Sha256::Sha256()
    : h_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
         0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19} {}

void Sha256::compress(const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) w[i] = load_be32(block + 4 * i);
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    // v = a..h
    std::array<uint32_t, 8> v = h_;
    for (int i = 0; i < 64; ++i) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25))
                    + ((e & v[5]) ^ (~e & v[6])) + K[i] + w[i];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22))
                    + ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
        for (int j = 7; j > 0; --j) v[j] = v[j - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }
    for (int i = 0; i < 8; ++i) h_[i] += v[i];
}

void Sha256::update(const uint8_t* data, size_t len) {
    length_ += len;
    while (len > 0) {
        if (pending_len_ == 0 && len >= 64) {
            compress(data);
            data += 64;
            len -= 64;
            continue;
        }
        size_t take = std::min(len, 64 - pending_len_);
        std::memcpy(pending_.data() + pending_len_, data, take);
        pending_len_ += take;
        data += take;
        len -= take;
        if (pending_len_ == 64) {
            compress(pending_.data());
            pending_len_ = 0;
        }
    }
}

void Sha256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

Digest Sha256::finalize() {
    uint64_t bits = length_ * 8;
    pending_[pending_len_++] = 0x80;
    if (pending_len_ > 56) {
        std::fill(pending_.begin() + pending_len_, pending_.end(), 0);
        compress(pending_.data());
        pending_len_ = 0;
    }
    std::fill(pending_.begin() + pending_len_, pending_.begin() + 56, 0);
    for (int i = 0; i < 8; ++i) {
        pending_[56 + i] = uint8_t(bits >> (56 - 8 * i));
    }
    compress(pending_.data());

    Digest out;
    for (int i = 0; i < 8; ++i) {
        out[4 * i]     = uint8_t(h_[i] >> 24);
        out[4 * i + 1] = uint8_t(h_[i] >> 16);
        out[4 * i + 2] = uint8_t(h_[i] >> 8);
        out[4 * i + 3] = uint8_t(h_[i]);
    }
    return out;
}

std::string Sha256::to_hex(const Digest& digest) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(64);
    for (uint8_t b : digest) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0f];
    }
    return out;
}

std::string Sha256::hex(const std::string& input) {
    Sha256 ctx;
    ctx.update(input);
    return to_hex(ctx.finalize());
}

// ---- Hasher ----

void Hasher::put_len(uint64_t n) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) buf[i] = uint8_t(n >> (56 - 8 * i));
    sha_.update(buf, sizeof(buf));
}

Hasher& Hasher::field(const std::string& tag, const std::string& value) {
    put_len(tag.size());
    sha_.update(tag);
    sha_.update(std::string("s"));
    put_len(value.size());
    sha_.update(value);
    return *this;
}

Hasher& Hasher::field(const std::string& tag, int64_t value) {
    return field(tag, "i:" + std::to_string(value));
}

Hasher& Hasher::field(const std::string& tag, bool value) {
    return field(tag, std::string(value ? "b:1" : "b:0"));
}

Hasher& Hasher::field(const std::string& tag, const std::vector<std::string>& values) {
    put_len(tag.size());
    sha_.update(tag);
    sha_.update(std::string("l"));
    put_len(values.size());
    for (const auto& v : values) {
        put_len(v.size());
        sha_.update(v);
    }
    return *this;
}

std::string Hasher::hex() {
    return Sha256::to_hex(sha_.finalize());
}

// ---- Files and trees ----

static Status feed_file(Sha256& ctx, const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return StrataError{StrataError::IO, "cannot read file: " + path.string()};
    }
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        ctx.update(reinterpret_cast<const uint8_t*>(buf),
                   static_cast<size_t>(in.gcount()));
    }
    return ok_status();
}

Result<std::string> hash_file(const fs::path& path) {
    Sha256 ctx;
    STRATA_TRY(feed_file(ctx, path));
    return Result<std::string>::ok(Sha256::to_hex(ctx.finalize()));
}

static bool is_under(const fs::path& p, const fs::path& root) {
    auto pit = p.begin();
    for (auto rit = root.begin(); rit != root.end(); ++rit, ++pit) {
        if (rit->empty()) continue;
        if (pit == p.end() || *pit != *rit) return false;
    }
    return true;
}

Result<std::string> hash_tree(const fs::path& root,
                              const std::vector<fs::path>& exclude) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return StrataError{StrataError::NotFound,
            "directory does not exist: " + root.string()};
    }

    std::vector<fs::path> excluded;
    for (const auto& e : exclude) {
        excluded.push_back(fs::weakly_canonical(e, ec).lexically_normal());
    }

    std::vector<std::pair<std::string, fs::path>> entries;
    auto it = fs::recursive_directory_iterator(root, ec);
    if (ec) {
        return StrataError{StrataError::IO,
            "cannot iterate " + root.string() + ": " + ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return StrataError{StrataError::IO,
                "cannot iterate " + root.string() + ": " + ec.message()};
        }
        const auto& p = it->path();
        bool skip = p.filename() == ".git";
        if (!skip) {
            auto canon = fs::weakly_canonical(p, ec).lexically_normal();
            for (const auto& x : excluded) {
                if (is_under(canon, x)) { skip = true; break; }
            }
        }
        if (skip) {
            if (it->is_directory(ec) && !it->is_symlink(ec)) it.disable_recursion_pending();
            continue;
        }
        entries.emplace_back(p.lexically_relative(root).generic_string(), p);
    }
    std::sort(entries.begin(), entries.end());

    Sha256 ctx;
    for (const auto& [rel, p] : entries) {
        auto st = fs::symlink_status(p, ec);
        ctx.update(rel);
        ctx.update(std::string(1, '\0'));
        if (fs::is_symlink(st)) {
            ctx.update("L" + fs::read_symlink(p, ec).string());
        } else if (fs::is_directory(st)) {
            ctx.update(std::string("D"));
        } else {
            ctx.update(std::string("F"));
            STRATA_TRY(feed_file(ctx, p));
        }
        ctx.update(std::string(1, '\0'));
    }
    return Result<std::string>::ok(Sha256::to_hex(ctx.finalize()));
}

} // namespace strata
