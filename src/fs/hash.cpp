#include "fs/hash.hpp"

#include <openssl/evp.h>
#include <sodium.h>
#include <xxhash.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fileops::fs::hash {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct Xxh64StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

const EVP_MD* evpFor(const std::string& algorithm) {
    if (algorithm == "md5") return EVP_md5();
    if (algorithm == "sha1") return EVP_sha1();
    if (algorithm == "sha256") return EVP_sha256();
    if (algorithm == "sha512") return EVP_sha512();
    return nullptr;
}

template<typename Fn>
void readChunks(const std::filesystem::path& path, const uintmax_t chunkSize, Fn&& consume) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file for hashing: " + path.string());

    std::vector<char> buffer(static_cast<size_t>(std::max<uintmax_t>(chunkSize, 1)));
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (const auto n = in.gcount(); n > 0) consume(reinterpret_cast<const unsigned char*>(buffer.data()), static_cast<size_t>(n));
    }
    if (in.bad()) throw std::runtime_error("Failed to read file for hashing: " + path.string());
}

std::string evpDigest(const std::filesystem::path& path, const EVP_MD* md, const uintmax_t chunkSize) {
    std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
        throw std::runtime_error("Failed to initialize digest context");

    readChunks(path, chunkSize, [&](const unsigned char* data, const size_t len) {
        if (EVP_DigestUpdate(ctx.get(), data, len) != 1) throw std::runtime_error("Digest update failed");
    });

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) throw std::runtime_error("Digest finalization failed");
    return toHex(digest, len);
}

std::string blake2b(const std::filesystem::path& path, const uintmax_t chunkSize) {
    static std::once_flag sodiumInit;
    std::call_once(sodiumInit, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    });

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, hash_len);

    readChunks(path, chunkSize, [&](const unsigned char* data, const size_t len) {
        crypto_generichash_update(&state, data, len);
    });

    crypto_generichash_final(&state, hash, hash_len);
    return toHex(hash, hash_len);
}

std::string xxhash64(const std::filesystem::path& path, const uintmax_t chunkSize) {
    std::unique_ptr<XXH64_state_t, Xxh64StateDeleter> state(XXH64_createState());
    if (!state || XXH64_reset(state.get(), 0) == XXH_ERROR)
        throw std::runtime_error("Failed to initialize xxhash64 state");

    readChunks(path, chunkSize, [&](const unsigned char* data, const size_t len) {
        if (XXH64_update(state.get(), data, len) == XXH_ERROR) throw std::runtime_error("xxhash64 update failed");
    });

    // canonical form is big-endian, same as the printed 64-bit value
    XXH64_canonical_t canonical;
    XXH64_canonicalFromHash(&canonical, XXH64_digest(state.get()));
    return toHex(canonical.digest, sizeof(canonical.digest));
}

std::string crc32(const std::filesystem::path& path, const uintmax_t chunkSize) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    readChunks(path, chunkSize, [&](const unsigned char* data, size_t len) {
        // zlib takes uInt lengths
        while (len > 0) {
            const auto n = static_cast<uInt>(std::min<size_t>(len, 1u << 30));
            crc = ::crc32(crc, data, n);
            data += n;
            len -= n;
        }
    });

    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << static_cast<uint32_t>(crc);
    return oss.str();
}

}

std::string toHex(const unsigned char* data, const size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return oss.str();
}

std::string file(const std::filesystem::path& path, const std::string& algorithm, const uintmax_t chunkSize) {
    std::string algo = algorithm;
    std::ranges::transform(algo, algo.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (const auto* md = evpFor(algo)) return evpDigest(path, md, chunkSize);
    if (algo == "blake2b") return blake2b(path, chunkSize);
    if (algo == "xxhash64") return xxhash64(path, chunkSize);
    if (algo == "crc32") return crc32(path, chunkSize);

    throw std::invalid_argument("unsupported hash algorithm: " + algorithm);
}

}
