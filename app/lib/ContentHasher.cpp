#include "ContentHasher.hpp"
#include "EngineException.hpp"
#include "Logger.hpp"
#include "ProcessRunner.hpp"
#include "Utils.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>
#include <vector>

using ErrorCodes::Code;

namespace {

constexpr std::size_t kChunkSize = 1024 * 1024;

struct EVPContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

std::string openssl_error(const char* operation)
{
    const unsigned long err = ERR_get_error();
    if (err == 0) {
        return operation;
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(operation) + ": " + buffer.data();
}

const EVP_MD* digest_for(HashAlgorithm algorithm)
{
    return algorithm == HashAlgorithm::Md5 ? EVP_md5() : EVP_sha256();
}

class DigestStream {
public:
    explicit DigestStream(HashAlgorithm algorithm)
        : ctx_(EVP_MD_CTX_new())
    {
        if (!ctx_) {
            THROW_ENGINE_ERROR(Code::HASH_FAILED, openssl_error("EVP_MD_CTX_new"));
        }
        if (EVP_DigestInit_ex(ctx_.get(), digest_for(algorithm), nullptr) != 1) {
            THROW_ENGINE_ERROR(Code::HASH_FAILED, openssl_error("EVP_DigestInit_ex"));
        }
    }

    void update(const char* data, std::size_t size)
    {
        if (size == 0) {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            THROW_ENGINE_ERROR(Code::HASH_FAILED, openssl_error("EVP_DigestUpdate"));
        }
    }

    std::string finish()
    {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int digest_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &digest_len) != 1) {
            THROW_ENGINE_ERROR(Code::HASH_FAILED, openssl_error("EVP_DigestFinal_ex"));
        }
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(digest_len * 2);
        for (unsigned int i = 0; i < digest_len; ++i) {
            out.push_back(hex[digest[i] >> 4]);
            out.push_back(hex[digest[i] & 0x0F]);
        }
        return out;
    }

private:
    DigestCtxPtr ctx_;
};

}


std::string ContentHasher::compute_hash(const std::string& path,
                                        HashAlgorithm algorithm,
                                        const ChunkCallback& on_chunk)
{
    std::ifstream in(Utils::utf8_to_path(path), std::ios::binary);
    if (!in.is_open()) {
        THROW_ENGINE_ERROR(Code::HASH_FAILED, "Cannot open " + path);
    }

    DigestStream digest(algorithm);
    std::vector<char> buffer(kChunkSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0) {
            digest.update(buffer.data(), static_cast<std::size_t>(got));
            if (on_chunk) {
                on_chunk();
            }
        }
    }
    if (in.bad()) {
        THROW_ENGINE_ERROR(Code::HASH_FAILED, "Read error on " + path);
    }
    return digest.finish();
}


std::string ContentHasher::compute_remote_hash(const ProcessRunner& runner,
                                               const std::string& rclone_path,
                                               const std::string& remote_object,
                                               HashAlgorithm algorithm,
                                               std::chrono::seconds timeout,
                                               const ChunkCallback& on_chunk)
{
    DigestStream digest(algorithm);
    const auto result = runner.run({rclone_path, "cat", remote_object}, timeout,
                                   [&digest](const char* data, std::size_t size) {
                                       digest.update(data, size);
                                   },
                                   on_chunk);
    if (!result.succeeded()) {
        THROW_ENGINE_ERROR(Code::HASH_FAILED,
                           "rclone cat " + remote_object + " failed: " +
                           (result.timed_out ? std::string("timeout") : result.stderr_text));
    }
    return digest.finish();
}


HashAlgorithm ContentHasher::algorithm_for_digest(const std::string& digest)
{
    return digest.size() == 32 ? HashAlgorithm::Md5 : HashAlgorithm::Sha256;
}


bool ContentHasher::digests_equal(const std::string& lhs, const std::string& rhs)
{
    return !lhs.empty() && Utils::equals_ignore_case(lhs, rhs);
}


const char* ContentHasher::algorithm_name(HashAlgorithm algorithm)
{
    return algorithm == HashAlgorithm::Md5 ? "md5" : "sha256";
}
