#ifndef CONTENTHASHER_HPP
#define CONTENTHASHER_HPP

#include <chrono>
#include <functional>
#include <string>

class ProcessRunner;

enum class HashAlgorithm { Sha256, Md5 };

/**
 * @brief Streaming content digests (lowercase hex) over OpenSSL EVP.
 *
 * Local files are read in chunks; remote objects are streamed through
 * `rclone cat` into the same digest, so both paths produce identical
 * values for identical bytes.
 */
class ContentHasher {
public:
    // Called after every chunk read; long hashes use it as a heartbeat.
    using ChunkCallback = std::function<void()>;

    // Throws EngineException(HASH_FAILED) when the file cannot be read.
    static std::string compute_hash(const std::string& path,
                                    HashAlgorithm algorithm = HashAlgorithm::Sha256,
                                    const ChunkCallback& on_chunk = {});

    static std::string compute_remote_hash(const ProcessRunner& runner,
                                           const std::string& rclone_path,
                                           const std::string& remote_object,
                                           HashAlgorithm algorithm,
                                           std::chrono::seconds timeout,
                                           const ChunkCallback& on_chunk = {});

    // MD5 for 32 hex digits (legacy index digests), SHA-256 otherwise.
    static HashAlgorithm algorithm_for_digest(const std::string& digest);

    static bool digests_equal(const std::string& lhs, const std::string& rhs);

    static const char* algorithm_name(HashAlgorithm algorithm);
};

#endif
