#pragma once

#include "rms/core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rms::storage {

/**
 * @brief Sequential writer for one blob
 *
 * Bytes become visible under the key only after commit(). A writer that is
 * destroyed without commit() leaves no trace.
 */
class BlobWriter {
public:
    virtual ~BlobWriter() = default;

    virtual Result<void> write(const std::uint8_t* data, std::size_t length) = 0;
    virtual Result<void> commit() = 0;
    virtual void abort() = 0;

    [[nodiscard]] virtual std::uint64_t bytes_written() const noexcept = 0;
};

/**
 * @brief Opaque durable key/value blob storage
 *
 * Keys are relative, '/'-separated paths ("chunks/<token>/chunk-000001").
 * put() replaces the whole value atomically: a concurrent reader sees either
 * the old or the new bytes, never a partial write.
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual Result<void> put(const std::string& key, const std::vector<std::uint8_t>& data) = 0;
    virtual Result<std::vector<std::uint8_t>> get(const std::string& key) const = 0;

    /**
     * @brief Read [offset, offset + length) of a blob
     *
     * The range is clamped to the blob size. Backends that can seek override
     * this; the default reads the whole blob and slices it.
     */
    virtual Result<std::vector<std::uint8_t>> get_range(const std::string& key,
                                                        std::uint64_t offset,
                                                        std::uint64_t length) const;

    virtual Result<std::uint64_t> size(const std::string& key) const = 0;
    virtual bool exists(const std::string& key) const = 0;

    virtual Result<void> remove(const std::string& key) = 0;

    /// Remove every key starting with prefix; returns the number removed.
    virtual Result<std::size_t> remove_prefix(const std::string& prefix) = 0;

    virtual Result<std::vector<std::string>> list(const std::string& prefix) const = 0;

    virtual Result<std::unique_ptr<BlobWriter>> open_writer(const std::string& key) = 0;
};

/// Rejects empty keys, absolute keys and ".." segments.
bool is_valid_key(const std::string& key);

} // namespace rms::storage
