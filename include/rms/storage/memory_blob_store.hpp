#pragma once

#include "rms/storage/blob_store.hpp"

#include <map>
#include <shared_mutex>

namespace rms::storage {

/**
 * @brief In-process BlobStore used by tests and ephemeral servers
 *
 * Range reads use the BlobStore fallback (full read + slice). Keys containing
 * a registered fragment fail with StorageFailure, which lets tests exercise
 * backend errors.
 */
class MemoryBlobStore : public BlobStore {
public:
    MemoryBlobStore() = default;

    Result<void> put(const std::string& key, const std::vector<std::uint8_t>& data) override;
    Result<std::vector<std::uint8_t>> get(const std::string& key) const override;
    Result<std::uint64_t> size(const std::string& key) const override;
    bool exists(const std::string& key) const override;
    Result<void> remove(const std::string& key) override;
    Result<std::size_t> remove_prefix(const std::string& prefix) override;
    Result<std::vector<std::string>> list(const std::string& prefix) const override;
    Result<std::unique_ptr<BlobWriter>> open_writer(const std::string& key) override;

    void fail_keys_containing(const std::string& fragment);
    void clear_failures();

    [[nodiscard]] std::size_t blob_count() const;
    [[nodiscard]] std::uint64_t total_bytes() const;

private:
    bool should_fail(const std::string& key) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<std::uint8_t>> blobs_;
    std::vector<std::string> failing_fragments_;
};

} // namespace rms::storage
