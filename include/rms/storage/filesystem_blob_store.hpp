#pragma once

#include "rms/storage/blob_store.hpp"

#include <atomic>
#include <filesystem>

namespace rms::storage {

/**
 * @brief BlobStore backed by a directory tree
 *
 * Each key maps to a file below the root. Writes go to a sibling temp file
 * which is renamed over the target, so readers never observe partial data.
 * Range reads seek inside the file instead of loading it.
 */
class FilesystemBlobStore : public BlobStore {
public:
    explicit FilesystemBlobStore(std::filesystem::path root);

    Result<void> put(const std::string& key, const std::vector<std::uint8_t>& data) override;
    Result<std::vector<std::uint8_t>> get(const std::string& key) const override;
    Result<std::vector<std::uint8_t>> get_range(const std::string& key,
                                                std::uint64_t offset,
                                                std::uint64_t length) const override;
    Result<std::uint64_t> size(const std::string& key) const override;
    bool exists(const std::string& key) const override;
    Result<void> remove(const std::string& key) override;
    Result<std::size_t> remove_prefix(const std::string& prefix) override;
    Result<std::vector<std::string>> list(const std::string& prefix) const override;
    Result<std::unique_ptr<BlobWriter>> open_writer(const std::string& key) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    Result<std::filesystem::path> resolve(const std::string& key) const;
    std::filesystem::path make_temp_path(const std::filesystem::path& target);

    std::filesystem::path root_;
    std::atomic<std::uint64_t> temp_counter_{0};
};

} // namespace rms::storage
