#include "rms/storage/memory_blob_store.hpp"

#include <mutex>

namespace rms::storage {

namespace {

class MemoryBlobWriter : public BlobWriter {
public:
    MemoryBlobWriter(MemoryBlobStore& store, std::string key)
        : store_(store), key_(std::move(key)) {}

    Result<void> write(const std::uint8_t* data, std::size_t length) override {
        if (done_) {
            return Err<void>(ErrorCode::StorageFailure, "Writer already closed");
        }
        buffer_.insert(buffer_.end(), data, data + length);
        return Ok();
    }

    Result<void> commit() override {
        if (done_) {
            return Err<void>(ErrorCode::StorageFailure, "Writer already closed");
        }
        done_ = true;
        return store_.put(key_, buffer_);
    }

    void abort() override {
        done_ = true;
        buffer_.clear();
    }

    std::uint64_t bytes_written() const noexcept override { return buffer_.size(); }

private:
    MemoryBlobStore& store_;
    std::string key_;
    std::vector<std::uint8_t> buffer_;
    bool done_ = false;
};

} // namespace

Result<void> MemoryBlobStore::put(const std::string& key, const std::vector<std::uint8_t>& data) {
    if (!is_valid_key(key)) {
        return Err<void>(ErrorCode::InvalidArgument, "Invalid blob key: " + key);
    }
    std::unique_lock lock(mutex_);
    if (should_fail(key)) {
        return Err<void>(ErrorCode::StorageFailure, "Injected write failure: " + key);
    }
    blobs_[key] = data;
    return Ok();
}

Result<std::vector<std::uint8_t>> MemoryBlobStore::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    if (should_fail(key)) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::StorageFailure, "Injected read failure: " + key);
    }
    auto it = blobs_.find(key);
    if (it == blobs_.end()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::StorageFailure, "Blob not found: " + key);
    }
    return Ok(it->second);
}

Result<std::uint64_t> MemoryBlobStore::size(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = blobs_.find(key);
    if (it == blobs_.end() || should_fail(key)) {
        return Err<std::uint64_t>(ErrorCode::StorageFailure, "Blob not found: " + key);
    }
    return Ok(static_cast<std::uint64_t>(it->second.size()));
}

bool MemoryBlobStore::exists(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return blobs_.count(key) > 0;
}

Result<void> MemoryBlobStore::remove(const std::string& key) {
    std::unique_lock lock(mutex_);
    blobs_.erase(key);
    return Ok();
}

Result<std::size_t> MemoryBlobStore::remove_prefix(const std::string& prefix) {
    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    auto it = blobs_.lower_bound(prefix);
    while (it != blobs_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = blobs_.erase(it);
        ++removed;
    }
    return Ok(removed);
}

Result<std::vector<std::string>> MemoryBlobStore::list(const std::string& prefix) const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = blobs_.lower_bound(prefix);
         it != blobs_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        keys.push_back(it->first);
    }
    return Ok(std::move(keys));
}

Result<std::unique_ptr<BlobWriter>> MemoryBlobStore::open_writer(const std::string& key) {
    if (!is_valid_key(key)) {
        return Err<std::unique_ptr<BlobWriter>>(ErrorCode::InvalidArgument, "Invalid blob key: " + key);
    }
    return Ok(std::unique_ptr<BlobWriter>(std::make_unique<MemoryBlobWriter>(*this, key)));
}

void MemoryBlobStore::fail_keys_containing(const std::string& fragment) {
    std::unique_lock lock(mutex_);
    failing_fragments_.push_back(fragment);
}

void MemoryBlobStore::clear_failures() {
    std::unique_lock lock(mutex_);
    failing_fragments_.clear();
}

std::size_t MemoryBlobStore::blob_count() const {
    std::shared_lock lock(mutex_);
    return blobs_.size();
}

std::uint64_t MemoryBlobStore::total_bytes() const {
    std::shared_lock lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& [key, data] : blobs_) {
        total += data.size();
    }
    return total;
}

bool MemoryBlobStore::should_fail(const std::string& key) const {
    for (const auto& fragment : failing_fragments_) {
        if (key.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace rms::storage
