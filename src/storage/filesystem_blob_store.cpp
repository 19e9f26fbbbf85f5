#include "rms/storage/filesystem_blob_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace rms::storage {
namespace fs = std::filesystem;

namespace {

constexpr const char* kTempMarker = ".part-";

bool is_temp_file(const fs::path& path) {
    return path.filename().string().find(kTempMarker) != std::string::npos;
}

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorCode::StorageFailure, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

Result<void> publish(const fs::path& temp, const fs::path& target) {
    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Err<void>(ErrorCode::StorageFailure, "Failed to publish blob: " + target.string());
    }
    return Ok();
}

class FileBlobWriter : public BlobWriter {
public:
    FileBlobWriter(fs::path temp, fs::path target)
        : temp_(std::move(temp)), target_(std::move(target)),
          out_(temp_, std::ios::binary | std::ios::trunc) {}

    ~FileBlobWriter() override {
        if (!done_) {
            abort();
        }
    }

    bool is_open() const { return static_cast<bool>(out_); }

    Result<void> write(const std::uint8_t* data, std::size_t length) override {
        if (done_) {
            return Err<void>(ErrorCode::StorageFailure, "Writer already closed");
        }
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
        if (!out_) {
            return Err<void>(ErrorCode::StorageFailure, "Write failed: " + temp_.string());
        }
        written_ += length;
        return Ok();
    }

    Result<void> commit() override {
        if (done_) {
            return Err<void>(ErrorCode::StorageFailure, "Writer already closed");
        }
        out_.flush();
        const bool ok = static_cast<bool>(out_);
        out_.close();
        done_ = true;
        if (!ok) {
            std::error_code ec;
            fs::remove(temp_, ec);
            return Err<void>(ErrorCode::StorageFailure, "Flush failed: " + temp_.string());
        }
        return publish(temp_, target_);
    }

    void abort() override {
        if (out_.is_open()) {
            out_.close();
        }
        std::error_code ec;
        fs::remove(temp_, ec);
        done_ = true;
    }

    std::uint64_t bytes_written() const noexcept override { return written_; }

private:
    fs::path temp_;
    fs::path target_;
    std::ofstream out_;
    std::uint64_t written_ = 0;
    bool done_ = false;
};

} // namespace

FilesystemBlobStore::FilesystemBlobStore(fs::path root) : root_(std::move(root)) {
    fs::create_directories(root_);
}

Result<fs::path> FilesystemBlobStore::resolve(const std::string& key) const {
    if (!is_valid_key(key)) {
        return Err<fs::path>(ErrorCode::InvalidArgument, "Invalid blob key: " + key);
    }
    return Ok(root_ / fs::path(key));
}

fs::path FilesystemBlobStore::make_temp_path(const fs::path& target) {
    const auto id = temp_counter_.fetch_add(1);
    return target.parent_path() / (target.filename().string() + kTempMarker + std::to_string(id));
}

Result<void> FilesystemBlobStore::put(const std::string& key, const std::vector<std::uint8_t>& data) {
    auto writer = open_writer(key);
    if (writer.is_error()) {
        return forward_error<void>(writer);
    }
    auto& out = *writer.value();
    if (auto res = out.write(data.data(), data.size()); res.is_error()) {
        out.abort();
        return res;
    }
    return out.commit();
}

Result<std::vector<std::uint8_t>> FilesystemBlobStore::get(const std::string& key) const {
    auto blob_size = size(key);
    if (blob_size.is_error()) {
        return forward_error<std::vector<std::uint8_t>>(blob_size);
    }
    return get_range(key, 0, blob_size.value());
}

Result<std::vector<std::uint8_t>> FilesystemBlobStore::get_range(const std::string& key,
                                                                 std::uint64_t offset,
                                                                 std::uint64_t length) const {
    auto path = resolve(key);
    if (path.is_error()) {
        return forward_error<std::vector<std::uint8_t>>(path);
    }

    std::ifstream input(path.value(), std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::StorageFailure, "Blob not found: " + key);
    }

    std::error_code ec;
    const auto total = fs::file_size(path.value(), ec);
    if (ec) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::StorageFailure, "Failed to stat blob: " + key);
    }
    if (offset >= total) {
        return Ok(std::vector<std::uint8_t>{});
    }

    const auto count = std::min<std::uint64_t>(length, total - offset);
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(count));
    input.seekg(static_cast<std::streamoff>(offset));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    if (static_cast<std::uint64_t>(input.gcount()) != count) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::StorageFailure, "Short read from blob: " + key);
    }
    return Ok(std::move(buffer));
}

Result<std::uint64_t> FilesystemBlobStore::size(const std::string& key) const {
    auto path = resolve(key);
    if (path.is_error()) {
        return forward_error<std::uint64_t>(path);
    }
    std::error_code ec;
    const auto bytes = fs::file_size(path.value(), ec);
    if (ec) {
        return Err<std::uint64_t>(ErrorCode::StorageFailure, "Blob not found: " + key);
    }
    return Ok(static_cast<std::uint64_t>(bytes));
}

bool FilesystemBlobStore::exists(const std::string& key) const {
    auto path = resolve(key);
    if (path.is_error()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(path.value(), ec);
}

Result<void> FilesystemBlobStore::remove(const std::string& key) {
    auto path = resolve(key);
    if (path.is_error()) {
        return forward_error<void>(path);
    }
    std::error_code ec;
    fs::remove(path.value(), ec);
    if (ec) {
        return Err<void>(ErrorCode::StorageFailure, "Failed to remove blob: " + key);
    }
    return Ok();
}

Result<std::size_t> FilesystemBlobStore::remove_prefix(const std::string& prefix) {
    auto keys = list(prefix);
    if (keys.is_error()) {
        return forward_error<std::size_t>(keys);
    }

    std::size_t removed = 0;
    for (const auto& key : keys.value()) {
        if (auto res = remove(key); res.is_error()) {
            return forward_error<std::size_t>(res);
        }
        ++removed;
    }

    // Drop the directory the prefix names, including stray temp files.
    if (!prefix.empty() && prefix.back() == '/') {
        std::error_code ec;
        fs::remove_all(root_ / fs::path(prefix.substr(0, prefix.size() - 1)), ec);
        if (ec) {
            spdlog::warn("[BlobStore] Failed to remove directory for prefix {}: {}", prefix, ec.message());
        }
    }
    return Ok(removed);
}

Result<std::vector<std::string>> FilesystemBlobStore::list(const std::string& prefix) const {
    std::vector<std::string> keys;

    const auto slash = prefix.rfind('/');
    const fs::path scan_root = slash == std::string::npos ? root_ : root_ / fs::path(prefix.substr(0, slash));

    std::error_code ec;
    if (!fs::exists(scan_root, ec)) {
        return Ok(std::move(keys));
    }

    for (fs::recursive_directory_iterator it(scan_root, ec), end; it != end; it.increment(ec)) {
        if (ec) {
            return Err<std::vector<std::string>>(ErrorCode::StorageFailure,
                                                 "Failed to list blobs under " + prefix + ": " + ec.message());
        }
        if (!it->is_regular_file() || is_temp_file(it->path())) {
            continue;
        }
        auto key = fs::relative(it->path(), root_, ec).generic_string();
        if (!ec && key.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(std::move(key));
        }
    }
    return Ok(std::move(keys));
}

Result<std::unique_ptr<BlobWriter>> FilesystemBlobStore::open_writer(const std::string& key) {
    auto path = resolve(key);
    if (path.is_error()) {
        return forward_error<std::unique_ptr<BlobWriter>>(path);
    }
    if (auto res = ensure_parent_exists(path.value()); res.is_error()) {
        return forward_error<std::unique_ptr<BlobWriter>>(res);
    }

    auto writer = std::make_unique<FileBlobWriter>(make_temp_path(path.value()), path.value());
    if (!writer->is_open()) {
        return Err<std::unique_ptr<BlobWriter>>(ErrorCode::StorageFailure, "Failed to open blob for writing: " + key);
    }
    return Ok(std::unique_ptr<BlobWriter>(std::move(writer)));
}

} // namespace rms::storage
