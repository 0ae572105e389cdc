#ifndef CHUNKRELAY_STORAGE_CHUNK_STORE_H
#define CHUNKRELAY_STORAGE_CHUNK_STORE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkrelay {

// Temporary per-chunk blob storage keyed by (transfer_id, chunk_index).
// The returned storage reference is opaque to callers.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    // Persist a chunk. Returns the storage reference, or nullopt on failure.
    virtual std::optional<std::string> put(const std::string& transfer_id,
                                           uint32_t chunk_index,
                                           const std::vector<uint8_t>& data) = 0;

    // Read a stored chunk back
    virtual std::optional<std::vector<uint8_t>> get(const std::string& storage_ref) const = 0;

    // Delete a stored chunk. Failures are logged by the implementation.
    virtual bool remove(const std::string& storage_ref) = 0;
};

// Disk-backed store writing one file per chunk under a temp directory
class DiskChunkStore : public ChunkStore {
public:
    explicit DiskChunkStore(const std::string& temp_dir);
    ~DiskChunkStore() override;

    // Create the temp directory. Returns false (and logs) if it cannot be created.
    bool initialize();

    std::optional<std::string> put(const std::string& transfer_id,
                                   uint32_t chunk_index,
                                   const std::vector<uint8_t>& data) override;

    std::optional<std::vector<uint8_t>> get(const std::string& storage_ref) const override;

    bool remove(const std::string& storage_ref) override;

    const std::string& temp_dir() const;

    // File name used for a chunk: <escaped transfer id>_chunk_<index>
    static std::string chunk_file_name(const std::string& transfer_id, uint32_t chunk_index);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chunkrelay

#endif // CHUNKRELAY_STORAGE_CHUNK_STORE_H
