#include "chunkrelay/storage/chunk_store.h"
#include "chunkrelay/base/logger.h"
#include <cctype>
#include <filesystem>
#include <fstream>

namespace chunkrelay {

namespace fs = std::filesystem;

namespace {

// Transfer ids are caller supplied. Anything outside [A-Za-z0-9.-] is written
// as %XX, and '_' is escaped too so "<id>_chunk_<n>" stays unambiguous.
std::string escape_transfer_id(const std::string& transfer_id) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(transfer_id.size());
    for (unsigned char c : transfer_id) {
        if (std::isalnum(c) || c == '-' || (c == '.' && !out.empty())) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    if (out.empty()) {
        out = "%";
    }
    return out;
}

} // anonymous namespace

struct DiskChunkStore::Impl {
    std::string dir;
    fs::path temp_dir;

    explicit Impl(const std::string& d) : dir(d), temp_dir(d) {}

    // Storage refs are file names relative to temp_dir
    std::optional<fs::path> resolve(const std::string& storage_ref) const {
        if (storage_ref.empty() || storage_ref.find('/') != std::string::npos ||
            storage_ref == "." || storage_ref == "..") {
            return std::nullopt;
        }
        return temp_dir / storage_ref;
    }
};

DiskChunkStore::DiskChunkStore(const std::string& temp_dir)
    : impl_(std::make_unique<Impl>(temp_dir)) {}

DiskChunkStore::~DiskChunkStore() = default;

bool DiskChunkStore::initialize() {
    try {
        fs::create_directories(impl_->temp_dir);
        Logger::instance().info("Chunk store ready at: " + impl_->temp_dir.string());
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to create chunk directory " + impl_->temp_dir.string() +
                                 ": " + e.what());
        return false;
    }
}

std::string DiskChunkStore::chunk_file_name(const std::string& transfer_id, uint32_t chunk_index) {
    return escape_transfer_id(transfer_id) + "_chunk_" + std::to_string(chunk_index);
}

std::optional<std::string> DiskChunkStore::put(const std::string& transfer_id,
                                               uint32_t chunk_index,
                                               const std::vector<uint8_t>& data) {
    std::string ref = chunk_file_name(transfer_id, chunk_index);
    fs::path chunk_path = impl_->temp_dir / ref;

    try {
        std::ofstream file(chunk_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            Logger::instance().error("Failed to open chunk file for writing: " + chunk_path.string());
            return std::nullopt;
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.close();
        if (!file) {
            Logger::instance().error("Failed to write chunk file: " + chunk_path.string());
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to persist chunk to disk: " + std::string(e.what()));
        return std::nullopt;
    }

    Logger::instance().debug("Chunk stored: {} ({} bytes)", ref, data.size());
    return ref;
}

std::optional<std::vector<uint8_t>> DiskChunkStore::get(const std::string& storage_ref) const {
    auto chunk_path = impl_->resolve(storage_ref);
    if (!chunk_path) {
        return std::nullopt;
    }

    try {
        std::ifstream file(*chunk_path, std::ios::binary | std::ios::ate);
        if (!file) {
            return std::nullopt;
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> data(static_cast<size_t>(size));
        if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
            return std::nullopt;
        }
        return data;
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to load chunk from disk: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool DiskChunkStore::remove(const std::string& storage_ref) {
    auto chunk_path = impl_->resolve(storage_ref);
    if (!chunk_path) {
        Logger::instance().warning("Refusing to delete invalid chunk reference: " + storage_ref);
        return false;
    }

    std::error_code ec;
    if (!fs::remove(*chunk_path, ec)) {
        if (ec) {
            Logger::instance().error("Error deleting chunk " + chunk_path->string() + ": " + ec.message());
        } else {
            Logger::instance().warning("Chunk already gone: " + chunk_path->string());
        }
        return false;
    }
    return true;
}

const std::string& DiskChunkStore::temp_dir() const {
    return impl_->dir;
}

} // namespace chunkrelay
