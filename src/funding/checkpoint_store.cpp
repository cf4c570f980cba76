// src/funding/checkpoint_store.cpp
#include "rebalancer/funding/checkpoint_store.hpp"
#include <filesystem>
#include <system_error>
#include "rebalancer/core/logger.hpp"

namespace rebalancer {

CheckpointStore::CheckpointStore(std::string path) : path_(std::move(path)) {}

bool CheckpointStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

Result<Checkpoint> CheckpointStore::load() const {
    Checkpoint checkpoint;
    auto loaded = checkpoint.load_from_file(path_);
    if (loaded.is_error()) {
        return forward_error<Checkpoint>(loaded, "CheckpointStore");
    }
    return Result<Checkpoint>(std::move(checkpoint));
}

Result<void> CheckpointStore::save(const Checkpoint& checkpoint) const {
    std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create directory for " + path_ + ": " +
                                        ec.message(),
                                    "CheckpointStore");
        }
    }

    std::filesystem::path temp = target;
    temp += ".tmp";

    auto written = checkpoint.save_to_file(temp.string());
    if (written.is_error()) {
        return written;
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to replace " + path_ + ": " + ec.message(),
                                "CheckpointStore");
    }

    DEBUG("Checkpoint saved to " << path_);
    return Result<void>();
}

}  // namespace rebalancer
