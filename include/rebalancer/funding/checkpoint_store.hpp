// include/rebalancer/funding/checkpoint_store.hpp
#pragma once

#include <string>
#include "rebalancer/core/error.hpp"
#include "rebalancer/funding/checkpoint.hpp"

namespace rebalancer {

/**
 * @brief Loads and saves the checkpoint document at a fixed path
 */
class CheckpointStore {
public:
    explicit CheckpointStore(std::string path);

    const std::string& path() const {
        return path_;
    }

    bool exists() const;

    /**
     * @brief Load the checkpoint
     * @return FILE_NOT_FOUND when absent; JSON_PARSE_ERROR or INVALID_DATA when the
     *         document cannot be decoded
     */
    Result<Checkpoint> load() const;

    /**
     * @brief Save the checkpoint, replacing the previous document
     * Writes a sibling temporary file and renames it over the target.
     */
    Result<void> save(const Checkpoint& checkpoint) const;

private:
    std::string path_;
};

}  // namespace rebalancer
