#pragma once

#include "stash/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace stash::upload {

/**
 * @brief Records of the uploads completed by one process, in completion order
 *
 * Owned by the caller (the CLI); the engine keeps no global state.
 */
class UploadResultLog {
public:
    void append(ArtifactRecord record);

    const std::vector<ArtifactRecord>& records() const noexcept { return records_; }
    std::size_t size() const noexcept { return records_.size(); }
    bool empty() const noexcept { return records_.empty(); }

    /**
     * @brief JSON array of the records, same field names as the verify response
     */
    nlohmann::json to_json() const;

private:
    std::vector<ArtifactRecord> records_;
};

} // namespace stash::upload
