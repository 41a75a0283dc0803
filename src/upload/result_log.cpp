#include "stash/upload/result_log.hpp"

#include "stash/upload/wire.hpp"

#include <utility>

namespace stash::upload {

void UploadResultLog::append(ArtifactRecord record) {
    records_.push_back(std::move(record));
}

nlohmann::json UploadResultLog::to_json() const {
    auto array = nlohmann::json::array();
    for (const auto& record : records_) {
        array.push_back(wire::artifact_record_to_json(record));
    }
    return array;
}

} // namespace stash::upload
