#pragma once

#include <string>

namespace stash::config {

inline constexpr const char* kDefaultApiBaseUrl = "https://app.buildstash.com/api/v1";

struct ApiConfig {
    std::string base_url = kDefaultApiBaseUrl;
    std::string api_key;
    bool send_part_receipts = false; ///< Attach chunk ETags to the verify call
};

struct HttpConfig {
    long timeout_seconds = 0;          ///< 0 = no overall limit (large uploads)
    long connect_timeout_seconds = 30;
    std::string user_agent = "stash-uploader/1.0";
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct UploaderConfig {
    ApiConfig api;
    HttpConfig http;
    LoggingConfig logging;
};

} // namespace stash::config
