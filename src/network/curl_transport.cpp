#include "stash/network/curl_transport.hpp"

#include "stash/network/byte_source.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace stash::network {
namespace {

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensure_global_init() {
    static std::once_flag flag;
    static CURLcode init_result = CURLE_OK;
    std::call_once(flag, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (init_result != CURLE_OK) {
        throw std::runtime_error(std::string("Failed to initialize libcurl: ") +
                                 curl_easy_strerror(init_result));
    }
}

// State shared with the read callback for PUT bodies
struct UploadBody {
    const std::vector<std::uint8_t>* memory = nullptr;
    std::size_t offset = 0;
    ByteSource* stream = nullptr;
    std::optional<Error> stream_error;
};

// libcurl write callback - accumulates response body
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total_size = size * nmemb;
    auto* buffer = static_cast<std::vector<std::uint8_t>*>(userp);
    const auto* bytes = static_cast<const std::uint8_t*>(contents);
    buffer->insert(buffer->end(), bytes, bytes + total_size);
    return total_size;
}

// libcurl header callback - captures response headers
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t total_size = size * nitems;
    auto* headers = static_cast<HeaderMap*>(userp);

    std::string header_line(buffer, total_size);

    while (!header_line.empty() &&
           (header_line.back() == '\r' || header_line.back() == '\n')) {
        header_line.pop_back();
    }

    if (header_line.empty()) {
        return total_size;
    }

    // A new status line starts a new response (redirect hop); keep only the last
    if (header_line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total_size;
    }

    const size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        const size_t first = value.find_first_not_of(" \t");
        value = first == std::string::npos ? std::string{} : value.substr(first);

        (*headers)[key] = value;
    }

    return total_size;
}

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* body = static_cast<UploadBody*>(userp);
    const size_t capacity = size * nitems;

    if (body->stream != nullptr) {
        auto result = body->stream->read(reinterpret_cast<std::uint8_t*>(buffer), capacity);
        if (result.is_error()) {
            body->stream_error = result.error();
            return CURL_READFUNC_ABORT;
        }
        return result.value();
    }

    const auto& data = *body->memory;
    const size_t remaining = data.size() - body->offset;
    const size_t count = std::min(capacity, remaining);
    if (count > 0) {
        std::memcpy(buffer, data.data() + body->offset, count);
        body->offset += count;
    }
    return count;
}

// libcurl seek callback - rewinds the body when a redirect replays the PUT
int seek_callback(void* userp, curl_off_t offset, int origin) {
    auto* body = static_cast<UploadBody*>(userp);
    if (origin != SEEK_SET || offset < 0) {
        return CURL_SEEKFUNC_CANTSEEK;
    }

    if (body->stream != nullptr) {
        // Streams only restart from the beginning
        if (offset != 0) {
            return CURL_SEEKFUNC_CANTSEEK;
        }
        auto rewound = body->stream->rewind();
        if (rewound.is_error()) {
            body->stream_error = rewound.error();
            return CURL_SEEKFUNC_CANTSEEK;
        }
        return CURL_SEEKFUNC_OK;
    }

    if (static_cast<std::uint64_t>(offset) > body->memory->size()) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    body->offset = static_cast<std::size_t>(offset);
    return CURL_SEEKFUNC_OK;
}

} // namespace

CurlTransport::CurlTransport() : CurlTransport(Options{}) {}

CurlTransport::CurlTransport(Options options)
    : options_(std::move(options)) {
    ensure_global_init();
}

Result<HttpResponse> CurlTransport::send(const HttpRequest& request) {
    const std::string method = HttpMethodUtils::to_string(request.method);

    EasyHandle handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        return Err<HttpResponse>(Error::transport("Failed to create libcurl handle"));
    }
    CURL* curl = handle.get();

    HttpResponse response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    if (!options_.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    }

    UploadBody upload_body;
    upload_body.memory = &request.body;
    upload_body.stream = request.body_stream;

    switch (request.method) {
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case HttpMethod::PUT: {
            const auto length = request.body_stream != nullptr
                ? request.body_stream->size()
                : static_cast<std::uint64_t>(request.body.size());
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &upload_body);
            curl_easy_setopt(curl, CURLOPT_SEEKFUNCTION, seek_callback);
            curl_easy_setopt(curl, CURLOPT_SEEKDATA, &upload_body);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(length));
            break;
        }
        default:
            return Err<HttpResponse>(Error::transport("Unsupported HTTP method for " + request.url));
    }

    // Forward request headers; an empty "Expect:" stops libcurl adding 100-continue
    HeaderList header_list(nullptr, &curl_slist_free_all);
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (appended == nullptr) {
            return Err<HttpResponse>(Error::transport("Failed to build request headers"));
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (request.method == HttpMethod::PUT && !request.has_header("Expect")) {
        curl_slist* appended = curl_slist_append(header_list.get(), "Expect:");
        if (appended == nullptr) {
            return Err<HttpResponse>(Error::transport("Failed to build request headers"));
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    }

    const CURLcode res = curl_easy_perform(curl);

    if (upload_body.stream_error) {
        spdlog::error("{} {} aborted while reading body: {}", method, request.url,
                      upload_body.stream_error->message);
        return Err<HttpResponse>(*upload_body.stream_error);
    }

    if (res != CURLE_OK) {
        std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer)
                                                     : std::string(curl_easy_strerror(res));
        spdlog::error("{} {} failed: {}", method, request.url, detail);
        return Err<HttpResponse>(Error::transport(method + " " + request.url + " failed: " + detail));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);

    spdlog::debug("{} {} -> HTTP {} ({} bytes)", method, request.url,
                  response.status_code, response.body.size());

    return Ok(std::move(response));
}

} // namespace stash::network
