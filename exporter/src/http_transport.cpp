#include "frameport/exporter/http_transport.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>

namespace frameport {
namespace exporter {

namespace {

std::once_flag g_curl_init;

using HeaderData = CurlTransport::ResponseHeaders;

struct FileSink {
    std::FILE* file = nullptr;
    int64_t bytes = 0;
};

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
    if (userp == nullptr || contents == nullptr) {
        return 0;
    }
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total);
    return total;
}

size_t write_to_file(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<FileSink*>(userp);
    if (sink == nullptr || sink->file == nullptr) {
        return 0;
    }
    size_t written = std::fwrite(contents, size, nmemb, sink->file);
    sink->bytes += static_cast<int64_t>(written * size);
    return written * size;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    CurlTransport::apply_header_line(std::string(buffer, total), *static_cast<HeaderData*>(userdata));
    return total;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* abort_flag = static_cast<const std::atomic<bool>*>(clientp);
    return (abort_flag != nullptr && abort_flag->load()) ? 1 : 0;
}

ErrorCode map_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::connection_timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorCode::cancelled_by_user;
        case CURLE_WRITE_ERROR:
            return ErrorCode::storage_failed;
        default:
            return ErrorCode::network_error;
    }
}

// Options shared by both request kinds. Returns the header list the caller must free.
curl_slist* apply_common_options(CURL* curl, const HttpRequest& request, HeaderData* header_data,
                                 const std::atomic<bool>* abort_flag) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<int64_t>(5000, request.timeout_ms)));
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, header_data);

    if (abort_flag != nullptr) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(abort_flag));
    }

    curl_slist* header_list = nullptr;
    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    return header_list;
}

void finish_response(CURL* curl, CURLcode res, const HeaderData& header_data, HttpResponse& response) {
    if (res != CURLE_OK) {
        response.error_code = map_curl_error(res);
        response.error = curl_easy_strerror(res);
        return;
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);
    response.retry_after = header_data.retry_after;
    response.content_type = header_data.content_type;
}

} // namespace

void CurlTransport::apply_header_line(const std::string& line, ResponseHeaders& headers) {
    // With FOLLOWLOCATION every hop's headers arrive here; keep only the last hop's
    if (line.compare(0, 5, "HTTP/") == 0) {
        headers = ResponseHeaders{};
        return;
    }
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return;
    }
    std::string name = to_lower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));
    if (name == "retry-after") {
        headers.retry_after = value;
    } else if (name == "content-type") {
        headers.content_type = value;
    }
}

CurlTransport::CurlTransport(std::size_t max_pooled_handles)
    : max_pooled_handles_(std::max<std::size_t>(1, max_pooled_handles)) {
    std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlTransport::~CurlTransport() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    for (CURL* handle : available_handles_) {
        curl_easy_cleanup(handle);
    }
    available_handles_.clear();
}

CURL* CurlTransport::acquire_handle() {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!available_handles_.empty()) {
            CURL* handle = available_handles_.back();
            available_handles_.pop_back();
            curl_easy_reset(handle); // keeps the connection cache
            return handle;
        }
    }
    return curl_easy_init();
}

void CurlTransport::release_handle(CURL* handle) {
    if (!handle) return;
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (available_handles_.size() < max_pooled_handles_) {
        available_handles_.push_back(handle);
    } else {
        curl_easy_cleanup(handle);
    }
}

std::size_t CurlTransport::pooled_handles() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return available_handles_.size();
}

HttpResponse CurlTransport::get(const HttpRequest& request) {
    HttpResponse response;
    CURL* curl = acquire_handle();
    if (!curl) {
        response.error_code = ErrorCode::internal_error;
        response.error = "Failed to initialize CURL";
        return response;
    }

    HeaderData header_data;
    curl_slist* header_list = apply_common_options(curl, request, &header_data, nullptr);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    finish_response(curl, res, header_data, response);
    response.bytes = static_cast<int64_t>(response.body.size());

    curl_slist_free_all(header_list);
    release_handle(curl);
    return response;
}

HttpResponse CurlTransport::download(const HttpRequest& request,
                                     const std::filesystem::path& destination,
                                     const std::atomic<bool>* abort_flag) {
    HttpResponse response;

    FileSink sink;
    sink.file = std::fopen(destination.string().c_str(), "wb");
    if (sink.file == nullptr) {
        response.error_code = ErrorCode::storage_failed;
        response.error = "cannot open " + destination.string() + " for writing";
        return response;
    }

    CURL* curl = acquire_handle();
    if (!curl) {
        std::fclose(sink.file);
        response.error_code = ErrorCode::internal_error;
        response.error = "Failed to initialize CURL";
        return response;
    }

    HeaderData header_data;
    curl_slist* header_list = apply_common_options(curl, request, &header_data, abort_flag);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);

    CURLcode res = curl_easy_perform(curl);
    finish_response(curl, res, header_data, response);
    response.bytes = sink.bytes;

    if (std::fclose(sink.file) != 0 && response.error_code == ErrorCode::none) {
        response.error_code = ErrorCode::storage_failed;
        response.error = "failed to flush " + destination.string();
    }

    curl_slist_free_all(header_list);
    release_handle(curl);
    return response;
}

} // namespace exporter
} // namespace frameport
