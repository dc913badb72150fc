#pragma once
#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace Burrow {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_IO_THREADS = 2;
    static constexpr int         DEFAULT_THREADS    = 50;  // Coroutines per scan
    static constexpr int         DEFAULT_DEPTH      = 4;
    static constexpr int         DEFAULT_SCAN_LIMIT = 0;
    static constexpr int         DEFAULT_RATE_LIMIT = 0;
    static constexpr const char* VERSION            = "0.1.0";

    static constexpr int         DEFAULT_RETRIES          = 1;
    static constexpr int         DEFAULT_RETRY_BACKOFF_MS = 1000;
    static constexpr int         REQUEST_TIMEOUT_SECONDS  = 7;
    static constexpr int         CONNECT_TIMEOUT_MS       = 5000;
    static constexpr const char* USER_AGENT               = "burrow/0.1.0";

    static constexpr int    DEFAULT_ERROR_WINDOW        = 50;
    static constexpr double DEFAULT_TUNE_THRESHOLD      = 0.30;
    static constexpr double DEFAULT_BAIL_THRESHOLD      = 0.90;
    static constexpr double DEFAULT_SIMILARITY          = 0.95;
    static constexpr double DEFAULT_WILDCARD_TOLERANCE  = 0.05;
    static constexpr int    WILDCARD_TOKEN_LENGTH       = 32;
    static constexpr int    STATE_FILE_INDENT           = 2;
    static constexpr size_t MAX_BODY_BYTES              = 8 * 1024 * 1024;

    // std::regex recurses per character; longer inputs are not matched whole.
    static constexpr size_t MAX_LINK_CANDIDATE_BYTES = 2048;
    static constexpr size_t MAX_REGEX_INPUT_BYTES    = 2048;
};

/// Suffixes tried after a file is found with --collect-backups.
inline const std::vector<std::string>& default_backup_extensions() {
    static const std::vector<std::string> suffixes = {"~", ".bak", ".bak2", ".old", ".1"};
    return suffixes;
}

/// Extensions never learned by --collect-extensions.
inline const std::vector<std::string>& default_ignored_extensions() {
    static const std::vector<std::string> extensions = {
        "tif", "tiff", "ico", "cur",  "bmp", "webp", "svg", "png", "jpg", "jpeg", "jfif", "gif", "avif",
        "apng", "pjpeg", "pjp", "mov", "wav", "mpg", "mpeg", "mp3", "mp4", "m4a", "m4p", "m4v", "ogg",
        "webm", "ogv", "oga", "flac", "aac", "3gp", "css", "zip", "xls", "xml", "gz", "tgz"};
    return extensions;
}

/// Status codes accepted when no allow-list is configured.
inline const std::set<int>& default_status_allow() {
    static const std::set<int> codes = {200, 201, 202, 203, 204, 205, 206, 300, 301,
                                        302, 303, 304, 307, 308, 401, 403, 405};
    return codes;
}

inline bool is_success(int status) {
    return status >= 200 && status < 300;
}

inline bool is_redirect(int status) {
    return status >= 300 && status < 400;
}

inline std::chrono::milliseconds get_backoff_time(int attempt, int base_ms) {
    if (attempt <= 0)
        return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(static_cast<long long>(base_ms) * (1LL << (attempt - 1)));
}

}  // namespace Core
}  // namespace Burrow
