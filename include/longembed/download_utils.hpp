#pragma once

#include "export.hpp"
#include <string>
#include <vector>

namespace longembed {

    // Download result structure
    struct DownloadResult {
        bool success;
        std::string error_message;
        std::string local_path;
        size_t total_bytes;
        long http_status;

        DownloadResult() : success(false), total_bytes(0), http_status(0) {}
        DownloadResult(bool success, const std::string& error = "", const std::string& path = "", size_t bytes = 0, long status = 0)
            : success(success), error_message(error), local_path(path), total_bytes(bytes), http_status(status) {}
    };

    /**
     * Check if a string is a valid HTTP/HTTPS URL
     * @param url The URL string to validate
     * @return true if the string is a valid HTTP/HTTPS URL
     */
    LONGEMBED_API bool is_valid_url(const std::string& url);

    /**
     * Extract the entity tag from a raw response header line.
     * @return The tag including its quotes, or "" if the line is not an ETag header
     */
    LONGEMBED_API std::string parse_etag_header(const std::string& line);

    /**
     * Bytes of "<local_path>.part" that may be resumed.
     * A partial file is only resumable together with the strong ETag stored
     * beside it in "<local_path>.part.etag"; otherwise both are removed.
     * @param local_path Final path of the download
     * @param etag Receives the stored tag when the result is non-zero
     */
    LONGEMBED_API size_t resumable_bytes(const std::string& local_path, std::string& etag);

    /**
     * Download a file from a URL to a local path.
     * Data is written to "<local_path>.part" and renamed on success. An
     * interrupted download keeps the partial file and the response ETag; the
     * next attempt resumes with a range request guarded by If-Range, so a
     * changed file is fetched again from the start.
     * @param url The URL to download from
     * @param local_path The local path to save the file to
     * @param headers Extra request headers ("Name: value")
     * @return DownloadResult containing success status and details
     */
    LONGEMBED_API DownloadResult download_file(
        const std::string& url,
        const std::string& local_path,
        const std::vector<std::string>& headers = {}
    );

} // namespace longembed
