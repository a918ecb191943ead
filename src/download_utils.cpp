#include "longembed/download_utils.hpp"
#include "longembed/logger.hpp"
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <cctype>
#include <mutex>
#include <regex>

namespace longembed
{
    // CURL write callback function
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::ofstream *file)
    {
        size_t total_size = size * nmemb;
        file->write(static_cast<const char *>(contents), total_size);
        return file->good() ? total_size : 0;
    }

    // CURL header callback; keeps the ETag of the final response after redirects
    static size_t header_callback(char *buffer, size_t size, size_t nitems, std::string *etag)
    {
        size_t total_size = size * nitems;
        std::string line(buffer, total_size);
        if (line.rfind("HTTP/", 0) == 0)
        {
            etag->clear();
        }
        else
        {
            std::string value = parse_etag_header(line);
            if (!value.empty())
            {
                *etag = value;
            }
        }
        return total_size;
    }

    static std::filesystem::path etag_path_for(const std::string &local_path)
    {
        return std::filesystem::path(local_path + ".part.etag");
    }

    static void ensure_curl_initialized()
    {
        static std::once_flag curl_once;
        std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    bool is_valid_url(const std::string &url)
    {
        // Simple regex to check for HTTP/HTTPS URLs
        std::regex url_regex(R"(^https?:\/\/[^\s\/$.?#].[^\s]*$)", std::regex_constants::icase);
        return std::regex_match(url, url_regex);
    }

    std::string parse_etag_header(const std::string &line)
    {
        const std::string name = "etag:";
        if (line.size() <= name.size())
        {
            return "";
        }
        for (size_t i = 0; i < name.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(line[i])) != name[i])
            {
                return "";
            }
        }

        size_t begin = line.find_first_not_of(" \t", name.size());
        size_t end = line.find_last_not_of(" \t\r\n");
        if (begin == std::string::npos || end == std::string::npos || end < begin)
        {
            return "";
        }
        return line.substr(begin, end - begin + 1);
    }

    size_t resumable_bytes(const std::string &local_path, std::string &etag)
    {
        std::filesystem::path part_path(local_path + ".part");
        std::filesystem::path etag_path = etag_path_for(local_path);
        std::error_code ec;

        etag.clear();
        size_t size = 0;
        if (std::filesystem::exists(part_path, ec))
        {
            size = static_cast<size_t>(std::filesystem::file_size(part_path, ec));
            if (ec)
            {
                size = 0;
            }
            std::ifstream in(etag_path);
            std::getline(in, etag);
        }

        // Weak tags cannot guard a range request
        if (size == 0 || etag.empty() || etag.rfind("W/", 0) == 0)
        {
            if (size > 0)
            {
                Logger::logWarning("Discarding partial download %s without a usable ETag", part_path.string().c_str());
            }
            std::filesystem::remove(part_path, ec);
            std::filesystem::remove(etag_path, ec);
            etag.clear();
            return 0;
        }
        return size;
    }

    DownloadResult download_file(const std::string &url, const std::string &local_path,
                                 const std::vector<std::string> &headers)
    {
        // Validate URL
        if (!is_valid_url(url))
        {
            std::string error = "Invalid URL format: " + url;
            Logger::logError("%s", error.c_str());
            return DownloadResult(false, error);
        }

        std::filesystem::path file_path(local_path);
        std::filesystem::path part_path(local_path + ".part");

        std::error_code ec;
        if (file_path.has_parent_path())
        {
            std::filesystem::create_directories(file_path.parent_path(), ec);
            if (ec)
            {
                std::string error = "Failed to create directory " + file_path.parent_path().string() + ": " + ec.message();
                Logger::logError("%s", error.c_str());
                return DownloadResult(false, error);
            }
        }

        // Resume a previous partial download if its ETag is known
        std::string stored_etag;
        size_t resume_from = resumable_bytes(local_path, stored_etag);
        bool resuming = resume_from > 0;

        ensure_curl_initialized();

        // Initialize CURL
        CURL *curl = curl_easy_init();
        if (!curl)
        {
            std::string error = "Failed to initialize CURL";
            Logger::logError("%s", error.c_str());
            return DownloadResult(false, error);
        }

        // Open output file (append mode if resuming)
        std::ofstream output_file(part_path, resuming ? std::ios::binary | std::ios::app : std::ios::binary | std::ios::trunc);
        if (!output_file.is_open())
        {
            std::string error = "Failed to create output file: " + part_path.string();
            Logger::logError("%s", error.c_str());
            curl_easy_cleanup(curl);
            return DownloadResult(false, error);
        }

        struct curl_slist *header_list = nullptr;
        for (const auto &header : headers)
        {
            header_list = curl_slist_append(header_list, header.c_str());
        }
        if (resuming)
        {
            // A changed file answers 200 with the whole body instead of 206
            header_list = curl_slist_append(header_list, ("If-Range: " + stored_etag).c_str());
        }

        std::string response_etag;

        // Configure CURL options
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &output_file);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_etag);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "longembed/1.0");
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        if (header_list)
        {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }

        // Set timeouts to prevent hanging
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

        std::string range;
        if (resuming)
        {
            range = std::to_string(resume_from) + "-";
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
            Logger::logInfo("Resuming download of %s from byte %zu", url.c_str(), resume_from);
        }

        // Perform the download
        CURLcode res = curl_easy_perform(curl);

        long response_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

        // Clean up
        output_file.close();
        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);

        std::filesystem::path etag_path = etag_path_for(local_path);

        if (res != CURLE_OK)
        {
            // Keep the partial file and its ETag so the next attempt can resume
            if (!resuming && !response_etag.empty())
            {
                std::ofstream etag_file(etag_path, std::ios::trunc);
                etag_file << response_etag << "\n";
            }
            std::string error = "Download failed: " + std::string(curl_easy_strerror(res));
            Logger::logError("%s", error.c_str());
            return DownloadResult(false, error, "", 0, response_code);
        }

        // 200 on a resume means the file changed or the range was ignored; the body was appended to stale bytes
        if (resuming && response_code == 200)
        {
            Logger::logWarning("Partial download of %s is stale, restarting download", url.c_str());
            std::filesystem::remove(part_path, ec);
            std::filesystem::remove(etag_path, ec);
            return download_file(url, local_path, headers);
        }

        if (response_code != 200 && !(resuming && response_code == 206))
        {
            std::string error = "HTTP error: " + std::to_string(response_code) + " for " + url;
            Logger::logError("%s", error.c_str());
            std::filesystem::remove(part_path, ec);
            std::filesystem::remove(etag_path, ec);
            return DownloadResult(false, error, "", 0, response_code);
        }

        // Verify file was downloaded and has content
        size_t final_size = std::filesystem::exists(part_path, ec) ? static_cast<size_t>(std::filesystem::file_size(part_path, ec)) : 0;
        if (final_size == 0)
        {
            std::string error = "Downloaded file is empty or doesn't exist";
            Logger::logError("%s", error.c_str());
            std::filesystem::remove(part_path, ec);
            std::filesystem::remove(etag_path, ec);
            return DownloadResult(false, error, "", 0, response_code);
        }

        std::filesystem::rename(part_path, file_path, ec);
        if (ec)
        {
            std::string error = "Failed to move " + part_path.string() + " to " + local_path + ": " + ec.message();
            Logger::logError("%s", error.c_str());
            return DownloadResult(false, error, "", 0, response_code);
        }
        std::filesystem::remove(etag_path, ec);

        Logger::logInfo("Download completed successfully. File size: %zu bytes %s",
                        final_size, resuming ? "(resumed)" : "(full download)");

        return DownloadResult(true, "", local_path, final_size, response_code);
    }

} // namespace longembed
