#include "files/job_validator.hpp"
#include "common/errors.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <cctype>

namespace {

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

void check_required(std::vector<JobValidator::FieldError>& errors, const char* field,
                    const std::string& value, size_t max_len) {
    if (blank(value)) {
        errors.push_back({field, std::string(field) + " is required"});
    } else if (value.size() > max_len) {
        errors.push_back({field, std::string(field) + " must be " + std::to_string(max_len) +
                                 " characters or less"});
    }
}

} // namespace

bool JobValidator::is_http_url(const std::string& url) {
    std::string lower = url;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t host_start;
    if (lower.rfind("http://", 0) == 0) host_start = 7;
    else if (lower.rfind("https://", 0) == 0) host_start = 8;
    else return false;

    size_t host_end = lower.find_first_of("/?#", host_start);
    std::string host = lower.substr(host_start, host_end == std::string::npos
                                                    ? std::string::npos
                                                    : host_end - host_start);
    return !host.empty() && host.find(' ') == std::string::npos;
}

std::vector<JobValidator::FieldError> JobValidator::check(const Job& job) {
    std::vector<FieldError> errors;

    check_required(errors, "name", job.name, 100);
    check_required(errors, "version", job.version, 50);
    check_required(errors, "arch", job.arch, 20);
    if (job.edition.size() > 50) {
        errors.push_back({"edition", "edition must be 50 characters or less"});
    }

    if (blank(job.download_url)) {
        errors.push_back({"download_url", "download_url is required"});
    } else if (job.download_url.size() > 2048) {
        errors.push_back({"download_url", "download_url must be 2048 characters or less"});
    } else if (!is_http_url(job.download_url)) {
        errors.push_back({"download_url", "download_url must be a valid HTTP or HTTPS URL"});
    }

    if (!job.checksum_url.empty()) {
        if (job.checksum_url.size() > 2048) {
            errors.push_back({"checksum_url", "checksum_url must be 2048 characters or less"});
        } else if (!is_http_url(job.checksum_url)) {
            errors.push_back({"checksum_url", "checksum_url must be a valid HTTP or HTTPS URL"});
        }
        if (job.checksum_type.empty()) {
            errors.push_back({"checksum_type", "checksum_type is required when checksum_url is set"});
        }
    }

    if (!job.checksum_type.empty() && !Hasher::is_supported_algorithm(job.checksum_type)) {
        errors.push_back({"checksum_type", "checksum_type must be one of: sha256 sha512 md5"});
    }

    if (!JobNaming::is_supported_file_type(job.file_type)) {
        errors.push_back({"file_type", "unsupported file type: " + job.file_type});
    }

    return errors;
}

void JobValidator::validate(const Job& job) {
    auto errors = check(job);
    if (errors.empty()) return;

    std::string message;
    for (const auto& e : errors) {
        if (!message.empty()) message += "; ";
        message += e.field + ": " + e.message;
    }
    throw ValidationError(message);
}
