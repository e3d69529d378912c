#ifndef ISOFETCH_JOB_VALIDATOR_HPP
#define ISOFETCH_JOB_VALIDATOR_HPP

#include <string>
#include <utility>
#include <vector>

#include "job.hpp"

// Submission-time checks. A job that fails here never reaches the queue.
class JobValidator {
public:
    struct FieldError {
        std::string field;
        std::string message;
    };

    // Every problem found, in field order. Empty means the job is acceptable.
    static std::vector<FieldError> check(const Job& job);

    // Throws ValidationError("field: message; field: message") when check() finds anything.
    static void validate(const Job& job);

    static bool is_http_url(const std::string& url);
};

#endif // ISOFETCH_JOB_VALIDATOR_HPP
