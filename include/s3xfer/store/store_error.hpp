#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace s3xfer::store {

enum class StoreErrorCode {
    NOT_FOUND,
    NO_SUCH_BUCKET,
    NO_SUCH_UPLOAD,
    ACCESS_DENIED,
    INVALID_ARGUMENT,
    INVALID_RANGE,
    INVALID_PART,
    THROTTLED,
    UNAVAILABLE,
    TIMEOUT,
    CONNECTION,
    IO_ERROR,
    UNKNOWN
};

// Plain-language message for a backend error code such as "NoSuchKey".
// The first element is shown to the user, the second is the raw detail.
std::pair<std::string, std::string> translate_error(const std::string& backend_code,
                                                    const std::string& backend_message,
                                                    const std::string& raw_detail);

StoreErrorCode classify_error_code(const std::string& backend_code);

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorCode code, std::string backend_code,
               std::string user_message, std::string detail);
    
    // Builds the user message from the translation table
    static StoreError from_backend(const std::string& backend_code,
                                   const std::string& backend_message,
                                   const std::string& detail);
    
    StoreErrorCode code() const { return code_; }
    const std::string& backend_code() const { return backend_code_; }
    const std::string& user_message() const { return user_message_; }
    const std::string& detail() const { return detail_; }
    
    bool is_not_found() const {
        return code_ == StoreErrorCode::NOT_FOUND || code_ == StoreErrorCode::NO_SUCH_UPLOAD;
    }
    
private:
    StoreErrorCode code_;
    std::string backend_code_;
    std::string user_message_;
    std::string detail_;
};

} // namespace s3xfer::store
