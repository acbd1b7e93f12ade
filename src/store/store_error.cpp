#include "s3xfer/store/store_error.hpp"
#include <unordered_map>

namespace s3xfer::store {

namespace {

struct ErrorText {
    const char* message;
    const char* suggestion;
};

const std::unordered_map<std::string, ErrorText>& error_table() {
    static const std::unordered_map<std::string, ErrorText> table = {
        {"InvalidAccessKeyId", {"Invalid access key.",
            "Check that your Access Key ID is correct in your profile configuration."}},
        {"SignatureDoesNotMatch", {"Invalid secret key.",
            "Check that your Secret Access Key is correct in your profile configuration."}},
        {"AccessDenied", {"Access denied.",
            "Your credentials don't have permission for this action. Check your IAM policy."}},
        {"NoSuchBucket", {"Bucket not found.",
            "The bucket may have been deleted or you may have a typo in the name."}},
        {"NoSuchKey", {"File not found.",
            "The file may have been deleted or moved by someone else."}},
        {"NoSuchUpload", {"Multipart upload not found.",
            "The upload may have been aborted or expired on the server."}},
        {"BucketAlreadyOwnedByYou", {"You already own this bucket.", ""}},
        {"BucketNotEmpty", {"Bucket is not empty.",
            "Delete all files in the bucket before deleting it."}},
        {"EntityTooLarge", {"File is too large for a single upload.",
            "Large files should go through multipart upload. Please report this bug."}},
        {"SlowDown", {"The server is asking us to slow down.",
            "Too many requests. The transfer will retry automatically."}},
        {"ServiceUnavailable", {"The storage service is temporarily unavailable.",
            "Try again in a few moments."}},
        {"InternalError", {"The storage service encountered an internal error.",
            "Try again in a few moments."}},
        {"RequestTimeout", {"The request timed out.",
            "Check your network connection and try again."}},
        {"ExpiredToken", {"Your credentials have expired.",
            "Update the credentials of your profile."}},
        {"InvalidBucketName", {"Invalid bucket name.",
            "Bucket names must be 3-63 characters, lowercase letters, numbers, and hyphens."}},
        {"KeyTooLongError", {"File name is too long.",
            "Object keys can be at most 1024 bytes."}},
        {"InvalidPart", {"A part of the upload is missing or does not match.",
            "Retry the transfer to upload the missing parts again."}},
        {"InvalidPartOrder", {"Upload parts were listed out of order.", ""}},
        {"InvalidRange", {"The requested byte range is not available.",
            "The remote file may have changed size. Retry the transfer."}},
    };
    return table;
}

} // namespace

StoreErrorCode classify_error_code(const std::string& backend_code) {
    static const std::unordered_map<std::string, StoreErrorCode> codes = {
        {"NoSuchKey", StoreErrorCode::NOT_FOUND},
        {"NotFound", StoreErrorCode::NOT_FOUND},
        {"NoSuchBucket", StoreErrorCode::NO_SUCH_BUCKET},
        {"NoSuchUpload", StoreErrorCode::NO_SUCH_UPLOAD},
        {"AccessDenied", StoreErrorCode::ACCESS_DENIED},
        {"InvalidAccessKeyId", StoreErrorCode::ACCESS_DENIED},
        {"SignatureDoesNotMatch", StoreErrorCode::ACCESS_DENIED},
        {"ExpiredToken", StoreErrorCode::ACCESS_DENIED},
        {"InvalidArgument", StoreErrorCode::INVALID_ARGUMENT},
        {"InvalidBucketName", StoreErrorCode::INVALID_ARGUMENT},
        {"KeyTooLongError", StoreErrorCode::INVALID_ARGUMENT},
        {"EntityTooLarge", StoreErrorCode::INVALID_ARGUMENT},
        {"InvalidRange", StoreErrorCode::INVALID_RANGE},
        {"InvalidPart", StoreErrorCode::INVALID_PART},
        {"InvalidPartOrder", StoreErrorCode::INVALID_PART},
        {"SlowDown", StoreErrorCode::THROTTLED},
        {"ServiceUnavailable", StoreErrorCode::UNAVAILABLE},
        {"InternalError", StoreErrorCode::UNAVAILABLE},
        {"RequestTimeout", StoreErrorCode::TIMEOUT},
        {"ConnectionError", StoreErrorCode::CONNECTION},
        {"IOError", StoreErrorCode::IO_ERROR},
    };
    
    auto it = codes.find(backend_code);
    return it != codes.end() ? it->second : StoreErrorCode::UNKNOWN;
}

std::pair<std::string, std::string> translate_error(const std::string& backend_code,
                                                    const std::string& backend_message,
                                                    const std::string& raw_detail) {
    const auto& table = error_table();
    auto it = table.find(backend_code);
    if (it != table.end()) {
        std::string user_message = it->second.message;
        if (it->second.suggestion[0] != '\0') {
            user_message += " ";
            user_message += it->second.suggestion;
        }
        return {user_message, raw_detail};
    }
    
    if (backend_code == "ConnectionError") {
        return {"Could not connect to the storage service. Check your network connection and try again.",
                raw_detail};
    }
    if (backend_code == "IOError") {
        return {"A local storage error occurred.", raw_detail};
    }
    
    if (!backend_message.empty()) {
        return {"Storage error: " + backend_message, raw_detail};
    }
    return {"An unexpected storage error occurred.", raw_detail};
}

StoreError::StoreError(StoreErrorCode code, std::string backend_code,
                       std::string user_message, std::string detail)
    : std::runtime_error(user_message)
    , code_(code)
    , backend_code_(std::move(backend_code))
    , user_message_(std::move(user_message))
    , detail_(std::move(detail)) {
}

StoreError StoreError::from_backend(const std::string& backend_code,
                                    const std::string& backend_message,
                                    const std::string& detail) {
    auto [user_message, raw] = translate_error(backend_code, backend_message, detail);
    return StoreError(classify_error_code(backend_code), backend_code, user_message, raw);
}

} // namespace s3xfer::store
