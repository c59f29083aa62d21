// Result.hpp
#pragma once
#include <string>

enum class ErrorCode {
    None,
    Config,            // bad options, unsupported source/destination combination
    Io,                // local disk failure
    Transient,         // network blip or throttling, worth another attempt
    Integrity,         // wrong passphrase, corrupted or truncated ciphertext
    NotFound,
    Remote,            // object store refused the request
    Cancelled,
    DeadlineExceeded
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::Config: return "config";
        case ErrorCode::Io: return "io";
        case ErrorCode::Transient: return "transient";
        case ErrorCode::Integrity: return "integrity";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::Remote: return "remote";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::DeadlineExceeded: return "deadline-exceeded";
    }
    return "unknown";
}

template<typename T>
struct Result {
    bool success;
    std::string message;
    T data;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(const T& data) {
        return {true, "", data, ErrorCode::None};
    }

    static Result<T> Error(const std::string& msg, ErrorCode code = ErrorCode::Io) {
        return {false, msg, T{}, code};
    }

    // carries the failure of another result over, keeping its code
    template<typename U>
    static Result<T> From(const Result<U>& other, const std::string& context = "") {
        return {false, context.empty() ? other.message : context + ": " + other.message, T{}, other.code};
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    std::string message;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Error(const std::string& msg, ErrorCode code = ErrorCode::Io) {
        return {false, msg, code};
    }

    template<typename U>
    static Result<void> From(const Result<U>& other, const std::string& context = "") {
        return {false, context.empty() ? other.message : context + ": " + other.message, other.code};
    }
};

inline bool isCancellation(ErrorCode code) {
    return code == ErrorCode::Cancelled || code == ErrorCode::DeadlineExceeded;
}
