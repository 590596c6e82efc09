/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_Error_hpp
#define libskiff_Error_hpp

#include <cassert>
#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cstring>

#include <boost/filesystem.hpp>

#include "libskiff/LogLevel.hpp"
#include "libskiff/ErrorCode.hpp"

namespace libskiff {

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macros SKIFF_THROW_ERROR or
 * SKIFF_THROW_CODED_ERROR. Additional error trace entries are created by the
 * macro SKIFF_RETHROW_ERROR.
 *
 * The error code is set when the error is first thrown and is preserved across
 * rethrows, so that the top-level handler (or a component with a fallback
 * strategy) can tell which kind of failure occurred regardless of how many
 * layers added context to the trace.
 *
 * Note: this class should be instantiated and thrown through the SKIFF_THROW_ERROR macros.
 * Caught instances of this class should be rethrown through the SKIFF_RETHROW_ERROR macro.
 * The user is not supposed to instantiate and throw this class "manually".
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry, ErrorCode code = ErrorCode::Generic)
        : logLevel{ logLevel }
        , code{ code }
        , errorTrace{ entry }
    {}

    const char* what() const noexcept override {
        // Return the 'what()' of the original exception that generated this error trace
        // as if the original exception was propagated directly up to the current
        // stack frame, i.e. without intermediate catch-rethrows.
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

    ErrorCode getCode() const {
        return code;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    ErrorCode code = ErrorCode::Generic;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


// SKIFF_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define SKIFF_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define SKIFF_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = libskiff::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libskiff::Error{logLevel, stackTraceEntry}; \
}

#define SKIFF_THROW_ERROR_1(errorMessage) SKIFF_THROW_ERROR_2(errorMessage, libskiff::LogLevel::ERROR)

#define SKIFF_THROW_ERROR(...) SKIFF_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, SKIFF_THROW_ERROR_2, SKIFF_THROW_ERROR_1)(__VA_ARGS__)


// SKIFF_THROW_CODED_ERROR macro
#define SKIFF_THROW_CODED_ERROR(errorCode, errorMessage) { \
    auto stackTraceEntry = libskiff::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libskiff::Error{libskiff::LogLevel::ERROR, stackTraceEntry, errorCode}; \
}


// SKIFF_RETHROW_ERROR macros
#define SKIFF_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define SKIFF_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libskiff::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    const auto* cp = dynamic_cast<const libskiff::Error*>(&exception); \
    if(cp) { /* check if dynamic type is libskiff::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* a libskiff::Error object must be caught as non-const reference because we need to modify its internal error trace */ \
        auto* p = const_cast<libskiff::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libskiff::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                        libskiff::getExceptionTypeString(exception)}; \
        auto error = libskiff::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define SKIFF_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libskiff::Error*>(&exception); \
    if(cp) { \
        /* get log level if dynamic type is libskiff::Error */ \
        SKIFF_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        SKIFF_RETHROW_ERROR_3(exception, errorMessage, libskiff::LogLevel::ERROR) \
    } \
}

#define SKIFF_RETHROW_ERROR(...) SKIFF_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, SKIFF_RETHROW_ERROR_3, SKIFF_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
