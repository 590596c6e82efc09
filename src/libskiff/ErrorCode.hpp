/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_ErrorCode_hpp
#define libskiff_ErrorCode_hpp

#include <string>

namespace libskiff {

/**
 * Classification of the failures a transport run can produce.
 * Every libskiff::Error carries one of these codes; errors raised through
 * SKIFF_THROW_ERROR are Generic.
 */
enum class ErrorCode {
    Generic,
    InvalidAddress,
    SessionEstablishmentFailure,
    ExportFailure,
    EmptyArchiveFailure,
    InventoryUnavailable,
    MalformedManifest,
    ExecutionFailure,
    IOFailure
};

std::string errorCodeToString(ErrorCode);

}

#endif
