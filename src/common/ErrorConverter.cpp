// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * objlock a distributed lock on top of object storage.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "objlock/common/ErrorConverter.hpp"
#include "proto/error.pb.h"
#include <google/protobuf/any.pb.h>
#include <stdexcept>
#include <grpcpp/support/status.h>
#include "objlock/common/Error.hpp"

namespace objlock {

grpc::StatusCode toGrpcStatusCode(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK:
            return grpc::StatusCode::OK;

        case ErrorCode::NotFound:
            return grpc::StatusCode::NOT_FOUND;

        case ErrorCode::InvalidArg:
            return grpc::StatusCode::INVALID_ARGUMENT;

        case ErrorCode::Conflict:
            return grpc::StatusCode::ABORTED;

        case ErrorCode::ServiceTemporarilyUnavailable:
            return grpc::StatusCode::UNAVAILABLE;

        case ErrorCode::Timeout:
            return grpc::StatusCode::DEADLINE_EXCEEDED;

        case ErrorCode::Cancelled:
            return grpc::StatusCode::CANCELLED;

        case ErrorCode::Encoding:
            return grpc::StatusCode::DATA_LOSS;

        case ErrorCode::Internal:
            return grpc::StatusCode::INTERNAL;

        default:
            return grpc::StatusCode::UNKNOWN;
    }
}

grpc::Status toGrpcStatus(const Error& error) {
    if (error.code == ErrorCode::OK) {
        throw std::logic_error("Cannot convert OK error to a failed status");
    }
    proto::ErrorDetails details;
    details.set_code(static_cast<proto::ErrorCode>(error.code));
    details.set_what(error.what);
    details.set_bucket(error.bucket);
    details.set_key(error.key);
    google::protobuf::Any anyDetail;
    anyDetail.PackFrom(details);
    return grpc::Status(toGrpcStatusCode(error.code), error.what, anyDetail.SerializeAsString());
}

Error toError(const grpc::Status& status) {
    if (status.error_code() == grpc::StatusCode::OK) {
        throw std::logic_error("Cannot convert OK status to error");
    }
    ErrorCode code = ErrorCode::Unknown;
    proto::ErrorDetails details;
    google::protobuf::Any any;
    if (any.ParseFromString(status.error_details())) {
        if (any.UnpackTo(&details)) {
            code = static_cast<ErrorCode>(details.code());
            return Error(code, details.what(), details.bucket(), details.key());
        }
    }
    switch (status.error_code()) {
        case grpc::StatusCode::NOT_FOUND:
            code = ErrorCode::NotFound;
            break;
        case grpc::StatusCode::INVALID_ARGUMENT:
            code = ErrorCode::InvalidArg;
            break;
        case grpc::StatusCode::ABORTED:
            code = ErrorCode::Conflict;
            break;
        case grpc::StatusCode::UNAVAILABLE:
            code = ErrorCode::ServiceTemporarilyUnavailable;
            break;
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            code = ErrorCode::Timeout;
            break;
        case grpc::StatusCode::CANCELLED:
            code = ErrorCode::Cancelled;
            break;
        case grpc::StatusCode::DATA_LOSS:
            code = ErrorCode::Encoding;
            break;
        case grpc::StatusCode::INTERNAL:
            code = ErrorCode::Internal;
            break;
        default:
            code = ErrorCode::Unknown;
    }
    return Error(code, status.error_message());
}

} // namespace objlock
