//
// Created by Giuseppe Francione on 02/03/26.
//

#include "../../include/errors.hpp"
#include <cerrno>

namespace trawl {

std::string_view to_string(const ErrorClass cls) noexcept {
    switch (cls) {
        case ErrorClass::Transient: return "transient";
        case ErrorClass::Permanent: return "permanent";
        case ErrorClass::Fatal:     return "fatal";
    }
    return "unknown";
}

TransferError::TransferError(const ErrorClass cls, const std::string& what, const long http_status)
    : std::runtime_error(what), cls_(cls), http_status_(http_status) {}

ErrorClass classify_http_status(const long status) noexcept {
    if (status == 408 || status == 425 || status == 429) {
        return ErrorClass::Transient;
    }
    if (status >= 400 && status < 500) {
        return ErrorClass::Permanent;
    }
    return ErrorClass::Transient;
}

ErrorClass classify_filesystem_error(const std::error_code& ec) noexcept {
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return ErrorClass::Transient;
    }
    switch (ec.value()) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorClass::Fatal;
        default:
            return ErrorClass::Transient;
    }
}

void throw_io_error(const std::error_code& ec, const std::string& what) {
    throw TransferError(classify_filesystem_error(ec), what + ": " + ec.message());
}

} // namespace trawl
