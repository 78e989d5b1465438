#include "errors.hpp"

namespace blob_sync {

PagingError::PagingError(Kind kind, const std::string& message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message)
    , mKind(kind) {}

const char* toString(PagingError::Kind kind) {
    switch (kind) {
        case PagingError::Kind::NoData:        return "NoData";
        case PagingError::Kind::NotPaged:      return "NotPaged";
        case PagingError::Kind::AmbiguousPath: return "AmbiguousPath";
        case PagingError::Kind::Transport:     return "TransportError";
        case PagingError::Kind::Decode:        return "DecodeError";
    }
    return "Unknown";
}

} // namespace blob_sync
