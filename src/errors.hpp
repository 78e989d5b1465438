#pragma once

#include <stdexcept>
#include <string>

namespace blob_sync {

/// Failure raised while seeding or advancing a paged result set.
class PagingError : public std::runtime_error {
public:
    enum class Kind {
        NoData,         // empty payload where one was required
        NotPaged,       // items path not present in the payload
        AmbiguousPath,  // more than one array / token matched a key path
        Transport,      // propagated from the request executor
        Decode          // item could not be converted to the element type
    };

    PagingError(Kind kind, const std::string& message);

    Kind kind() const { return mKind; }

private:
    Kind mKind;
};

/// Human-readable name of a PagingError kind, e.g. "NotPaged".
const char* toString(PagingError::Kind kind);

/// Failure reading or writing the durable transfer store.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace blob_sync
