#include "transfer_filters.hpp"

#include <algorithm>
#include <iterator>

namespace blob_sync {

namespace {

template <typename Pred>
std::vector<TransferRecord> filtered(const std::vector<TransferRecord>& transfers, Pred pred) {
    std::vector<TransferRecord> out;
    std::copy_if(transfers.begin(), transfers.end(), std::back_inserter(out), pred);
    return out;
}

bool isLocal(const std::optional<Location>& location, const std::string& localPath) {
    return location && location->localPath && *location->localPath == localPath;
}

bool isRemote(const std::optional<Location>& location,
              const std::string& container,
              const std::string& name) {
    return location && location->container && location->name &&
           *location->container == container && *location->name == name;
}

} // namespace

std::vector<TransferRecord> uploadsFrom(const std::vector<TransferRecord>& transfers,
                                        const std::string& localPath) {
    return filtered(transfers, [&](const TransferRecord& t) {
        return t.kind == TransferKind::Upload && isLocal(t.source, localPath);
    });
}

std::vector<TransferRecord> downloadsFrom(const std::vector<TransferRecord>& transfers,
                                          const std::string& container,
                                          const std::string& name) {
    return filtered(transfers, [&](const TransferRecord& t) {
        return t.kind == TransferKind::Download && isRemote(t.source, container, name);
    });
}

std::vector<TransferRecord> downloadsTo(const std::vector<TransferRecord>& transfers,
                                        const std::string& localPath) {
    return filtered(transfers, [&](const TransferRecord& t) {
        return t.kind == TransferKind::Download && isLocal(t.destination, localPath);
    });
}

std::vector<TransferRecord> uploadsTo(const std::vector<TransferRecord>& transfers,
                                      const std::string& container,
                                      const std::string& name) {
    return filtered(transfers, [&](const TransferRecord& t) {
        return t.kind == TransferKind::Upload && isRemote(t.destination, container, name);
    });
}

std::vector<TransferRecord> ofKind(const std::vector<TransferRecord>& transfers,
                                   TransferKind kind) {
    return filtered(transfers, [kind](const TransferRecord& t) { return t.kind == kind; });
}

std::vector<TransferRecord> inState(const std::vector<TransferRecord>& transfers,
                                    TransferState state) {
    return filtered(transfers, [state](const TransferRecord& t) { return t.state == state; });
}

std::optional<TransferRecord> findById(const std::vector<TransferRecord>& transfers,
                                       const std::string& id) {
    auto it = std::find_if(transfers.begin(), transfers.end(),
                           [&id](const TransferRecord& t) { return t.id == id; });
    if (it == transfers.end()) return std::nullopt;
    return *it;
}

} // namespace blob_sync
