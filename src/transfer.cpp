#include "transfer.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <stdexcept>

namespace blob_sync {

using json = nlohmann::json;

const char* toString(TransferKind kind) {
    switch (kind) {
        case TransferKind::Upload:   return "upload";
        case TransferKind::Download: return "download";
        case TransferKind::Copy:     return "copy";
    }
    return "unknown";
}

const char* toString(TransferState state) {
    switch (state) {
        case TransferState::Pending:    return "pending";
        case TransferState::InProgress: return "inProgress";
        case TransferState::Paused:     return "paused";
        case TransferState::Completed:  return "completed";
        case TransferState::Failed:     return "failed";
        case TransferState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

TransferKind transferKindFromString(const std::string& name) {
    if (name == "upload")   return TransferKind::Upload;
    if (name == "download") return TransferKind::Download;
    if (name == "copy")     return TransferKind::Copy;
    throw std::invalid_argument("Unknown transfer kind: " + name);
}

TransferState transferStateFromString(const std::string& name) {
    if (name == "pending")    return TransferState::Pending;
    if (name == "inProgress") return TransferState::InProgress;
    if (name == "paused")     return TransferState::Paused;
    if (name == "completed")  return TransferState::Completed;
    if (name == "failed")     return TransferState::Failed;
    if (name == "cancelled")  return TransferState::Cancelled;
    throw std::invalid_argument("Unknown transfer state: " + name);
}

bool isTerminal(TransferState state) {
    return state == TransferState::Completed ||
           state == TransferState::Failed ||
           state == TransferState::Cancelled;
}

bool canTransition(TransferState from, TransferState to) {
    switch (from) {
        case TransferState::Pending:
            return to == TransferState::InProgress || to == TransferState::Paused ||
                   to == TransferState::Failed || to == TransferState::Cancelled;
        case TransferState::InProgress:
            return to == TransferState::Paused || to == TransferState::Completed ||
                   to == TransferState::Failed || to == TransferState::Cancelled;
        case TransferState::Paused:
            return to == TransferState::InProgress || to == TransferState::Cancelled;
        case TransferState::Completed:
        case TransferState::Failed:
        case TransferState::Cancelled:
            return false;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Value types
// ---------------------------------------------------------------------------

std::optional<double> TransferProgress::fraction() const {
    if (!totalBytes) return std::nullopt;
    if (*totalBytes == 0) return 1.0;
    return static_cast<double>(bytesTransferred) / static_cast<double>(*totalBytes);
}

Location Location::local(std::string path) {
    Location l;
    l.localPath = std::move(path);
    return l;
}

Location Location::remote(std::string container, std::string name) {
    Location l;
    l.container = std::move(container);
    l.name      = std::move(name);
    return l;
}

TransferRecord TransferRecord::create(TransferKind kind,
                                      std::optional<Location> source,
                                      std::optional<Location> destination,
                                      std::string restorationId) {
    static thread_local boost::uuids::random_generator generator;

    TransferRecord r;
    r.id            = boost::uuids::to_string(generator());
    r.kind          = kind;
    r.source        = std::move(source);
    r.destination   = std::move(destination);
    r.restorationId = std::move(restorationId);
    return r;
}

bool TransferRecord::transitionTo(TransferState next) {
    if (!canTransition(state, next)) {
        return false;
    }
    state = next;
    return true;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

namespace {

template <typename V>
void putOptional(json& j, const char* key, const std::optional<V>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename V>
void getOptional(const json& j, const char* key, std::optional<V>& value) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        value.reset();
    } else {
        value = it->template get<V>();
    }
}

} // namespace

void to_json(json& j, const TransferProgress& p) {
    j = json{{"bytesTransferred", p.bytesTransferred}};
    putOptional(j, "totalBytes", p.totalBytes);
}

void from_json(const json& j, TransferProgress& p) {
    p.bytesTransferred = j.at("bytesTransferred").get<std::uint64_t>();
    getOptional(j, "totalBytes", p.totalBytes);
}

void to_json(json& j, const Location& l) {
    j = json::object();
    putOptional(j, "localPath", l.localPath);
    putOptional(j, "container", l.container);
    putOptional(j, "name", l.name);
}

void from_json(const json& j, Location& l) {
    getOptional(j, "localPath", l.localPath);
    getOptional(j, "container", l.container);
    getOptional(j, "name", l.name);
}

void to_json(json& j, const TransferRecord& r) {
    j = json{
        {"id", r.id},
        {"kind", toString(r.kind)},
        {"state", toString(r.state)},
        {"restorationId", r.restorationId}
    };
    putOptional(j, "source", r.source);
    putOptional(j, "destination", r.destination);
    putOptional(j, "progress", r.progress);
}

void from_json(const json& j, TransferRecord& r) {
    r.id            = j.at("id").get<std::string>();
    r.kind          = transferKindFromString(j.at("kind").get<std::string>());
    r.state         = transferStateFromString(j.at("state").get<std::string>());
    r.restorationId = j.value("restorationId", "");
    getOptional(j, "source", r.source);
    getOptional(j, "destination", r.destination);
    getOptional(j, "progress", r.progress);
}

} // namespace blob_sync
