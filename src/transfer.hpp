#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace blob_sync {

enum class TransferKind { Upload, Download, Copy };

/// Lifecycle of a transfer:
///   pending -> inProgress -> {paused, completed, failed, cancelled}
///   paused  -> {inProgress, cancelled}
/// A pending transfer may also be paused, cancelled or failed before it
/// starts. completed, failed and cancelled are terminal.
enum class TransferState { Pending, InProgress, Paused, Completed, Failed, Cancelled };

const char* toString(TransferKind kind);
const char* toString(TransferState state);

/// Inverse of toString(); throws std::invalid_argument on unknown names.
TransferKind  transferKindFromString(const std::string& name);
TransferState transferStateFromString(const std::string& name);

bool isTerminal(TransferState state);

/// True if a record in @p from may move to @p to. Re-entering the same
/// state is not a transition.
bool canTransition(TransferState from, TransferState to);

/// Bytes moved so far; the total may be unknown.
struct TransferProgress {
    std::uint64_t                bytesTransferred = 0;
    std::optional<std::uint64_t> totalBytes;

    /// Completed fraction in [0, 1], or std::nullopt when the total is unknown.
    std::optional<double> fraction() const;

    bool operator==(const TransferProgress& other) const {
        return bytesTransferred == other.bytesTransferred && totalBytes == other.totalBytes;
    }
};

/// Where a transfer reads from or writes to: a local file, a remote
/// container/name pair, or both.
struct Location {
    std::optional<std::string> localPath;
    std::optional<std::string> container;
    std::optional<std::string> name;

    static Location local(std::string path);
    static Location remote(std::string container, std::string name);

    bool operator==(const Location& other) const {
        return localPath == other.localPath && container == other.container &&
               name == other.name;
    }
};

/// Persisted description of one long-running upload, download or copy.
struct TransferRecord {
    std::string                     id;
    TransferKind                    kind = TransferKind::Upload;
    std::optional<Location>         source;
    std::optional<Location>         destination;
    TransferState                   state = TransferState::Pending;
    std::optional<TransferProgress> progress;
    std::string                     restorationId;

    /// Fresh pending record with a random UUID identifier.
    static TransferRecord create(TransferKind kind,
                                 std::optional<Location> source,
                                 std::optional<Location> destination,
                                 std::string restorationId);

    bool isTerminal() const { return blob_sync::isTerminal(state); }

    /// Move to @p next if the state machine allows it.
    /// @return false (and no change) otherwise.
    bool transitionTo(TransferState next);
};

// nlohmann::json (de)serialization, found via ADL.
void to_json(nlohmann::json& j, const TransferProgress& p);
void from_json(const nlohmann::json& j, TransferProgress& p);
void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);
void to_json(nlohmann::json& j, const TransferRecord& r);
void from_json(const nlohmann::json& j, TransferRecord& r);

} // namespace blob_sync
