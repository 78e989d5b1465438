#pragma once

#include "dispatcher.hpp"
#include "transfer.hpp"
#include "transfer_notifier.hpp"
#include "transfer_store.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blob_sync {

/// Ordered collection of transfers backed by a durable store.
///
/// Lifecycle requests (cancel / pause / resume) apply the state transition
/// right away if the state machine allows it. The executing worker sees the
/// new state and stops or continues on its own schedule.
///
/// Every mutation is staged on a copy of the records and saved to the store
/// before it becomes visible. If the save throws, the registry keeps its
/// previous records, nobody is notified, and the StoreError propagates.
/// Notifications are posted on the dispatcher, or run inline when there is
/// none.
///
/// Completed, failed and cancelled records stay in the registry until they
/// are removed explicitly.
class TransferRegistry {
public:
    /// A persisted transfer re-attached to a live client.
    struct RestoredTransfer {
        TransferRecord                   record;
        std::shared_ptr<RequestExecutor> client;
        TransferOptions                  options;
    };

    explicit TransferRegistry(std::shared_ptr<TransferStore> store,
                              std::shared_ptr<TransferNotifier> notifier = nullptr,
                              std::shared_ptr<Dispatcher> dispatcher = nullptr,
                              bool verbose = false);

    // ---- membership ----

    /// @throws std::invalid_argument if the id is empty or already present.
    void add(TransferRecord record);

    /// Remove a record, cancelling it first if it is not terminal.
    /// @return false if no record has this id.
    bool remove(const std::string& id);
    bool remove(const TransferRecord& record) { return remove(record.id); }
    void removeAll();

    // ---- lifecycle requests ----

    bool cancel(const std::string& id);
    bool cancel(const TransferRecord& record) { return cancel(record.id); }
    void cancelAll();

    bool pause(const std::string& id);
    bool pause(const TransferRecord& record) { return pause(record.id); }
    void pauseAll();

    /// Only paused transfers can be resumed.
    bool resume(const std::string& id);
    bool resume(const TransferRecord& record) { return resume(record.id); }
    void resumeAll();

    // ---- reports from the executing worker ----

    /// Move to @p state (and record @p progress). Invalid transitions are
    /// rejected and leave the record untouched.
    bool updateState(const std::string& id,
                     TransferState state,
                     const std::optional<TransferProgress>& progress = std::nullopt);

    /// Record progress without changing state. Rejected for terminal records.
    bool reportProgress(const std::string& id, const TransferProgress& progress);

    bool reportFailure(const std::string& id, const std::string& error);

    bool reportCompletion(const std::string& id);

    // ---- queries ----

    std::size_t count() const;

    /// Record at insertion position @p index; throws std::out_of_range.
    TransferRecord at(std::size_t index) const;

    /// Snapshot of all records in insertion order.
    std::vector<TransferRecord> transfers() const;

    std::optional<TransferRecord> get(const std::string& id) const;

    // ---- persistence ----

    /// Replace the in-memory set with the stored one. Call once at startup.
    void loadContext();

    /// Persist the in-memory set.
    void saveContext();

    // ---- restoration ----

    /// Pair a non-terminal record with the notifier's client and options.
    /// @return std::nullopt if the record is unknown, terminal, or the
    ///         notifier has no client for its restoration id.
    std::optional<RestoredTransfer> restore(const std::string& id) const;

    /// restore() applied to every non-terminal record, in order.
    std::vector<RestoredTransfer> restorable() const;

    void setVerbose(bool v) { mVerbose = v; }

private:
    using Notification = std::function<void(TransferNotifier&)>;
    using Records      = std::vector<TransferRecord>;

    /// Edits a staged copy of the records and queues notifications.
    /// Returns false when nothing changed.
    using Mutation = std::function<bool(Records&, std::vector<Notification>&)>;

    /// Run @p mutate on a copy, save the copy, then install it and notify.
    /// Mutations are serialized by mStoreMutex.
    /// @return the mutation's result; false means nothing was saved.
    bool commit(const Mutation& mutate);

    /// Apply a lifecycle request to one staged record.
    bool applyRequest(TransferRecord& record,
                      TransferState target,
                      std::vector<Notification>& notifications) const;

    /// Apply a worker update to a staged record; std::nullopt keeps the state.
    bool applyUpdate(Records& records,
                     const std::string& id,
                     std::optional<TransferState> state,
                     const std::optional<TransferProgress>& progress,
                     std::vector<Notification>& notifications) const;

    /// Apply @p target to one record, persist, then notify.
    bool requestOne(const std::string& id, TransferState target, bool onlyPaused);

    /// Apply @p target to every record, persist once, then notify.
    void requestAll(TransferState target, bool onlyPaused);

    std::optional<RestoredTransfer> restoreRecord(const TransferRecord& record) const;

    void notify(std::vector<Notification> notifications);

    std::shared_ptr<TransferStore>    mStore;
    std::shared_ptr<TransferNotifier> mNotifier;
    std::shared_ptr<Dispatcher>       mDispatcher;
    bool                              mVerbose;

    mutable std::mutex                mMutex;        // guards mRecords
    std::mutex                        mStoreMutex;   // serializes mutations and store access
    Records                           mRecords;
};

} // namespace blob_sync
