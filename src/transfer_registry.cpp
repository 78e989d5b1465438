#include "transfer_registry.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace blob_sync {

namespace {

template <typename Records>
auto findRecord(Records& records, const std::string& id) {
    return std::find_if(records.begin(), records.end(),
                        [&id](const TransferRecord& r) { return r.id == id; });
}

} // namespace

TransferRegistry::TransferRegistry(std::shared_ptr<TransferStore> store,
                                   std::shared_ptr<TransferNotifier> notifier,
                                   std::shared_ptr<Dispatcher> dispatcher,
                                   bool verbose)
    : mStore(std::move(store))
    , mNotifier(std::move(notifier))
    , mDispatcher(std::move(dispatcher))
    , mVerbose(verbose)
{
    if (!mStore) {
        throw std::invalid_argument("TransferRegistry requires a store");
    }
}

// ---------------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------------

void TransferRegistry::add(TransferRecord record) {
    if (record.id.empty()) {
        throw std::invalid_argument("Transfer record has no id");
    }
    commit([this, &record](Records& records, std::vector<Notification>&) {
        if (findRecord(records, record.id) != records.end()) {
            throw std::invalid_argument("Duplicate transfer id: " + record.id);
        }
        if (mVerbose) {
            std::cerr << "[TransferRegistry] Added " << toString(record.kind)
                      << " " << record.id << "\n";
        }
        records.push_back(record);
        return true;
    });
}

bool TransferRegistry::remove(const std::string& id) {
    return commit([this, &id](Records& records, std::vector<Notification>& notifications) {
        auto it = findRecord(records, id);
        if (it == records.end()) {
            return false;
        }
        if (!it->isTerminal()) {
            applyRequest(*it, TransferState::Cancelled, notifications);
        }
        records.erase(it);
        if (mVerbose) {
            std::cerr << "[TransferRegistry] Removed " << id << "\n";
        }
        return true;
    });
}

void TransferRegistry::removeAll() {
    commit([this](Records& records, std::vector<Notification>& notifications) {
        for (auto& record : records) {
            if (!record.isTerminal()) {
                applyRequest(record, TransferState::Cancelled, notifications);
            }
        }
        if (mVerbose) {
            std::cerr << "[TransferRegistry] Removed all " << records.size()
                      << " transfers\n";
        }
        records.clear();
        return true;
    });
}

// ---------------------------------------------------------------------------
// Lifecycle requests
// ---------------------------------------------------------------------------

bool TransferRegistry::cancel(const std::string& id) {
    return requestOne(id, TransferState::Cancelled, false);
}

bool TransferRegistry::pause(const std::string& id) {
    return requestOne(id, TransferState::Paused, false);
}

bool TransferRegistry::resume(const std::string& id) {
    return requestOne(id, TransferState::InProgress, true);
}

bool TransferRegistry::requestOne(const std::string& id, TransferState target, bool onlyPaused) {
    return commit([&](Records& records, std::vector<Notification>& notifications) {
        auto it = findRecord(records, id);
        if (it == records.end()) {
            return false;
        }
        if (onlyPaused && it->state != TransferState::Paused) {
            return false;
        }
        return applyRequest(*it, target, notifications);
    });
}

void TransferRegistry::cancelAll() {
    requestAll(TransferState::Cancelled, false);
}

void TransferRegistry::pauseAll() {
    requestAll(TransferState::Paused, false);
}

void TransferRegistry::resumeAll() {
    requestAll(TransferState::InProgress, true);
}

void TransferRegistry::requestAll(TransferState target, bool onlyPaused) {
    commit([&](Records& records, std::vector<Notification>& notifications) {
        int changed = 0;
        for (auto& record : records) {
            if (onlyPaused && record.state != TransferState::Paused) {
                continue;
            }
            if (applyRequest(record, target, notifications)) {
                ++changed;
            }
        }
        if (mVerbose) {
            std::cerr << "[TransferRegistry] Moved " << changed << " transfers to "
                      << toString(target) << "\n";
        }
        return changed > 0;
    });
}

bool TransferRegistry::applyRequest(TransferRecord& record,
                                    TransferState target,
                                    std::vector<Notification>& notifications) const {
    if (!record.transitionTo(target)) {
        if (mVerbose) {
            std::cerr << "[TransferRegistry] Ignoring " << toString(record.state)
                      << " -> " << toString(target) << " for " << record.id << "\n";
        }
        return false;
    }
    TransferRecord snapshot = record;
    notifications.push_back([snapshot](TransferNotifier& n) {
        n.onUpdate(snapshot, snapshot.state);
    });
    return true;
}

// ---------------------------------------------------------------------------
// Worker reports
// ---------------------------------------------------------------------------

bool TransferRegistry::updateState(const std::string& id,
                                   TransferState state,
                                   const std::optional<TransferProgress>& progress) {
    return commit([&](Records& records, std::vector<Notification>& notifications) {
        return applyUpdate(records, id, state, progress, notifications);
    });
}

bool TransferRegistry::reportProgress(const std::string& id, const TransferProgress& progress) {
    return commit([&](Records& records, std::vector<Notification>& notifications) {
        return applyUpdate(records, id, std::nullopt, progress, notifications);
    });
}

bool TransferRegistry::applyUpdate(Records& records,
                                   const std::string& id,
                                   std::optional<TransferState> state,
                                   const std::optional<TransferProgress>& progress,
                                   std::vector<Notification>& notifications) const {
    auto it = findRecord(records, id);
    if (it == records.end()) {
        return false;
    }

    const TransferState target = state.value_or(it->state);
    const bool sameState = (it->state == target);
    if ((sameState && it->isTerminal()) || (!sameState && !canTransition(it->state, target))) {
        std::cerr << "[TransferRegistry] Rejected transition "
                  << toString(it->state) << " -> " << toString(target)
                  << " for " << id << "\n";
        return false;
    }

    it->state = target;
    if (progress) {
        it->progress = progress;
    }
    TransferRecord snapshot = *it;
    notifications.push_back([snapshot, progress](TransferNotifier& n) {
        n.onUpdate(snapshot, snapshot.state, progress);
    });
    return true;
}

bool TransferRegistry::reportFailure(const std::string& id, const std::string& error) {
    return commit([&](Records& records, std::vector<Notification>& notifications) {
        auto it = findRecord(records, id);
        if (it == records.end() || !it->transitionTo(TransferState::Failed)) {
            return false;
        }
        std::cerr << "[TransferRegistry] Transfer " << id << " failed: " << error << "\n";
        TransferRecord snapshot = *it;
        notifications.push_back([snapshot, error](TransferNotifier& n) {
            n.onFailure(snapshot, error);
        });
        return true;
    });
}

bool TransferRegistry::reportCompletion(const std::string& id) {
    return commit([&](Records& records, std::vector<Notification>& notifications) {
        auto it = findRecord(records, id);
        if (it == records.end() || !it->transitionTo(TransferState::Completed)) {
            return false;
        }
        if (it->progress && it->progress->totalBytes) {
            it->progress->bytesTransferred = *it->progress->totalBytes;
        }
        if (mVerbose) {
            std::cerr << "[TransferRegistry] Transfer " << id << " completed\n";
        }
        TransferRecord snapshot = *it;
        notifications.push_back([snapshot](TransferNotifier& n) {
            n.onCompletion(snapshot);
        });
        return true;
    });
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::size_t TransferRegistry::count() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mRecords.size();
}

TransferRecord TransferRegistry::at(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mRecords.at(index);
}

std::vector<TransferRecord> TransferRegistry::transfers() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mRecords;
}

std::optional<TransferRecord> TransferRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = findRecord(mRecords, id);
    if (it == mRecords.end()) return std::nullopt;
    return *it;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

void TransferRegistry::loadContext() {
    std::lock_guard<std::mutex> storeLock(mStoreMutex);
    auto loaded = mStore->load();

    // Guard against duplicate ids in hand-edited state files.
    std::vector<TransferRecord> unique;
    unique.reserve(loaded.size());
    for (auto& record : loaded) {
        auto dup = std::find_if(unique.begin(), unique.end(),
                                [&record](const TransferRecord& r) { return r.id == record.id; });
        if (dup != unique.end()) {
            std::cerr << "[TransferRegistry] Dropping duplicate record " << record.id << "\n";
            continue;
        }
        unique.push_back(std::move(record));
    }

    std::lock_guard<std::mutex> lock(mMutex);
    mRecords = std::move(unique);
    if (mVerbose) {
        std::cerr << "[TransferRegistry] Loaded " << mRecords.size() << " transfers\n";
    }
}

void TransferRegistry::saveContext() {
    std::lock_guard<std::mutex> storeLock(mStoreMutex);
    Records snapshot;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        snapshot = mRecords;
    }
    try {
        mStore->save(snapshot);
    } catch (const std::exception& e) {
        std::cerr << "[TransferRegistry] Failed to persist transfers: " << e.what() << "\n";
        throw;
    }
}

bool TransferRegistry::commit(const Mutation& mutate) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> storeLock(mStoreMutex);
        Records draft;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            draft = mRecords;
        }

        if (!mutate(draft, notifications)) {
            return false;
        }

        try {
            mStore->save(draft);
        } catch (const std::exception& e) {
            std::cerr << "[TransferRegistry] Failed to persist transfers; "
                      << "change discarded: " << e.what() << "\n";
            throw;
        }

        std::lock_guard<std::mutex> lock(mMutex);
        mRecords = std::move(draft);
    }
    notify(std::move(notifications));
    return true;
}

// ---------------------------------------------------------------------------
// Restoration
// ---------------------------------------------------------------------------

std::optional<TransferRegistry::RestoredTransfer>
TransferRegistry::restoreRecord(const TransferRecord& record) const {
    if (record.isTerminal() || !mNotifier) {
        return std::nullopt;
    }

    auto client = mNotifier->clientFor(record.restorationId);
    if (!client) {
        std::cerr << "[TransferRegistry] No client for restoration id '"
                  << record.restorationId << "'; cannot restore " << record.id << "\n";
        return std::nullopt;
    }

    RestoredTransfer restored;
    restored.record  = record;
    restored.client  = std::move(client);
    restored.options = mNotifier->optionsFor(record.restorationId).value_or(TransferOptions());
    return restored;
}

std::optional<TransferRegistry::RestoredTransfer>
TransferRegistry::restore(const std::string& id) const {
    auto record = get(id);
    if (!record) return std::nullopt;
    return restoreRecord(*record);
}

std::vector<TransferRegistry::RestoredTransfer> TransferRegistry::restorable() const {
    std::vector<RestoredTransfer> out;
    for (const auto& record : transfers()) {
        if (auto restored = restoreRecord(record)) {
            out.push_back(std::move(*restored));
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Notification
// ---------------------------------------------------------------------------

void TransferRegistry::notify(std::vector<Notification> notifications) {
    if (!mNotifier) return;

    for (auto& notification : notifications) {
        auto notifier = mNotifier;
        auto fn = [notifier, notification = std::move(notification)]() {
            notification(*notifier);
        };
        if (mDispatcher) {
            mDispatcher->post(std::move(fn));
        } else {
            fn();
        }
    }
}

} // namespace blob_sync
