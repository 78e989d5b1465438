#pragma once

#include "transfer.hpp"

#include <filesystem>
#include <vector>

namespace blob_sync {

/// Durable storage for the full set of transfer records.
class TransferStore {
public:
    virtual ~TransferStore() = default;

    /// @throws StoreError if the stored data cannot be read.
    virtual std::vector<TransferRecord> load() = 0;

    /// Replace the stored set with @p records.
    /// @throws StoreError on write failure.
    virtual void save(const std::vector<TransferRecord>& records) = 0;
};

/// Stores records as a JSON array in a single file. Saves go to a sibling
/// temp file that is then renamed over the target.
class JsonFileTransferStore : public TransferStore {
public:
    explicit JsonFileTransferStore(std::filesystem::path path, bool verbose = false);

    /// A missing file loads as an empty set. Entries that fail to decode
    /// are skipped and logged.
    std::vector<TransferRecord> load() override;

    void save(const std::vector<TransferRecord>& records) override;

    const std::filesystem::path& path() const { return mPath; }

private:
    std::filesystem::path mPath;
    bool                  mVerbose;
};

} // namespace blob_sync
