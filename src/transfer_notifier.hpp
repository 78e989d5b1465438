#pragma once

#include "http_types.hpp"
#include "transfer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace blob_sync {

/// Settings a transfer needs to resume after a restart.
struct TransferOptions {
    int           timeoutMs      = 5000;
    int           maxAttempts    = 6;
    std::uint64_t chunkSizeBytes = 4 * 1024 * 1024;
};

/// Receives transfer lifecycle notifications and supplies the live client
/// and options needed to resume a persisted transfer, which the store does
/// not keep.
class TransferNotifier {
public:
    virtual ~TransferNotifier() = default;

    /// State changed; @p progress is set when it is known.
    virtual void onUpdate(const TransferRecord& record,
                          TransferState state,
                          const std::optional<TransferProgress>& progress) = 0;

    /// State changed with no progress information.
    void onUpdate(const TransferRecord& record, TransferState state) {
        onUpdate(record, state, std::nullopt);
    }

    virtual void onFailure(const TransferRecord& record, const std::string& error) = 0;

    virtual void onCompletion(const TransferRecord& record) = 0;

    virtual std::shared_ptr<RequestExecutor> clientFor(const std::string& restorationId) = 0;

    virtual std::optional<TransferOptions> optionsFor(const std::string& restorationId) = 0;
};

} // namespace blob_sync
