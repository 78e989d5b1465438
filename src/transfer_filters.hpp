#pragma once

#include "transfer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace blob_sync {

// Pure queries over an ordered set of transfers. Every function preserves
// the input order.

/// Uploads whose source is the local file @p localPath.
std::vector<TransferRecord> uploadsFrom(const std::vector<TransferRecord>& transfers,
                                        const std::string& localPath);

/// Downloads whose source is blob @p name in @p container.
std::vector<TransferRecord> downloadsFrom(const std::vector<TransferRecord>& transfers,
                                          const std::string& container,
                                          const std::string& name);

/// Downloads whose destination is the local file @p localPath.
std::vector<TransferRecord> downloadsTo(const std::vector<TransferRecord>& transfers,
                                        const std::string& localPath);

/// Uploads whose destination is blob @p name in @p container.
std::vector<TransferRecord> uploadsTo(const std::vector<TransferRecord>& transfers,
                                      const std::string& container,
                                      const std::string& name);

std::vector<TransferRecord> ofKind(const std::vector<TransferRecord>& transfers,
                                   TransferKind kind);

std::vector<TransferRecord> inState(const std::vector<TransferRecord>& transfers,
                                    TransferState state);

std::optional<TransferRecord> findById(const std::vector<TransferRecord>& transfers,
                                       const std::string& id);

} // namespace blob_sync
