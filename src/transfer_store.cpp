#include "transfer_store.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <system_error>

namespace blob_sync {

using json = nlohmann::json;
namespace fs = std::filesystem;

JsonFileTransferStore::JsonFileTransferStore(fs::path path, bool verbose)
    : mPath(std::move(path))
    , mVerbose(verbose) {}

std::vector<TransferRecord> JsonFileTransferStore::load() {
    std::vector<TransferRecord> records;

    std::error_code ec;
    if (!fs::exists(mPath, ec)) {
        if (mVerbose) {
            std::cerr << "[JsonTransferStore] No state file at " << mPath
                      << "; starting empty.\n";
        }
        return records;
    }

    std::ifstream in(mPath);
    if (!in) {
        throw StoreError("Cannot open transfer state file: " + mPath.string());
    }

    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        throw StoreError("Failed to parse transfer state file " + mPath.string() +
                         ": " + e.what());
    }
    if (!document.is_array()) {
        throw StoreError("Transfer state file is not a JSON array: " + mPath.string());
    }

    for (std::size_t i = 0; i < document.size(); ++i) {
        try {
            records.push_back(document[i].get<TransferRecord>());
        } catch (const std::exception& e) {
            std::cerr << "[JsonTransferStore] Skipping record " << i
                      << ": " << e.what() << "\n";
        }
    }

    if (mVerbose) {
        std::cerr << "[JsonTransferStore] Loaded " << records.size()
                  << " records from " << mPath << "\n";
    }
    return records;
}

void JsonFileTransferStore::save(const std::vector<TransferRecord>& records) {
    const json document = records;

    fs::path tmp = mPath;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw StoreError("Cannot write transfer state file: " + tmp.string());
        }
        out << document.dump(2) << "\n";
        out.flush();
        if (!out) {
            throw StoreError("Failed writing transfer state file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, mPath, ec);
    if (ec) {
        throw StoreError("Cannot replace transfer state file " + mPath.string() +
                         ": " + ec.message());
    }

    if (mVerbose) {
        std::cerr << "[JsonTransferStore] Saved " << records.size()
                  << " records to " << mPath << "\n";
    }
}

} // namespace blob_sync
