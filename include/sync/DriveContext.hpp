#pragma once

#include "config/Config.hpp"
#include "db/MetadataStore.hpp"
#include "sync/PlaceholderHost.hpp"
#include "sync/UploadLedger.hpp"
#include "transfer/Backend.hpp"
#include "types/Drive.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace stratus::sync {

// Everything a task operation needs to act on one drive. Immutable once the mount is up, apart from
// the internally synchronised upload ledger.
struct DriveContext {
    types::DriveId drive_id;
    std::filesystem::path sync_root;
    transfer::BackendPtr backend;
    db::MetadataStorePtr store;
    PlaceholderHostPtr host;
    config::TransferConfig transfer;
    std::optional<std::vector<uint8_t>> encryption_key;
    std::filesystem::path staging_dir;
    std::shared_ptr<UploadLedger> uploaded = std::make_shared<UploadLedger>();
};

using DriveContextPtr = std::shared_ptr<DriveContext>;

}
