#include "transfer/BackendFactory.hpp"
#include "transfer/LocalBackend.hpp"
#include "transfer/S3Backend.hpp"

namespace stratus::transfer {

BackendPtr makeBackend(const types::DriveConfig& drive, const config::TransferConfig& cfg) {
    const auto& b = drive.backend;
    switch (b.type) {
        case types::BackendType::Local:
            return std::make_shared<LocalBackend>(b.root);
        case types::BackendType::S3:
            return std::make_shared<S3Backend>(util::S3Credentials{b.endpoint, b.region, b.access_key, b.secret_key},
                                               b.bucket, drive.remote_path, cfg.request_timeout);
    }
    throw std::invalid_argument("Unsupported backend type for drive " + drive.id);
}

}
