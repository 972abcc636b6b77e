#pragma once

/**
 * CloudTransfer.hpp
 *
 * Boundary to the remote object store. The transfer core only moves
 * files through this interface; providers implement the wire protocol.
 */

#include "../Cancellation.hpp"
#include "../resources/TransferManager.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace interlink::core::storage {

/**
 * Progress callback; fraction is 0.0 - 1.0 and never decreases
 */
using ProgressCallback = std::function<void(double fraction)>;

/**
 * Remote file descriptor
 */
struct CloudFile {
    std::string id;
    std::string name;
    std::string folderId;
    int64_t size{0};
};

struct UploadParams {
    std::string localPath;
    std::string folderId;
    std::string name;                                   // Remote name (defaults to the file name)
    resources::TransferHandle* handle{nullptr};         // Thread grant, may be null
    ProgressCallback progress;
};

struct DownloadParams {
    std::string fileId;
    std::string localPath;
    resources::TransferHandle* handle{nullptr};
    ProgressCallback progress;
};

/**
 * CloudTransfer - storage provider interface
 *
 * All calls block and report failure by throwing TransferError.
 * A call interrupted through its token throws OperationCancelledError,
 * or DeadlineExceededError if the token's deadline passed.
 */
class CloudTransfer {
public:
    virtual ~CloudTransfer() = default;

    virtual CloudFile upload(const CancellationToken& token, const UploadParams& params) = 0;

    virtual void download(const CancellationToken& token, const DownloadParams& params) = 0;

    /**
     * Look up a remote file
     * @throws TransferError if it does not exist
     */
    virtual CloudFile getFileInfo(const CancellationToken& token, const std::string& fileId) = 0;

    /**
     * Attach tags to a remote file (existing tags are kept)
     */
    virtual void addFileTags(const CancellationToken& token, const std::string& fileId,
                             const std::vector<std::string>& tags) = 0;

    /**
     * Resolve and cache credentials ahead of the first transfer
     */
    virtual void warmCredentials(const CancellationToken& token) = 0;

    /**
     * @return Identity the provider is authenticated as (empty if unknown)
     */
    virtual std::string accountEmail() const = 0;
};

} // namespace interlink::core::storage
