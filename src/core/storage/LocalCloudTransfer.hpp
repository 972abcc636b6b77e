#pragma once

/**
 * LocalCloudTransfer.hpp
 *
 * CloudTransfer backed by a local directory. Objects live at
 * <root>/<folderId>/<name> and are addressed as "<folderId>/<name>".
 */

#include "CloudTransfer.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>

namespace interlink::core::storage {

class LocalCloudTransfer : public CloudTransfer {
public:
    static constexpr size_t BaseChunkSize = 256 * 1024;
    static constexpr size_t MaxChunkSize = 8 * 1024 * 1024;

    /**
     * @param root Store directory (created on demand)
     * @param accountEmail Identity reported by accountEmail()
     */
    explicit LocalCloudTransfer(std::filesystem::path root, std::string accountEmail = "local");

    CloudFile upload(const CancellationToken& token, const UploadParams& params) override;
    void download(const CancellationToken& token, const DownloadParams& params) override;
    CloudFile getFileInfo(const CancellationToken& token, const std::string& fileId) override;
    void addFileTags(const CancellationToken& token, const std::string& fileId,
                     const std::vector<std::string>& tags) override;
    void warmCredentials(const CancellationToken& token) override;
    std::string accountEmail() const override { return m_accountEmail; }

    /**
     * Tags recorded for an object (empty if none)
     */
    std::vector<std::string> getFileTags(const std::string& fileId) const;

    const std::filesystem::path& root() const { return m_root; }

    bool credentialsWarm() const { return m_warm.load(); }

private:
    std::filesystem::path objectPath(const std::string& fileId) const;
    static std::filesystem::path tagsPath(const std::filesystem::path& object);
    static size_t chunkSizeFor(const resources::TransferHandle* handle);

    /**
     * Copy in chunks, reporting progress and honouring the token.
     * The destination is written to a ".part" file renamed on success.
     */
    static void copyFile(const CancellationToken& token,
                         const std::filesystem::path& from,
                         const std::filesystem::path& to,
                         size_t chunkSize,
                         const ProgressCallback& progress);

private:
    std::filesystem::path m_root;
    std::string m_accountEmail;
    std::atomic<bool> m_warm{false};
    mutable std::mutex m_tagsMutex;
};

} // namespace interlink::core::storage
