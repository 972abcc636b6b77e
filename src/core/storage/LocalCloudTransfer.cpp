/**
 * LocalCloudTransfer.cpp
 */

#include "LocalCloudTransfer.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

namespace interlink::core::storage {

namespace fs = std::filesystem;
using json = nlohmann::json;

LocalCloudTransfer::LocalCloudTransfer(fs::path root, std::string accountEmail)
    : m_root(std::move(root)), m_accountEmail(std::move(accountEmail)) {
}

CloudFile LocalCloudTransfer::upload(const CancellationToken& token, const UploadParams& params) {
    token.throwIfCancelled();

    fs::path source(params.localPath);
    if (!fs::is_regular_file(source)) {
        throw TransferError("source is not a file: " + params.localPath);
    }

    std::string name = params.name.empty() ? source.filename().string() : params.name;
    std::string fileId = params.folderId.empty() ? name : params.folderId + "/" + name;
    fs::path target = objectPath(fileId);

    Logger::instance().debug("Uploading {} -> {}", params.localPath, fileId);
    copyFile(token, source, target, chunkSizeFor(params.handle), params.progress);

    CloudFile file;
    file.id = fileId;
    file.name = name;
    file.folderId = params.folderId;
    file.size = static_cast<int64_t>(fs::file_size(target));
    return file;
}

void LocalCloudTransfer::download(const CancellationToken& token, const DownloadParams& params) {
    token.throwIfCancelled();

    fs::path object = objectPath(params.fileId);
    if (!fs::is_regular_file(object)) {
        throw TransferError("object not found: " + params.fileId);
    }

    Logger::instance().debug("Downloading {} -> {}", params.fileId, params.localPath);
    copyFile(token, object, fs::path(params.localPath), chunkSizeFor(params.handle), params.progress);
}

CloudFile LocalCloudTransfer::getFileInfo(const CancellationToken& token, const std::string& fileId) {
    token.throwIfCancelled();

    fs::path object = objectPath(fileId);
    if (!fs::is_regular_file(object)) {
        throw TransferError("object not found: " + fileId);
    }

    CloudFile file;
    file.id = fileId;
    file.name = object.filename().string();
    auto slash = fileId.rfind('/');
    file.folderId = slash == std::string::npos ? "" : fileId.substr(0, slash);
    file.size = static_cast<int64_t>(fs::file_size(object));
    return file;
}

void LocalCloudTransfer::addFileTags(const CancellationToken& token, const std::string& fileId,
                                     const std::vector<std::string>& tags) {
    token.throwIfCancelled();

    fs::path object = objectPath(fileId);
    if (!fs::is_regular_file(object)) {
        throw TransferError("object not found: " + fileId);
    }

    std::lock_guard<std::mutex> lock(m_tagsMutex);
    auto merged = getFileTags(fileId);
    for (const auto& tag : tags) {
        if (std::find(merged.begin(), merged.end(), tag) == merged.end()) {
            merged.push_back(tag);
        }
    }

    std::ofstream file(tagsPath(object));
    if (!file.is_open()) {
        throw TransferError("cannot write tags for " + fileId);
    }
    file << json(merged).dump(2);
}

std::vector<std::string> LocalCloudTransfer::getFileTags(const std::string& fileId) const {
    fs::path path = tagsPath(objectPath(fileId));
    if (!fs::exists(path)) {
        return {};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return {};
    }

    try {
        return json::parse(file).get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        Logger::instance().warn("Ignoring unreadable tag file {}: {}", path.string(), e.what());
        return {};
    }
}

void LocalCloudTransfer::warmCredentials(const CancellationToken& token) {
    token.throwIfCancelled();
    fs::create_directories(m_root);
    m_warm = true;
    Logger::instance().debug("Local store ready at {}", m_root.string());
}

fs::path LocalCloudTransfer::objectPath(const std::string& fileId) const {
    fs::path relative = fs::path(fileId).lexically_normal();
    if (fileId.empty() || relative.is_absolute() || relative.empty() ||
        *relative.begin() == "..") {
        throw TransferError("invalid object id: " + fileId);
    }
    return m_root / relative;
}

fs::path LocalCloudTransfer::tagsPath(const fs::path& object) {
    fs::path path = object;
    path += ".tags.json";
    return path;
}

size_t LocalCloudTransfer::chunkSizeFor(const resources::TransferHandle* handle) {
    size_t threads = handle ? static_cast<size_t>(std::max(handle->threads(), 1)) : 1;
    return std::min(BaseChunkSize * threads, MaxChunkSize);
}

void LocalCloudTransfer::copyFile(const CancellationToken& token,
                                  const fs::path& from,
                                  const fs::path& to,
                                  size_t chunkSize,
                                  const ProgressCallback& progress) {
    std::ifstream in(from, std::ios::binary);
    if (!in.is_open()) {
        throw TransferError("cannot open " + from.string());
    }

    const uint64_t total = fs::file_size(from);

    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path());
    }
    fs::path part = to;
    part += ".part";

    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw TransferError("cannot write " + to.string());
    }

    try {
        std::vector<char> buffer(chunkSize);
        uint64_t copied = 0;

        while (copied < total) {
            token.throwIfCancelled();

            auto wanted = static_cast<std::streamsize>(std::min<uint64_t>(chunkSize, total - copied));
            in.read(buffer.data(), wanted);
            auto got = in.gcount();
            if (got <= 0) {
                throw TransferError("short read from " + from.string());
            }

            out.write(buffer.data(), got);
            if (!out) {
                throw TransferError("write failed: " + to.string());
            }

            copied += static_cast<uint64_t>(got);
            if (progress) {
                progress(static_cast<double>(copied) / static_cast<double>(total));
            }
        }

        if (total == 0 && progress) {
            progress(1.0);
        }

        out.close();
        if (!out) {
            throw TransferError("write failed: " + to.string());
        }
        fs::rename(part, to);
    } catch (...) {
        out.close();
        std::error_code ec;
        fs::remove(part, ec);
        throw;
    }
}

} // namespace interlink::core::storage
