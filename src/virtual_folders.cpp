#include "virtual_folders.h"
#include <algorithm>
#include <map>
#include <cstdio>

std::vector<FolderEntry> groupIntoFolders(const ObjectRecords& records, const std::string& current_folder) {
    std::string folderPrefix = current_folder;
    while (!folderPrefix.empty() && folderPrefix.back() == '/') {
        folderPrefix.pop_back();
    }
    if (!folderPrefix.empty()) {
        folderPrefix += '/';
    }

    std::map<std::string, FolderEntry> folders;  // sorted by name
    std::vector<FolderEntry> files;

    for (const auto& record : records) {
        if (record.key.compare(0, folderPrefix.size(), folderPrefix) != 0) continue;
        std::string relative = record.key.substr(folderPrefix.size());
        if (relative.empty()) continue;  // the folder marker itself

        size_t slash = relative.find('/');
        if (slash != std::string::npos) {
            std::string name = relative.substr(0, slash);
            auto& folder = folders[name];
            folder.name = name;
            folder.is_folder = true;
            // "name/" is the folder's own marker object, not a file in it
            if (slash + 1 < relative.size()) {
                folder.file_count += 1;
                folder.total_size += record.size;
            }
        } else {
            FolderEntry file;
            file.name = relative;
            file.total_size = record.size;
            file.record = &record;
            files.push_back(std::move(file));
        }
    }

    std::stable_sort(files.begin(), files.end(),
        [](const FolderEntry& a, const FolderEntry& b) { return a.name < b.name; });

    std::vector<FolderEntry> entries;
    entries.reserve(folders.size() + files.size());
    for (auto& [name, folder] : folders) {
        entries.push_back(std::move(folder));
    }
    for (auto& file : files) {
        entries.push_back(std::move(file));
    }
    return entries;
}

std::string parentFolder(const std::string& folder) {
    std::string path = folder;
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    size_t lastSlash = path.rfind('/');
    return lastSlash == std::string::npos ? "" : path.substr(0, lastSlash);
}

std::string formatSize(int64_t size) {
    char buf[32];
    if (size < 1024) {
        snprintf(buf, sizeof(buf), "%lld B", static_cast<long long>(size));
    } else if (size < 1024LL * 1024) {
        snprintf(buf, sizeof(buf), "%.1f KB", size / 1024.0);
    } else if (size < 1024LL * 1024 * 1024) {
        snprintf(buf, sizeof(buf), "%.1f MB", size / (1024.0 * 1024.0));
    } else {
        snprintf(buf, sizeof(buf), "%.1f GB", size / (1024.0 * 1024.0 * 1024.0));
    }
    return buf;
}
