#pragma once

#include "object_record.h"
#include <string>
#include <vector>
#include <cstdint>

// One row of the grouped display: either a virtual folder or a file
struct FolderEntry {
    std::string name;           // folder name or file name relative to the current folder
    bool is_folder = false;
    size_t file_count = 0;      // folders only
    int64_t total_size = 0;     // folders: sum of contained files; files: object size
    const ObjectRecord* record = nullptr;  // files only, points into the grouped input
};

// Group records by the first path segment below current_folder
// (empty = bucket root). Records outside current_folder are skipped.
// Folders come first, then files, each sorted lexicographically by name.
// Presentation only: the returned entries borrow from records.
std::vector<FolderEntry> groupIntoFolders(const ObjectRecords& records,
                                          const std::string& current_folder = "");

// Parent of a folder path ("a/b" -> "a", "a" -> "")
std::string parentFolder(const std::string& folder);

// Human readable byte count ("512 B", "1.5 KB", ...)
std::string formatSize(int64_t size);
