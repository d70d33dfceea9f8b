/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef MEMORYWALKER_H
#define MEMORYWALKER_H

#include "triage/framework/filesystem/TriFilesystemWalker.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include <map>
#include <set>
#include <string>
#include <vector>

/*
 * A filesystem held in memory with a single NTFS volume. Lookups ignore
 * case like the Windows filesystems the extractors are written for.
 */
class MemoryWalker : public TriFilesystemWalker
{
public:
    MemoryWalker() {
        addDirectory("/");
    }

    void addFile(const std::string &path, const std::vector<uint8_t> &data, int64_t mtime = 0) {
        addParents(path);
        Node node;
        node.entry = makeEntry(path, false, data.size(), mtime);
        node.data = data;
        m_nodes[key(path)] = node;
    }

    void addFile(const std::string &path, const std::string &data, int64_t mtime = 0) {
        addFile(path, std::vector<uint8_t>(data.begin(), data.end()), mtime);
    }

    void addDirectory(const std::string &path) {
        if (m_nodes.count(key(path)))
            return;
        if (path != "/")
            addParents(path);
        Node node;
        node.entry = makeEntry(path, true, 0, 0);
        m_nodes[key(path)] = node;
    }

    void addDeleted(const TriDeletedEntry &entry) {
        m_deleted.push_back(entry);
    }

    /* Listing this directory fails the way a corrupt index does. */
    void markDamaged(const std::string &path) {
        m_damaged.insert(key(path));
    }

    virtual std::vector<TriVolume> listVolumes() const {
        TriVolume volume;
        volume.index = 0;
        volume.offset = 0;
        volume.size = 64 * 1024 * 1024;
        volume.fsType = "ntfs";
        return std::vector<TriVolume>(1, volume);
    }

    virtual std::vector<TriDirEntry> listDirectory(unsigned int volume, const std::string &path) {
        std::vector<TriDirEntry> entries;
        if (volume != 0)
            return entries;
        std::string dir = key(path);
        if (m_damaged.count(dir)) {
            addWarning("MemoryWalker - damaged directory " + path);
            return entries;
        }
        for (std::map<std::string, Node>::const_iterator it = m_nodes.begin(); it != m_nodes.end(); ++it) {
            if (it->first != "/" && parentOf(it->first) == dir)
                entries.push_back(it->second.entry);
        }
        return entries;
    }

    virtual bool exists(unsigned int volume, const std::string &path) {
        return volume == 0 && m_nodes.count(key(path)) > 0;
    }

    virtual std::vector<uint8_t> readFile(unsigned int volume, const std::string &path) {
        std::map<std::string, Node>::const_iterator it = m_nodes.find(key(path));
        if (volume != 0 || it == m_nodes.end() || it->second.entry.isDirectory)
            throw TriFileNotFoundException("MemoryWalker - no such file: " + path);
        return it->second.data;
    }

    virtual std::vector<TriDeletedEntry> enumerateDeleted(unsigned int volume) {
        return volume == 0 ? m_deleted : std::vector<TriDeletedEntry>();
    }

    virtual std::vector<uint8_t> readRawSectors(uint64_t startSector, uint64_t count) {
        throw TriOutOfRangeException("MemoryWalker - no raw sectors");
    }

private:
    struct Node {
        TriDirEntry entry;
        std::vector<uint8_t> data;
    };

    static std::string normalize(const std::string &path) {
        std::string result = path;
        while (result.size() > 1 && result[result.size() - 1] == '/')
            result.erase(result.size() - 1);
        if (result.empty() || result[0] != '/')
            result = "/" + result;
        return result;
    }

    static std::string key(const std::string &path) {
        return TriUtilities::toLower(normalize(path));
    }

    static std::string parentOf(const std::string &path) {
        std::string::size_type slash = path.rfind('/');
        if (slash == 0 || slash == std::string::npos)
            return "/";
        return path.substr(0, slash);
    }

    static TriDirEntry makeEntry(const std::string &path, bool isDirectory, uint64_t size, int64_t mtime) {
        std::string full = normalize(path);
        TriDirEntry entry;
        entry.path = full;
        entry.name = full == "/" ? "" : full.substr(full.rfind('/') + 1);
        entry.isDirectory = isDirectory;
        entry.size = size;
        entry.mtime = mtime;
        entry.atime = mtime;
        entry.ctime = mtime;
        entry.crtime = mtime;
        return entry;
    }

    void addParents(const std::string &path) {
        std::string parent = parentOf(normalize(path));
        if (parent != "/")
            addDirectory(parent);
    }

    std::map<std::string, Node> m_nodes;
    std::vector<TriDeletedEntry> m_deleted;
    std::set<std::string> m_damaged;
};

#endif
