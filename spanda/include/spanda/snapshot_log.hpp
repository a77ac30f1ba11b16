#pragma once
// SnapshotLog: an append-only record of every tick
//
// One JSON object per line, flushed per record, so a crash loses at most
// the line being written. The core never touches this; consumers append
// whatever snapshots they receive.

#include "snapshot.hpp"
#include "log.hpp"
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace spanda {

class SnapshotLog {
public:
    SnapshotLog() = default;

    explicit SnapshotLog(const std::string& path) {
        open(path);
    }

    bool open(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        path_ = path;
        if (stream_.is_open()) stream_.close();
        stream_.clear();
        stream_.open(path, std::ios::app);
        if (!stream_) {
            log::warn("snapshot_log", "Cannot open %s", path.c_str());
            return false;
        }
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_.is_open()) stream_.close();
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_.is_open();
    }

    // Safe to call from the life loop and the input thread at once
    bool append(const Snapshot& snap) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_.is_open()) return false;

        stream_ << json(snap).dump() << '\n';
        stream_.flush();
        if (!stream_) {
            log::warn("snapshot_log", "Write failed on %s", path_.c_str());
            return false;
        }
        records_++;
        return true;
    }

    size_t records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    // Load every record from a JSONL file. Lines that are not JSON objects,
    // or whose fields have the wrong types, are skipped.
    static std::vector<Snapshot> read_all(const std::string& path) {
        std::vector<Snapshot> out;
        std::ifstream in(path);
        if (!in) return out;

        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line)) {
            line_no++;
            if (line.empty()) continue;
            json j = json::parse(line, nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                log::warn("snapshot_log", "%s:%zu: skipping malformed record",
                          path.c_str(), line_no);
                continue;
            }
            try {
                out.push_back(j.get<Snapshot>());
            } catch (const json::exception& e) {
                log::warn("snapshot_log", "%s:%zu: skipping bad record: %s",
                          path.c_str(), line_no, e.what());
            }
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::string path_;
    std::ofstream stream_;
    size_t records_ = 0;
};

} // namespace spanda
