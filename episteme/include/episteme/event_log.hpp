#pragma once
// Event log: one append-only JSONL stream per record category
//
//   <dir>/<run_id>.evidence.jsonl
//   <dir>/<run_id>.refusals.jsonl
//   <dir>/<run_id>.decisions.jsonl
//   <dir>/<run_id>.diagnostics.jsonl
//
// Design (same contract as a write-ahead log):
// - Append-only: records are never rewritten or removed
// - File locking: exclusive flock for the duration of a batch append
// - Sequence numbers: per stream, monotonic, resumed from existing files
// - One run per run id: EventLog refuses a run id whose streams hold records
// - Whole-batch validation: a batch with one bad record writes nothing
// - No wall-clock fields: identical runs produce identical bytes
//
// Readers treat a missing stream or records without a kind/schema tag as
// degraded but readable. Only unparsable lines are skipped.

#include "errors.hpp"
#include "evidence.hpp"
#include "log.hpp"
#include "types.hpp"
#include "version.hpp"
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace episteme {

enum class Stream : uint8_t {
    Evidence = 0,
    Refusals = 1,
    Decisions = 2,
    Diagnostics = 3,
};

constexpr size_t STREAM_COUNT = 4;

inline const char* stream_name(Stream s) {
    switch (s) {
        case Stream::Evidence:    return "evidence";
        case Stream::Refusals:    return "refusals";
        case Stream::Decisions:   return "decisions";
        case Stream::Diagnostics: return "diagnostics";
    }
    return "unknown";
}

inline const std::array<Stream, STREAM_COUNT>& all_streams() {
    static const std::array<Stream, STREAM_COUNT> streams = {
        Stream::Evidence, Stream::Refusals, Stream::Decisions, Stream::Diagnostics};
    return streams;
}

inline std::string stream_path(const std::string& dir, const std::string& run_id, Stream s) {
    return (std::filesystem::path(dir) / (run_id + "." + stream_name(s) + ".jsonl")).string();
}

// RAII exclusive lock for the duration of one append
class ScopedFileLock {
public:
    explicit ScopedFileLock(int fd) : fd_(fd) {
        if (fd_ >= 0) {
            flock(fd_, LOCK_EX);
        }
    }

    ~ScopedFileLock() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
        }
    }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

private:
    int fd_;
};

// A single append-only JSONL file
class EventStream {
public:
    EventStream() = default;
    ~EventStream() { close(); }

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    bool open(const std::string& path) {
        close();
        path_ = path;
        fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd_ < 0) return false;
        next_seq_ = scan_for_sequence(path);
        return true;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }
    uint64_t last_sequence() const { return next_seq_; }

    // Append records as one locked write. Each record gets the next "seq".
    // Returns the last sequence number written, or 0 on failure.
    uint64_t append(const std::vector<json>& records) {
        if (fd_ < 0) return 0;
        if (records.empty()) return next_seq_;

        uint64_t seq = next_seq_;
        std::string buffer;
        for (const auto& r : records) {
            json line = r;
            line["seq"] = ++seq;
            buffer += line.dump();
            buffer += '\n';
        }

        {
            ScopedFileLock lock(fd_);
            const char* p = buffer.data();
            size_t left = buffer.size();
            while (left > 0) {
                ssize_t n = ::write(fd_, p, left);
                if (n <= 0) return 0;
                p += n;
                left -= static_cast<size_t>(n);
            }
            fsync(fd_);
        }

        next_seq_ = seq;
        return seq;
    }

private:
    // Resume numbering after the highest seq already in the file
    static uint64_t scan_for_sequence(const std::string& path) {
        std::ifstream in(path);
        uint64_t max_seq = 0;
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            auto j = json::parse(line, nullptr, false);
            if (j.is_discarded() || !j.is_object()) continue;
            if (j.contains("seq") && j["seq"].is_number_unsigned()) {
                max_seq = std::max(max_seq, j["seq"].get<uint64_t>());
            }
        }
        return max_seq;
    }

    std::string path_;
    int fd_ = -1;
    uint64_t next_seq_ = 0;
};

class EventLog {
public:
    EventLog(std::string dir, std::string run_id)
        : dir_(std::move(dir)), run_id_(std::move(run_id)) {}

    // Creates the directory and opens all streams. Throws on failure:
    // a run without a durable record must not start, and a run id that
    // already has records belongs to another run.
    void open() {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            throw Error("cannot create log directory " + dir_ + ": " + ec.message());
        }
        for (Stream s : all_streams()) {
            auto path = stream_path(dir_, run_id_, s);
            auto size = std::filesystem::file_size(path, ec);
            if (!ec && size > 0) {
                throw Error("run id '" + run_id_ + "' already has records in " + path +
                            "; choose another run id or log directory");
            }
        }
        for (Stream s : all_streams()) {
            auto path = stream_path(dir_, run_id_, s);
            if (!streams_[index(s)].open(path)) {
                throw Error("cannot open event stream " + path);
            }
        }
        log_debug("log", "opened streams in %s (run %s)", dir_.c_str(), run_id_.c_str());
    }

    const std::string& dir() const { return dir_; }
    const std::string& run_id() const { return run_id_; }
    std::string path(Stream s) const { return stream_path(dir_, run_id_, s); }

    // Validates every event before writing any of them
    void append_evidence(const std::vector<EvidenceEvent>& events) {
        for (const auto& e : events) validate_temporal_provenance(e);
        std::vector<json> records;
        records.reserve(events.size());
        for (const auto& e : events) records.push_back(e.to_json());
        write(Stream::Evidence, records);
    }

    void append_refusal(const RefusalEvent& e) { write(Stream::Refusals, {e.to_json()}); }
    void append_decision(const DecisionEvent& e) { write(Stream::Decisions, {e.to_json()}); }

    void append_diagnostics(const std::vector<DiagnosticEvent>& events) {
        std::vector<json> records;
        records.reserve(events.size());
        for (const auto& e : events) records.push_back(e.to_json());
        write(Stream::Diagnostics, records);
    }

    uint64_t count(Stream s) const { return streams_[index(s)].last_sequence(); }

private:
    static size_t index(Stream s) { return static_cast<size_t>(s); }

    void write(Stream s, const std::vector<json>& records) {
        if (records.empty()) return;
        auto& stream = streams_[index(s)];
        if (!stream.is_open()) {
            throw Error(std::string("event stream not open: ") + stream_name(s));
        }
        if (stream.append(records) == 0) {
            throw Error("append failed on " + stream.path());
        }
    }

    std::string dir_;
    std::string run_id_;
    std::array<EventStream, STREAM_COUNT> streams_;
};

// Read side: tolerant of missing streams and pre-schema records
struct StreamReadResult {
    Stream stream = Stream::Evidence;
    bool present = false;
    bool degraded = false;
    size_t legacy_records = 0;      // No kind/schema_version tag
    size_t malformed_lines = 0;     // Not JSON objects; skipped
    size_t unsupported_schema = 0;  // Newer than this build; skipped
    std::vector<json> records;

    json summary() const {
        return {
            {"stream", stream_name(stream)},
            {"present", present},
            {"degraded", degraded},
            {"records", records.size()},
            {"legacy_records", legacy_records},
            {"malformed_lines", malformed_lines},
            {"unsupported_schema", unsupported_schema},
        };
    }
};

inline StreamReadResult read_stream(const std::string& path, Stream s) {
    StreamReadResult result;
    result.stream = s;

    std::ifstream in(path);
    if (!in) {
        result.degraded = true;
        return result;
    }
    result.present = true;

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            ++result.malformed_lines;
            result.degraded = true;
            continue;
        }
        if (!j.contains("kind") || !j.contains("schema_version")) {
            ++result.legacy_records;
            result.degraded = true;
            result.records.push_back(std::move(j));
            continue;
        }
        int schema = j["schema_version"].is_number_integer() ? j["schema_version"].get<int>() : -1;
        if (!version::schema_readable(schema)) {
            ++result.unsupported_schema;
            result.degraded = true;
            continue;
        }
        result.records.push_back(std::move(j));
    }
    return result;
}

inline std::array<StreamReadResult, STREAM_COUNT> read_run(const std::string& dir,
                                                           const std::string& run_id) {
    std::array<StreamReadResult, STREAM_COUNT> out;
    for (Stream s : all_streams()) {
        out[static_cast<size_t>(s)] = read_stream(stream_path(dir, run_id, s), s);
    }
    return out;
}

} // namespace episteme
