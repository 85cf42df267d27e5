#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace logfanout {

// ============================================================================
// Basic Enums
// ============================================================================

using Timestamp = std::chrono::system_clock::time_point;

enum class Direction {
    FORWARD,
    BACKWARD
};

// ============================================================================
// Log & Sample Payloads
// ============================================================================

struct LogEntry {
    Timestamp timestamp;
    std::string line;
};

struct LogStream {
    std::string labels;         // Label set in selector form, e.g. {app="api"}
    uint64_t hash = 0;
    std::vector<LogEntry> entries;
};

struct Sample {
    Timestamp timestamp;
    double value = 0.0;
    uint64_t hash = 0;
};

struct SampleSeries {
    std::string labels;
    uint64_t stream_hash = 0;
    std::vector<Sample> samples;
};

struct SeriesIdentifier {
    std::vector<std::pair<std::string, std::string>> labels;

    bool operator==(const SeriesIdentifier&) const = default;
};

// ============================================================================
// Replica RPC Requests
// ============================================================================

struct QueryRequest {
    std::string selector;
    uint32_t limit = 0;
    Timestamp start;
    Timestamp end;
    Direction direction = Direction::FORWARD;
    std::vector<std::string> shards;
};

struct SampleQueryRequest {
    std::string selector;
    Timestamp start;
    Timestamp end;
    std::vector<std::string> shards;
};

struct LabelRequest {
    std::string name;
    bool values = false;        // false: list label names, true: values of `name`
    Timestamp start;
    Timestamp end;
    std::string query;
};

struct TailRequest {
    std::string query;
    uint32_t delay_for_seconds = 0;
    uint32_t limit = 0;
    Timestamp start;
};

struct SeriesRequest {
    Timestamp start;
    Timestamp end;
    std::vector<std::string> groups;
    std::vector<std::string> shards;
};

struct ChunkIdsRequest {
    std::string matchers;
    Timestamp start;
    Timestamp end;
};

struct IndexStatsRequest {
    Timestamp from;
    Timestamp through;
    std::string matchers;
};

struct VolumeRequest {
    Timestamp from;
    Timestamp through;
    std::string matchers;
    int32_t limit = 0;
    std::vector<std::string> target_labels;
    std::string aggregate_by;
};

struct DetectedLabelsRequest {
    Timestamp start;
    Timestamp end;
    std::string query;
};

// ============================================================================
// Replica RPC Responses
// ============================================================================

struct QueryResponse {
    std::vector<LogStream> streams;
};

struct SampleQueryResponse {
    std::vector<SampleSeries> series;
};

struct TailResponse {
    LogStream stream;
};

struct LabelResponse {
    std::vector<std::string> values;
};

struct SeriesResponse {
    std::vector<SeriesIdentifier> series;
};

struct ChunkIdsResponse {
    std::vector<std::string> chunk_ids;
};

struct IndexStats {
    uint64_t streams = 0;
    uint64_t chunks = 0;
    uint64_t bytes = 0;
    uint64_t entries = 0;

    bool operator==(const IndexStats&) const = default;
};

struct Volume {
    std::string name;
    uint64_t volume = 0;

    bool operator==(const Volume&) const = default;
};

struct VolumeResponse {
    std::vector<Volume> volumes;
    int32_t limit = 0;
};

struct LabelToValuesResponse {
    std::map<std::string, std::vector<std::string>> labels;
};

} // namespace logfanout
