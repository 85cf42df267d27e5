#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>

namespace logfanout {

/**
 * @brief Per-call cancellation scope handed to every replica RPC
 *
 * Clients must abort promptly once stop is requested or the deadline passes.
 */
struct CallContext {
    std::stop_token stop;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    [[nodiscard]] bool cancelled() const { return stop.stop_requested(); }
    [[nodiscard]] bool expired() const {
        return deadline && std::chrono::steady_clock::now() >= *deadline;
    }
};

// Server-streaming handles. recv() yields std::nullopt once the stream ends.

class IQueryStream {
public:
    virtual ~IQueryStream() = default;
    [[nodiscard]] virtual Result<std::optional<QueryResponse>> recv() = 0;
    virtual void close_send() = 0;
};

class ISampleStream {
public:
    virtual ~ISampleStream() = default;
    [[nodiscard]] virtual Result<std::optional<SampleQueryResponse>> recv() = 0;
    virtual void close_send() = 0;
};

class ITailStream {
public:
    virtual ~ITailStream() = default;
    [[nodiscard]] virtual Result<std::optional<TailResponse>> recv() = 0;
    virtual void close_send() = 0;
};

/**
 * @brief Typed client for a single ingester
 *
 * Errors: UNAVAILABLE for transport failures, UNIMPLEMENTED when the peer
 * predates the RPC, CANCELLED / DEADLINE_EXCEEDED when the call context fires.
 */
class IReplicaClient {
public:
    virtual ~IReplicaClient() = default;

    [[nodiscard]] virtual Result<std::shared_ptr<IQueryStream>> query(
        const CallContext& ctx, const QueryRequest& req) = 0;

    [[nodiscard]] virtual Result<std::shared_ptr<ISampleStream>> query_sample(
        const CallContext& ctx, const SampleQueryRequest& req) = 0;

    [[nodiscard]] virtual Result<LabelResponse> label(
        const CallContext& ctx, const LabelRequest& req) = 0;

    [[nodiscard]] virtual Result<std::shared_ptr<ITailStream>> tail(
        const CallContext& ctx, const TailRequest& req) = 0;

    [[nodiscard]] virtual Result<SeriesResponse> series(
        const CallContext& ctx, const SeriesRequest& req) = 0;

    [[nodiscard]] virtual Result<uint32_t> tailers_count(const CallContext& ctx) = 0;

    [[nodiscard]] virtual Result<ChunkIdsResponse> get_chunk_ids(
        const CallContext& ctx, const ChunkIdsRequest& req) = 0;

    [[nodiscard]] virtual Result<IndexStats> get_stats(
        const CallContext& ctx, const IndexStatsRequest& req) = 0;

    [[nodiscard]] virtual Result<VolumeResponse> get_volume(
        const CallContext& ctx, const VolumeRequest& req) = 0;

    /// A null response is legal and means "nothing detected"
    [[nodiscard]] virtual Result<std::shared_ptr<LabelToValuesResponse>> get_detected_labels(
        const CallContext& ctx, const DetectedLabelsRequest& req) = 0;
};

} // namespace logfanout
