#include <catch2/catch_test_macros.hpp>
#include "querier/ingester_querier.hpp"
#include "mocks/mock_replica_client.hpp"

#include <algorithm>
#include <chrono>

using namespace logfanout;
using namespace logfanout::testing;
using namespace std::chrono_literals;

namespace {

struct Harness {
    std::shared_ptr<MockTopology> topology = std::make_shared<MockTopology>();
    std::shared_ptr<MockClientPool> pool = std::make_shared<MockClientPool>();

    // Read ring where every listed ingester must answer
    void read_ring(const std::vector<ReplicaDescriptor>& instances) {
        topology->read_set = ReplicaSet{instances, 0, 0};
        for (const auto& i : instances) {
            if (!pool->get(i.addr)) pool->add(i.addr);
        }
    }

    IngesterQuerier querier(QuerierConfig config = {}, ShardCountLookup lookup = nullptr) {
        if (!lookup) lookup = [](const std::string&) { return 1; };
        return IngesterQuerier(config, topology, pool, std::move(lookup));
    }

    // Two partitions, two zones each: p0-a/p0-b and p1-a/p1-b
    void two_partitions() {
        for (const char* addr : {"p0-a", "p0-b", "p1-a", "p1-b"}) pool->add(addr);
        topology->partition_sets = {
            partition_set({replica("p0-a", "zone-a"), replica("p0-b", "zone-b")}),
            partition_set({replica("p1-a", "zone-a"), replica("p1-b", "zone-b")}),
        };
    }
};

QuerierConfig partitioned_config() {
    QuerierConfig config;
    config.query_partition_ingesters = true;
    config.query_ingesters_within = 2h;
    return config;
}

std::vector<LabelMatcher> app_api() {
    return {LabelMatcher{MatchType::EQUAL, "app", "api"}};
}

QueryResponse one_entry(const std::string& labels, int second) {
    LogStream s{labels, 1, {LogEntry{Timestamp{} + std::chrono::seconds(second), "hello"}}};
    return QueryResponse{{s}};
}

} // anonymous namespace

// ============================================================================
// Streaming selects
// ============================================================================

TEST_CASE("IngesterQuerier: select_logs returns one iterator per ingester", "[querier]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1")});
    h.pool->get("i-0")->query_batches = {one_entry("{app=\"api\"}", 1)};
    h.pool->get("i-1")->query_batches = {one_entry("{app=\"api\"}", 2)};

    auto q = h.querier();
    auto session = QuerySession::create("tenant-a");
    SelectLogParams params;
    params.request.selector = "{app=\"api\"}";
    params.request.direction = Direction::BACKWARD;

    auto r = q.select_logs(session, params);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    CHECK(session.stats->ingesters_reached.load() == 2);
    CHECK(h.pool->get("i-0")->last_selector() == "{app=\"api\"}");

    size_t entries = 0;
    for (auto& it : r.value()) {
        while (it->next()) {
            CHECK(it->at().line == "hello");
            ++entries;
        }
        CHECK_FALSE(it->has_error());
    }
    CHECK(entries == 2);
}

TEST_CASE("IngesterQuerier: select_samples", "[querier]") {
    Harness h;
    h.read_ring({replica("i-0")});
    SampleSeries series{"{app=\"api\"}", 7, {Sample{Timestamp{} + 1s, 4.5, 0}}};
    h.pool->get("i-0")->sample_batches = {SampleQueryResponse{{series}}};

    auto q = h.querier();
    auto session = QuerySession::create("tenant-a");
    auto r = q.select_samples(session, SelectSampleParams{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0]->next());
    CHECK(r.value()[0]->at().value == 4.5);
    CHECK(r.value()[0]->stream_hash() == 7);
    CHECK(session.stats->ingesters_reached.load() == 1);
}

TEST_CASE("IngesterQuerier: select fails when quorum is lost", "[querier]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1")});
    h.pool->get("i-1")->set_behavior({.fail = ErrorCategory::UNAVAILABLE});

    auto r = h.querier().select_logs(QuerySession::create("tenant-a"), SelectLogParams{});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNAVAILABLE);
}

TEST_CASE("IngesterQuerier: streams outlive the quorum", "[querier]") {
    Harness h;
    const std::vector<ReplicaDescriptor> ring{replica("i-0"), replica("i-1"), replica("i-2")};
    h.read_ring(ring);
    h.topology->read_set = ReplicaSet::majority(ring);
    SampleSeries series{"{app=\"api\"}", 7, {Sample{Timestamp{} + 1s, 1.0, 0}}};
    for (const auto& i : ring) {
        h.pool->get(i.addr)->query_batches = {one_entry("{app=\"api\"}", 1)};
        h.pool->get(i.addr)->sample_batches = {SampleQueryResponse{{series}}};
    }
    auto q = h.querier();

    SECTION("select_logs") {
        auto r = q.select_logs(QuerySession::create("tenant-a"), SelectLogParams{});
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 2);
        for (auto& it : r.value()) {
            CHECK(it->next());
            CHECK_FALSE(it->next());
            CHECK_FALSE(it->has_error());
        }
    }

    SECTION("select_samples") {
        auto r = q.select_samples(QuerySession::create("tenant-a"), SelectSampleParams{});
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 2);
        for (auto& it : r.value()) {
            CHECK(it->next());
            CHECK_FALSE(it->next());
            CHECK_FALSE(it->has_error());
        }
    }

    SECTION("tail") {
        auto r = q.tail(QuerySession::create("tenant-a"), TailRequest{});
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 2);
        for (auto& [addr, stream] : r.value()) {
            auto batch = stream->recv();
            CHECK(batch.is_ok());
        }
    }
}

TEST_CASE("IngesterQuerier: partitioned streams outlive the fan-out", "[querier][partition]") {
    Harness h;
    h.two_partitions();
    h.pool->get("p0-a")->query_batches = {one_entry("{app=\"api\"}", 1)};
    h.pool->get("p1-a")->query_batches = {one_entry("{app=\"api\"}", 2)};

    auto q = h.querier(partitioned_config());
    auto r = q.select_logs(QuerySession::create("tenant-a"), SelectLogParams{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);

    size_t entries = 0;
    for (auto& it : r.value()) {
        while (it->next()) ++entries;
        CHECK_FALSE(it->has_error());
    }
    CHECK(entries == 2);
}

// ============================================================================
// Label / series / tail
// ============================================================================

TEST_CASE("IngesterQuerier: label keeps per-ingester lists", "[querier]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1")});
    h.pool->get("i-0")->label_response.values = {"app", "env"};
    h.pool->get("i-1")->label_response.values = {"app"};

    auto r = h.querier().label(QuerySession::create("tenant-a"), LabelRequest{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    CHECK(r.value()[0] == std::vector<std::string>{"app", "env"});
    CHECK(r.value()[1] == std::vector<std::string>{"app"});
}

TEST_CASE("IngesterQuerier: series", "[querier]") {
    Harness h;
    h.read_ring({replica("i-0")});
    SeriesIdentifier id{{{"app", "api"}}};
    h.pool->get("i-0")->series_response.series = {id};

    auto r = h.querier().series(QuerySession::create("tenant-a"), SeriesRequest{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    CHECK(r.value()[0] == std::vector<SeriesIdentifier>{id});
}

TEST_CASE("IngesterQuerier: series does not hide unimplemented errors", "[querier]") {
    Harness h;
    h.read_ring({replica("i-0")});
    h.pool->get("i-0")->set_behavior({.fail = ErrorCategory::UNIMPLEMENTED});

    auto r = h.querier().series(QuerySession::create("tenant-a"), SeriesRequest{});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNIMPLEMENTED);
}

TEST_CASE("IngesterQuerier: tail opens a stream per ingester", "[querier][tail]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1")});

    auto r = h.querier().tail(QuerySession::create("tenant-a"), TailRequest{});
    REQUIRE(r.is_ok());
    CHECK(r.value().size() == 2);
    CHECK(r.value().contains("i-0"));
    CHECK(r.value().contains("i-1"));
}

TEST_CASE("IngesterQuerier: tail reconnects only missing active ingesters", "[querier][tail]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1"),
                 replica("i-2", "", InstanceState::LEAVING), replica("i-3")});

    auto r = h.querier().tail_disconnected_ingesters(
        QuerySession::create("tenant-a"), TailRequest{}, {"i-0"});
    REQUIRE(r.is_ok());
    CHECK(r.value().size() == 2);
    CHECK(r.value().contains("i-1"));
    CHECK(r.value().contains("i-3"));
    CHECK(h.pool->get("i-0")->call_count() == 0);
    CHECK(h.pool->get("i-2")->call_count() == 0);
}

TEST_CASE("IngesterQuerier: tail reconnect with nothing missing", "[querier][tail]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1", "", InstanceState::JOINING)});

    auto r = h.querier().tail_disconnected_ingesters(
        QuerySession::create("tenant-a"), TailRequest{}, {"i-0"});
    REQUIRE(r.is_ok());
    CHECK(r.value().empty());
    CHECK(h.pool->total_calls() == 0);
}

TEST_CASE("IngesterQuerier: tail reconnect needs every missing ingester", "[querier][tail]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1"), replica("i-2")});
    h.pool->get("i-2")->set_behavior({.fail = ErrorCategory::UNAVAILABLE});

    auto r = h.querier().tail_disconnected_ingesters(
        QuerySession::create("tenant-a"), TailRequest{}, {"i-0"});
    REQUIRE(r.is_error());
    CHECK(r.error_message().starts_with("ingester i-2"));
}

TEST_CASE("IngesterQuerier: tail reconnect surfaces topology errors", "[querier][tail]") {
    Harness h;
    h.topology->fail_with = Error{ErrorCategory::TOPOLOGY_ERROR, "ring not ready"};

    auto r = h.querier().tail_disconnected_ingesters(
        QuerySession::create("tenant-a"), TailRequest{}, {});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::TOPOLOGY_ERROR);
}

// ============================================================================
// Tailers count
// ============================================================================

TEST_CASE("IngesterQuerier: tailers_count asks active healthy ingesters", "[querier][tail]") {
    Harness h;
    for (const char* addr : {"i-0", "i-1", "i-2"}) h.pool->add(addr)->tailers = 3;
    h.topology->healthy_set = ReplicaSet{
        {replica("i-0"), replica("i-1", "", InstanceState::PENDING), replica("i-2")}, 1, 0};

    auto r = h.querier().tailers_count(QuerySession::create("tenant-a"));
    REQUIRE(r.is_ok());
    CHECK(r.value() == std::vector<uint32_t>{3, 3});
    CHECK(h.pool->get("i-1")->call_count() == 0);
}

TEST_CASE("IngesterQuerier: tailers_count without active ingesters", "[querier][tail]") {
    Harness h;
    h.topology->healthy_set = ReplicaSet{{replica("i-0", "", InstanceState::LEAVING)}, 0, 0};

    auto r = h.querier().tailers_count(QuerySession::create("tenant-a"));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::NO_HEALTHY_REPLICAS);
    CHECK(r.error_message() == "no active ingester found");
}

TEST_CASE("IngesterQuerier: tailers_count tolerates no failure", "[querier][tail]") {
    Harness h;
    h.pool->add("i-0");
    h.pool->add("i-1")->set_behavior({.fail = ErrorCategory::UNAVAILABLE});
    // max_errors on the healthy set is not used for counting
    h.topology->healthy_set = ReplicaSet{{replica("i-0"), replica("i-1")}, 1, 0};

    auto r = h.querier().tailers_count(QuerySession::create("tenant-a"));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNAVAILABLE);
}

// ============================================================================
// Index lookups
// ============================================================================

TEST_CASE("IngesterQuerier: chunk IDs are concatenated with duplicates", "[querier][index]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1")});
    h.pool->get("i-0")->chunk_ids_response.chunk_ids = {"c1", "c2"};
    h.pool->get("i-1")->chunk_ids_response.chunk_ids = {"c2", "c3"};

    auto r = h.querier().get_chunk_ids(QuerySession::create("tenant-a"),
                                       Timestamp{}, Timestamp{} + 1h, app_api());
    REQUIRE(r.is_ok());
    CHECK(r.value() == std::vector<std::string>{"c1", "c2", "c2", "c3"});
    CHECK(h.pool->get("i-0")->last_matchers() == "{app=\"api\"}");
}

TEST_CASE("IngesterQuerier: stats are summed", "[querier][index]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1")});
    h.pool->get("i-0")->stats_response = IndexStats{.streams = 1, .chunks = 2, .bytes = 3, .entries = 4};
    h.pool->get("i-1")->stats_response = IndexStats{.streams = 10, .chunks = 20, .bytes = 30, .entries = 40};

    auto r = h.querier().stats(QuerySession::create("tenant-a"), Timestamp{}, Timestamp{}, app_api());
    REQUIRE(r.is_ok());
    CHECK(r.value() == IndexStats{.streams = 11, .chunks = 22, .bytes = 33, .entries = 44});
}

TEST_CASE("IngesterQuerier: stats from older ingesters are zero", "[querier][index]") {
    Harness h;
    h.read_ring({replica("i-0")});
    h.pool->get("i-0")->set_behavior({.fail = ErrorCategory::UNIMPLEMENTED});

    auto r = h.querier().stats(QuerySession::create("tenant-a"), Timestamp{}, Timestamp{}, app_api());
    REQUIRE(r.is_ok());
    CHECK(r.value() == IndexStats{});
}

TEST_CASE("IngesterQuerier: other stats errors propagate", "[querier][index]") {
    Harness h;
    h.read_ring({replica("i-0")});
    h.pool->get("i-0")->set_behavior({.fail = ErrorCategory::UNAVAILABLE});

    auto r = h.querier().stats(QuerySession::create("tenant-a"), Timestamp{}, Timestamp{}, app_api());
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNAVAILABLE);
}

TEST_CASE("IngesterQuerier: volume is merged and limited", "[querier][index]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1")});
    h.pool->get("i-0")->volume_response.volumes = {{"{app=\"a\"}", 5}, {"{app=\"b\"}", 1}};
    h.pool->get("i-1")->volume_response.volumes = {{"{app=\"b\"}", 7}, {"{app=\"c\"}", 2}};

    auto r = h.querier().volume(QuerySession::create("tenant-a"), Timestamp{}, Timestamp{},
                                2, {"app"}, "series", app_api());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().volumes.size() == 2);
    CHECK(r.value().volumes[0] == Volume{"{app=\"b\"}", 8});
    CHECK(r.value().volumes[1] == Volume{"{app=\"a\"}", 5});
    CHECK(r.value().limit == 2);
}

TEST_CASE("IngesterQuerier: volume from older ingesters is empty", "[querier][index]") {
    Harness h;
    h.read_ring({replica("i-0")});
    h.pool->get("i-0")->set_behavior({.fail = ErrorCategory::UNIMPLEMENTED});

    auto r = h.querier().volume(QuerySession::create("tenant-a"), Timestamp{}, Timestamp{},
                                10, {}, "", app_api());
    REQUIRE(r.is_ok());
    CHECK(r.value().volumes.empty());
}

TEST_CASE("IngesterQuerier: detected labels are merged", "[querier][index]") {
    Harness h;
    h.read_ring({replica("i-0"), replica("i-1"), replica("i-2")});
    auto r0 = std::make_shared<LabelToValuesResponse>();
    r0->labels["level"] = {"info", "error"};
    auto r1 = std::make_shared<LabelToValuesResponse>();
    r1->labels["level"] = {"info"};
    h.pool->get("i-0")->detected_labels_response = r0;
    h.pool->get("i-1")->detected_labels_response = r1;
    // i-2 answers with no payload

    auto r = h.querier().detected_labels(QuerySession::create("tenant-a"), DetectedLabelsRequest{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().labels.size() == 1);
    CHECK(r.value().labels.at("level") == std::vector<std::string>{"error", "info"});
}

TEST_CASE("IngesterQuerier: detected labels errors propagate", "[querier][index]") {
    Harness h;
    h.read_ring({replica("i-0")});
    h.pool->get("i-0")->set_behavior({.fail = ErrorCategory::UNIMPLEMENTED});

    auto r = h.querier().detected_labels(QuerySession::create("tenant-a"), DetectedLabelsRequest{});
    REQUIRE(r.is_error());
}

// ============================================================================
// Partitioned mode
// ============================================================================

TEST_CASE("IngesterQuerier: partitioned fan-out uses the tenant shard", "[querier][partition]") {
    Harness h;
    h.two_partitions();

    auto q = h.querier(partitioned_config(), [](const std::string& tenant) {
        return tenant == "tenant-a" ? 2 : 1;
    });
    auto session = QuerySession::create("tenant-a");

    auto r = q.label(session, LabelRequest{});
    REQUIRE(r.is_ok());
    CHECK(r.value().size() == 2);
    CHECK(session.partition->is_partitioned());
    CHECK(session.partition->used_addresses() == std::vector<std::string>{"p0-a", "p1-a"});

    std::lock_guard lock(h.topology->mutex_);
    CHECK(h.topology->last_tenant == "tenant-a");
    CHECK(h.topology->last_shard_count == 2);
    CHECK(h.topology->last_lookback == 2h);
}

TEST_CASE("IngesterQuerier: chunk IDs follow the partitions of the select", "[querier][partition]") {
    Harness h;
    h.two_partitions();
    h.pool->get("p0-a")->chunk_ids_response.chunk_ids = {"c-p0"};
    h.pool->get("p1-a")->chunk_ids_response.chunk_ids = {"c-p1"};
    h.pool->get("p0-b")->chunk_ids_response.chunk_ids = {"wrong"};

    auto q = h.querier(partitioned_config());
    auto session = QuerySession::create("tenant-a");

    auto selected = q.select_logs(session, SelectLogParams{});
    REQUIRE(selected.is_ok());
    CHECK(selected.value().size() == 2);
    CHECK(h.topology->partition_calls.load() == 1);

    auto r = q.get_chunk_ids(session, Timestamp{}, Timestamp{}, app_api());
    REQUIRE(r.is_ok());
    auto ids = r.value();
    std::sort(ids.begin(), ids.end());
    CHECK(ids == std::vector<std::string>{"c-p0", "c-p1"});

    // Replay does not consult the ring again
    CHECK(h.topology->partition_calls.load() == 1);
    CHECK(h.pool->get("p0-b")->call_count() == 0);
    CHECK(h.pool->get("p1-b")->call_count() == 0);
}

TEST_CASE("IngesterQuerier: chunk IDs in a fresh partitioned session fan out", "[querier][partition]") {
    Harness h;
    h.two_partitions();
    h.pool->get("p0-a")->chunk_ids_response.chunk_ids = {"c-p0"};
    h.pool->get("p1-a")->chunk_ids_response.chunk_ids = {"c-p1"};

    auto q = h.querier(partitioned_config());
    auto r = q.get_chunk_ids(QuerySession::create("tenant-a"), Timestamp{}, Timestamp{}, app_api());
    REQUIRE(r.is_ok());
    CHECK(r.value() == std::vector<std::string>{"c-p0", "c-p1"});
    CHECK(h.topology->partition_calls.load() == 1);
}

TEST_CASE("IngesterQuerier: partitioned mode needs a tenant", "[querier][partition]") {
    Harness h;
    h.two_partitions();

    auto r = h.querier(partitioned_config()).label(QuerySession::create(), LabelRequest{});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::IDENTITY_RESOLUTION_ERROR);
    CHECK(h.topology->partition_calls.load() == 0);
    CHECK(h.pool->total_calls() == 0);
}

TEST_CASE("IngesterQuerier: non-positive shard count is a config error", "[querier][partition]") {
    Harness h;
    h.two_partitions();

    auto q = h.querier(partitioned_config(), [](const std::string&) { return 0; });
    auto r = q.series(QuerySession::create("tenant-a"), SeriesRequest{});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(h.topology->partition_calls.load() == 0);
}

TEST_CASE("IngesterQuerier: partition topology errors propagate", "[querier][partition]") {
    Harness h;
    h.topology->fail_with = Error{ErrorCategory::TOPOLOGY_ERROR, "partition ring empty"};

    auto r = h.querier(partitioned_config()).label(QuerySession::create("tenant-a"), LabelRequest{});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::TOPOLOGY_ERROR);
}

TEST_CASE("IngesterQuerier: non-partitioned mode ignores the tenant", "[querier]") {
    Harness h;
    h.read_ring({replica("i-0")});

    auto session = QuerySession::create();
    auto r = h.querier().label(session, LabelRequest{});
    REQUIRE(r.is_ok());
    CHECK_FALSE(session.partition->is_partitioned());
    CHECK(session.partition->used_count() == 0);
}
