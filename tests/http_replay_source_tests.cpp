#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "remote/http_replay_source.hpp"

namespace {

constexpr const char* kBase = "http://replays.test";

class FakeTransport : public remote::IHttpTransport {
public:
    void on_get(const std::string& url, remote::HttpResponse r) { gets_[url] = std::move(r); }
    void on_head(const std::string& url, remote::HttpResponse r) { heads_[url] = std::move(r); }
    void on_post(const std::string& url, remote::HttpResponse r) { posts_[url] = std::move(r); }
    // Served once for `call` ("HEAD <url>", ...) before the regular table.
    void once(const std::string& call, remote::HttpResponse r) { scripted_[call].push_back(std::move(r)); }

    remote::HttpResponse get(const std::string& url) override { return lookup(gets_, "GET " + url, url); }
    remote::HttpResponse head(const std::string& url) override { return lookup(heads_, "HEAD " + url, url); }
    remote::HttpResponse post(const std::string& url, const std::string&) override {
        return lookup(posts_, "POST " + url, url);
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return calls_;
    }

    std::size_t count_prefix(const std::string& prefix) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::size_t n = 0;
        for (const auto& c : calls_) {
            n += c.rfind(prefix, 0) == 0 ? 1 : 0;
        }
        return n;
    }

private:
    remote::HttpResponse lookup(const std::map<std::string, remote::HttpResponse>& table,
                                const std::string& call,
                                const std::string& url) {
        std::lock_guard<std::mutex> lk(mu_);
        calls_.push_back(call);
        if (auto s = scripted_.find(call); s != scripted_.end() && !s->second.empty()) {
            remote::HttpResponse r = std::move(s->second.front());
            s->second.pop_front();
            return r;
        }
        const auto it = table.find(url);
        if (it == table.end()) {
            remote::HttpResponse r;
            r.status = 404;
            return r;
        }
        return it->second;
    }

    mutable std::mutex mu_;
    std::vector<std::string> calls_;
    std::map<std::string, remote::HttpResponse> gets_;
    std::map<std::string, remote::HttpResponse> heads_;
    std::map<std::string, remote::HttpResponse> posts_;
    std::map<std::string, std::deque<remote::HttpResponse>> scripted_;
};

class RecordingSleeper : public util::Sleeper {
public:
    void sleep_for(std::chrono::milliseconds d) override {
        std::lock_guard<std::mutex> lk(mu_);
        delays_.push_back(d);
    }

    std::vector<std::chrono::milliseconds> delays() const {
        std::lock_guard<std::mutex> lk(mu_);
        return delays_;
    }

private:
    mutable std::mutex mu_;
    std::vector<std::chrono::milliseconds> delays_;
};

remote::HttpResponse ok_body(std::string body) {
    remote::HttpResponse r;
    r.status = 200;
    r.body = std::move(body);
    return r;
}

remote::HttpResponse status_only(long status) {
    remote::HttpResponse r;
    r.status = status;
    return r;
}

remote::HttpResponse head_ok(std::uint32_t size, std::uint32_t t1, std::uint32_t t2) {
    remote::HttpResponse r;
    r.status = 200;
    r.headers = {{"content-length", std::to_string(size)}, {"mtime1", std::to_string(t1)}, {"mtime2", std::to_string(t2)}};
    return r;
}

const char* kMeta = R"({"gameMode":"SND","friendlyName":"bridge","competitive":false,"workshop_mods":"",
    "live":false,"totalTime":8000,"__v":5,"created":"2024-03-01T18:22:43Z"})";

// A recorded replay "abc123" with two checkpoints, one event and two stream chunks.
void install_replay(FakeTransport& t) {
    const std::string replay = std::string(kBase) + "/replay/abc123";
    t.on_get(std::string(kBase) + "/find/?game=all&offset=0&live=false",
             ok_body(R"({"replays":[{"_id":"zzz999"},{"_id":"abc123","gameMode":"SND"}],"total":2})"));
    t.on_post(replay + "/startDownloading?user", ok_body(R"({"state":"Recorded","numChunks":2})"));
    t.on_get(std::string(kBase) + "/meta/abc123", ok_body(kMeta));
    t.on_get(replay + "/event?group=checkpoint",
             ok_body(R"({"events":[
                {"id":"cp0","group":"checkpoint","meta":"","time1":0,"time2":4000,"data":{"type":"Buffer","data":[1,2]}},
                {"id":"cp1","group":"checkpoint","meta":"","time1":4000,"time2":8000,"data":{"type":"Buffer","data":[3]}}]})"));
    t.on_get(replay + "/event?group=Pavlov",
             ok_body(R"({"events":[
                {"id":"kill","group":"Pavlov","meta":"headshot","time1":2500,"time2":2500,"data":{"type":"Buffer","data":[7,7,7]}},
                {"group":"Pavlov","data":{"data":[]}}]})"));
    t.on_head(replay + "/file/replay.header", head_ok(5, 0, 0));
    t.on_head(replay + "/file/stream.0", head_ok(4, 0, 4000));
    t.on_head(replay + "/file/stream.1", head_ok(6, 4000, 8000));
    t.on_get(replay + "/file/replay.header", ok_body("HEADR"));
    t.on_get(replay + "/file/stream.0", ok_body("s0s0"));
    t.on_get(replay + "/file/stream.1", ok_body("s1s1s1"));
}

remote::HttpSourceConfig test_config() {
    remote::HttpSourceConfig cfg;
    cfg.base_url = std::string(kBase) + "/";
    cfg.head_concurrency = 2;
    cfg.head_retry = remote::zero_delay(3);
    return cfg;
}

const core::ChunkDescriptor* find_chunk(const core::ReplayManifest& m, const std::string& id) {
    for (const auto& c : m.chunks) {
        if (c.remote_id == id) {
            return &c;
        }
    }
    return nullptr;
}

} // namespace

TEST(HttpReplaySource, BuildsManifestFromService) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    remote::HttpReplaySource source(test_config(), std::move(transport));

    core::ReplayManifest m;
    const auto res = source.fetch_manifest("abc123", m);
    ASSERT_TRUE(res.ok()) << res.detail;
    EXPECT_EQ(m.replay_id, "abc123");
    EXPECT_EQ(m.meta.total_time_ms, 8000u);
    EXPECT_EQ(m.meta.network_version, 5u);
    ASSERT_EQ(m.chunks.size(), 6u);

    const auto* header = find_chunk(m, "replay.header");
    ASSERT_NE(header, nullptr);
    EXPECT_EQ(header->type, core::ChunkType::Header);
    EXPECT_EQ(header->size, 5u);

    const auto* s1 = find_chunk(m, "stream.1");
    ASSERT_NE(s1, nullptr);
    EXPECT_EQ(s1->type, core::ChunkType::Stream);
    EXPECT_EQ(s1->size, 6u);
    EXPECT_EQ(s1->start_ms, 4000u);
    EXPECT_EQ(s1->end_ms, 8000u);
    EXPECT_EQ(s1->stream_index, 1u);

    const auto* kill = find_chunk(m, "kill");
    ASSERT_NE(kill, nullptr);
    EXPECT_EQ(kill->type, core::ChunkType::Event);
    EXPECT_EQ(kill->group, "Pavlov");
    EXPECT_EQ(kill->metadata, "headshot");
    EXPECT_EQ(kill->size, 3u);
    EXPECT_EQ(kill->start_ms, 2500u);

    const auto* cp1 = find_chunk(m, "cp1");
    ASSERT_NE(cp1, nullptr);
    EXPECT_EQ(cp1->type, core::ChunkType::Checkpoint);
    EXPECT_EQ(cp1->group, "checkpoint");
}

TEST(HttpReplaySource, FetchesInlineAndRemotePayloads) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    FakeTransport* fake = transport.get();
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    ASSERT_TRUE(source.fetch_manifest("abc123", m).ok());

    core::ChunkPayload payload;
    ASSERT_TRUE(source.fetch_chunk(*find_chunk(m, "kill"), payload).ok());
    EXPECT_EQ(payload, (core::ChunkPayload{std::byte{7}, std::byte{7}, std::byte{7}}));

    const std::size_t gets_before = fake->count_prefix("GET ");
    ASSERT_TRUE(source.fetch_chunk(*find_chunk(m, "stream.1"), payload).ok());
    EXPECT_EQ(payload.size(), 6u);
    EXPECT_EQ(payload[1], std::byte{'1'});
    EXPECT_EQ(fake->count_prefix("GET "), gets_before + 1);
    EXPECT_GT(source.stats().requests, 0u);
}

TEST(HttpReplaySource, RejectsMalformedIdWithoutRequests) {
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* fake = transport.get();
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    EXPECT_EQ(source.fetch_manifest("", m).status, remote::FetchStatus::NotFound);
    EXPECT_EQ(source.fetch_manifest("../etc", m).status, remote::FetchStatus::NotFound);
    EXPECT_EQ(source.fetch_manifest("caf\xC3\xA9", m).status, remote::FetchStatus::NotFound);
    EXPECT_TRUE(fake->calls().empty());
}

TEST(HttpReplaySource, UnknownIdIsNotFound) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    EXPECT_EQ(source.fetch_manifest("nothere1", m).status, remote::FetchStatus::NotFound);
}

TEST(HttpReplaySource, FindPagesThroughListing) {
    auto transport = std::make_unique<FakeTransport>();
    transport->on_get(std::string(kBase) + "/find/?game=all&offset=0&live=false",
                      ok_body(R"({"replays":[{"_id":"a1"},{"_id":"a2"}],"total":3})"));
    transport->on_get(std::string(kBase) + "/find/?game=all&offset=2&live=false",
                      ok_body(R"({"replays":[{"_id":"target","friendlyName":"bridge"}],"total":3})"));
    FakeTransport* fake = transport.get();
    auto cfg = test_config();
    cfg.page_size = 2;
    remote::HttpReplaySource source(cfg, std::move(transport));

    remote::ReplayListing listing;
    ASSERT_TRUE(source.find_replay("target", listing).ok());
    EXPECT_EQ(listing.map_name, "bridge");
    EXPECT_EQ(fake->count_prefix("GET "), 2u);

    EXPECT_EQ(source.find_replay("missing", listing).status, remote::FetchStatus::NotFound);
}

TEST(HttpReplaySource, NotRecordedIsNotReady) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    transport->on_post(std::string(kBase) + "/replay/abc123/startDownloading?user",
                       ok_body(R"({"state":"Recording","numChunks":2})"));
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    EXPECT_EQ(source.fetch_manifest("abc123", m).status, remote::FetchStatus::NotReady);
}

TEST(HttpReplaySource, ServerErrorsAreRetryable) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    transport->on_get(std::string(kBase) + "/meta/abc123", status_only(503));
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    EXPECT_EQ(source.fetch_manifest("abc123", m).status, remote::FetchStatus::ServiceUnavailable);
}

TEST(HttpReplaySource, TransportFailureIsRetryable) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    remote::HttpResponse timeout;
    timeout.transport_error = "Timeout was reached";
    transport->on_head(std::string(kBase) + "/replay/abc123/file/stream.1", timeout);
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    const auto res = source.fetch_manifest("abc123", m);
    EXPECT_EQ(res.status, remote::FetchStatus::ServiceUnavailable);
    EXPECT_NE(res.detail.find("stream.1"), std::string::npos);
}

TEST(HttpReplaySource, HeadWithoutLengthIsMalformed) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    transport->on_head(std::string(kBase) + "/replay/abc123/file/replay.header", status_only(200));
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    EXPECT_EQ(source.fetch_manifest("abc123", m).status, remote::FetchStatus::MalformedResponse);
}

TEST(HttpReplaySource, BadMetaIsMalformed) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    transport->on_get(std::string(kBase) + "/meta/abc123", ok_body("<html>oops</html>"));
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    EXPECT_EQ(source.fetch_manifest("abc123", m).status, remote::FetchStatus::MalformedResponse);
}

TEST(HttpReplaySource, SkipsListingWhenDisabled) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    FakeTransport* fake = transport.get();
    auto cfg = test_config();
    cfg.locate_in_listing = false;
    remote::HttpReplaySource source(cfg, std::move(transport));
    core::ReplayManifest m;
    ASSERT_TRUE(source.fetch_manifest("abc123", m).ok());
    EXPECT_EQ(fake->count_prefix("GET " + std::string(kBase) + "/find/"), 0u);
}

TEST(HttpReplaySource, ChunkStatusMapping) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    FakeTransport* fake = transport.get();
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    ASSERT_TRUE(source.fetch_manifest("abc123", m).ok());
    const auto* s0 = find_chunk(m, "stream.0");
    ASSERT_NE(s0, nullptr);
    core::ChunkPayload payload;

    fake->on_get(std::string(kBase) + "/replay/abc123/file/stream.0", status_only(410));
    EXPECT_EQ(source.fetch_chunk(*s0, payload).status, remote::FetchStatus::ChunkMissing);

    fake->on_get(std::string(kBase) + "/replay/abc123/file/stream.0", status_only(429));
    EXPECT_EQ(source.fetch_chunk(*s0, payload).status, remote::FetchStatus::ServiceUnavailable);

    fake->on_get(std::string(kBase) + "/replay/abc123/file/stream.0", ok_body("short"));
    EXPECT_EQ(source.fetch_chunk(*s0, payload).status, remote::FetchStatus::SizeMismatch);

    core::ChunkDescriptor unknown = *find_chunk(m, "kill");
    unknown.remote_id = "ghost";
    EXPECT_EQ(source.fetch_chunk(unknown, payload).status, remote::FetchStatus::ChunkMissing);
}

TEST(HttpResponse, HeaderLookupIgnoresCase) {
    remote::HttpResponse r;
    r.headers = {{"content-length", "12"}};
    ASSERT_NE(r.header("Content-Length"), nullptr);
    EXPECT_EQ(*r.header("CONTENT-LENGTH"), "12");
    EXPECT_EQ(r.header("mtime1"), nullptr);
}

TEST(HttpReplaySource, HeadRetriesWithoutRefetchingManifest) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    const std::string replay = std::string(kBase) + "/replay/abc123";
    transport->on_post(replay + "/startDownloading?user", ok_body(R"({"state":"Recorded","numChunks":4})"));
    transport->on_head(replay + "/file/stream.2", head_ok(3, 8000, 9000));
    transport->on_head(replay + "/file/stream.3", head_ok(2, 9000, 9500));
    transport->once("HEAD " + replay + "/file/stream.2", status_only(503));
    FakeTransport* fake = transport.get();

    RecordingSleeper sleeper;
    auto cfg = test_config();
    cfg.head_retry = remote::RetryPolicy{3, std::chrono::milliseconds{2000}, std::chrono::milliseconds{30000}, 0.0};
    remote::HttpReplaySource source(cfg, std::move(transport), sleeper);
    core::ReplayManifest m;
    const auto res = source.fetch_manifest("abc123", m);
    ASSERT_TRUE(res.ok()) << res.detail;

    EXPECT_EQ(fake->count_prefix("POST "), 1u);
    EXPECT_EQ(fake->count_prefix("GET " + std::string(kBase) + "/meta/"), 1u);
    EXPECT_EQ(fake->count_prefix("GET " + replay + "/event"), 2u);
    EXPECT_EQ(fake->count_prefix("HEAD " + replay + "/file/stream.2"), 2u);
    // header + 4 streams + the one retry
    EXPECT_EQ(fake->count_prefix("HEAD "), 6u);
    ASSERT_EQ(sleeper.delays().size(), 1u);
    EXPECT_EQ(sleeper.delays()[0], std::chrono::milliseconds{2000});

    const auto* s2 = find_chunk(m, "stream.2");
    ASSERT_NE(s2, nullptr);
    EXPECT_EQ(s2->size, 3u);
    EXPECT_EQ(s2->start_ms, 8000u);
}

TEST(HttpReplaySource, HeadRetryBudgetIsBounded) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    const std::string header = std::string(kBase) + "/replay/abc123/file/replay.header";
    transport->on_head(header, status_only(502));
    FakeTransport* fake = transport.get();
    RecordingSleeper sleeper;
    remote::HttpReplaySource source(test_config(), std::move(transport), sleeper);
    core::ReplayManifest m;
    EXPECT_EQ(source.fetch_manifest("abc123", m).status, remote::FetchStatus::ServiceUnavailable);
    EXPECT_EQ(fake->count_prefix("HEAD " + header), 3u);
    EXPECT_EQ(sleeper.delays().size(), 2u);
    // Streams are never sized once the header fails.
    EXPECT_EQ(fake->count_prefix("HEAD " + std::string(kBase) + "/replay/abc123/file/stream."), 0u);
}

TEST(HttpReplaySource, RejectsHugeChunkCountBeforeSizing) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    transport->on_post(std::string(kBase) + "/replay/abc123/startDownloading?user",
                       ok_body(R"({"state":"Recorded","numChunks":4294967295})"));
    FakeTransport* fake = transport.get();
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    const auto res = source.fetch_manifest("abc123", m);
    EXPECT_EQ(res.status, remote::FetchStatus::MalformedResponse);
    EXPECT_NE(res.detail.find("numChunks"), std::string::npos);
    EXPECT_EQ(fake->count_prefix("HEAD "), 0u);
}

TEST(HttpReplaySource, InlinePayloadIsHandedOverOnce) {
    auto transport = std::make_unique<FakeTransport>();
    install_replay(*transport);
    remote::HttpReplaySource source(test_config(), std::move(transport));
    core::ReplayManifest m;
    ASSERT_TRUE(source.fetch_manifest("abc123", m).ok());

    core::ChunkPayload payload;
    ASSERT_TRUE(source.fetch_chunk(*find_chunk(m, "cp0"), payload).ok());
    EXPECT_EQ(payload.size(), 2u);
    EXPECT_EQ(source.fetch_chunk(*find_chunk(m, "cp0"), payload).status, remote::FetchStatus::ChunkMissing);
    ASSERT_TRUE(source.fetch_chunk(*find_chunk(m, "cp1"), payload).ok());
    EXPECT_EQ(payload, (core::ChunkPayload{std::byte{3}}));
}
