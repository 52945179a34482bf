#include <gtest/gtest.h>

#include "minstrel/audio/subscription.hpp"
#include "minstrel/audio/subscription_registry.hpp"
#include "fakes.hpp"

using namespace minstrel;
using audio::connection_status;
using audio::notice_kind;
using audio::player_status;
using std::chrono::seconds;

class SubscriptionTest : public ::testing::Test {
protected:
    static constexpr audio::session_key guild = 1;

    void SetUp() override {
        sub = registry.get_or_create(guild, audio::join_target{ guild, 100 }, 555);
        connection()->emit(connection_status::ready);
    }

    std::shared_ptr<fakes::connection_probe> connection() { return transport.connection(guild); }
    std::shared_ptr<fakes::engine_probe> engine() { return transport.engine(guild); }

    std::shared_ptr<audio::track> track(const std::string& title, fakes::track_options options = {}) {
        return fakes::make_track(title, log, options);
    }

    fakes::manual_scheduler            timers;
    fakes::fake_transport              transport;
    fakes::recording_sink              sink;
    audio::subscription_registry       registry{ transport, timers, sink };
    std::shared_ptr<fakes::event_log>  log = std::make_shared<fakes::event_log>();
    std::shared_ptr<audio::subscription> sub;
};

TEST_F(SubscriptionTest, PlaysTracksInOrder) {
    sub->enqueue(track("A"));
    sub->enqueue(track("B"));

    ASSERT_EQ(engine()->played.size(), 1u);
    EXPECT_EQ(sub->queue_size(), 1u);

    engine()->emit(player_status::playing);
    engine()->emit(player_status::idle);
    engine()->emit(player_status::playing);

    ASSERT_EQ(engine()->played.size(), 2u);
    EXPECT_EQ(engine()->played[0], "A");
    EXPECT_EQ(engine()->played[1], "B");
    EXPECT_EQ(sub->now_playing()->title(), "B");

    const fakes::event_log expected{ "start:A", "finish:A", "start:B" };
    EXPECT_EQ(*log, expected);
}

TEST_F(SubscriptionTest, EnqueueWaitsWhilePlaying) {
    sub->enqueue(track("A"));
    engine()->emit(player_status::playing);

    sub->enqueue(track("B"));

    EXPECT_EQ(engine()->played.size(), 1u);
    EXPECT_EQ(sub->player_state(), player_status::playing);
    EXPECT_EQ(sub->queue_size(), 1u);
}

TEST_F(SubscriptionTest, FailedProductionSkipsToTheNextTrack) {
    fakes::track_options broken;
    broken.fail_production = true;

    sub->bulk_enqueue({ track("A", broken), track("B") }, false);

    ASSERT_EQ(engine()->played.size(), 1u);
    EXPECT_EQ(engine()->played[0], "B");
    EXPECT_EQ(fakes::count_events(*log, "error:A"), 1u);
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 0u);
    EXPECT_EQ(sub->queue_size(), 0u);
}

TEST_F(SubscriptionTest, ProcessQueueIsNotReentrantDuringProduction) {
    int productions = 0;
    fakes::track_options options;
    options.productions = &productions;
    options.during_production = [](const audio::track& t) {
        if (auto owner = t.owner()) {
            owner->process_queue();
        }
    };

    sub->enqueue(track("A", options));
    sub->enqueue(track("B", options));

    EXPECT_EQ(productions, 1);
    EXPECT_EQ(engine()->played.size(), 1u);
    EXPECT_EQ(sub->queue_size(), 1u);
}

TEST_F(SubscriptionTest, RetryReplaysTheSameTrack) {
    fakes::track_options retried;
    retried.retry_limit = 1;
    auto a = track("A", retried);

    sub->enqueue(a);
    sub->enqueue(track("B"));
    engine()->emit(player_status::playing);
    engine()->fail("connection reset");

    ASSERT_EQ(engine()->played.size(), 2u);
    EXPECT_EQ(engine()->played[1], "A");
    EXPECT_EQ(a->retries(), 1u);
    EXPECT_FALSE(a->errored());
    EXPECT_EQ(sub->now_playing(), a);
    EXPECT_EQ(sub->queue_size(), 1u);
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 0u);

    engine()->emit(player_status::playing);
    EXPECT_EQ(fakes::count_events(*log, "start:A"), 2u);
}

TEST_F(SubscriptionTest, ExhaustedRetriesMoveOn) {
    auto a = track("A");

    sub->enqueue(a);
    sub->enqueue(track("B"));
    engine()->emit(player_status::playing);
    engine()->fail("connection reset");
    engine()->emit(player_status::idle);

    ASSERT_EQ(engine()->played.size(), 2u);
    EXPECT_EQ(engine()->played[1], "B");
    EXPECT_EQ(fakes::count_events(*log, "error:A"), 1u);
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 0u);
}

TEST_F(SubscriptionTest, IdleTimeoutLeavesOnce) {
    sub->enqueue(track("A"));
    engine()->emit(player_status::playing);
    engine()->emit(player_status::idle);

    timers.advance(seconds(29));
    EXPECT_FALSE(sub->destroyed());

    timers.advance(seconds(1));
    EXPECT_TRUE(sub->destroyed());
    EXPECT_EQ(sink.count(notice_kind::inactivity), 1u);
    EXPECT_EQ(sink.count(notice_kind::connection_lost), 0u);
    EXPECT_EQ(connection()->destroys, 1);
    EXPECT_EQ(registry.size(), 0u);

    timers.advance(seconds(60));
    EXPECT_EQ(sink.sent.size(), 1u);
}

TEST_F(SubscriptionTest, IdleTimeoutCoversAHandoverThatNeverPlays) {
    sub->enqueue(track("A"));
    sub->enqueue(track("B"));
    engine()->emit(player_status::playing);
    engine()->emit(player_status::idle);
    ASSERT_EQ(sub->player_state(), player_status::buffering);

    timers.advance(seconds(30));

    EXPECT_TRUE(sub->destroyed());
    EXPECT_EQ(sink.count(notice_kind::inactivity), 1u);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(SubscriptionTest, StopIsIdempotentAndSilent) {
    sub->stop();
    sub->stop();

    EXPECT_TRUE(sub->destroyed());
    EXPECT_EQ(connection()->destroys, 1);
    EXPECT_TRUE(sink.sent.empty());
    EXPECT_EQ(registry.get(guild), nullptr);
}

TEST_F(SubscriptionTest, StopDiscardsTheQueueWithoutCallbacks) {
    sub->enqueue(track("A"));
    sub->enqueue(track("B"));
    sub->enqueue(track("C"));
    engine()->emit(player_status::playing);

    sub->stop();

    EXPECT_EQ(sub->queue_size(), 0u);
    EXPECT_EQ(sub->now_playing(), nullptr);
    EXPECT_EQ(engine()->stops, 1);
    const fakes::event_log expected{ "start:A" };
    EXPECT_EQ(*log, expected);
}

TEST_F(SubscriptionTest, KickedConnectionReportsOnce) {
    sub->enqueue(track("A"));
    engine()->emit(player_status::playing);

    connection()->disconnect(audio::disconnect_reason::websocket_close, audio::close_code_moved_or_kicked);
    timers.advance(seconds(5));

    EXPECT_TRUE(sub->destroyed());
    EXPECT_EQ(sink.count(notice_kind::connection_lost), 1u);
    EXPECT_EQ(sink.sent.size(), 1u);
    EXPECT_EQ(sink.sent[0].first, 555u);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 0u);
}

TEST_F(SubscriptionTest, PauseResumeAndSkip) {
    sub->enqueue(track("A"));
    sub->enqueue(track("B"));
    engine()->emit(player_status::playing);

    EXPECT_TRUE(sub->pause());
    EXPECT_EQ(sub->player_state(), player_status::paused);
    EXPECT_TRUE(sub->resume());
    EXPECT_EQ(sub->player_state(), player_status::playing);

    EXPECT_TRUE(sub->skip());
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 1u);
    ASSERT_NE(sub->now_playing(), nullptr);
    EXPECT_EQ(sub->now_playing()->title(), "B");
}

TEST_F(SubscriptionTest, SkipWithNothingPlaying) {
    EXPECT_FALSE(sub->skip());
    EXPECT_FALSE(sub->pause());
}

TEST_F(SubscriptionTest, BulkEnqueueStartsTheFirstTrack) {
    sub->bulk_enqueue({ track("A"), track("B"), track("C") }, false);

    ASSERT_EQ(engine()->played.size(), 1u);
    EXPECT_EQ(engine()->played[0], "A");
    EXPECT_EQ(sub->queue_size(), 2u);

    auto rest = sub->queued(0, 10);
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0]->title(), "B");
    EXPECT_EQ(rest[1]->title(), "C");
}

TEST_F(SubscriptionTest, EnqueueNextJumpsTheQueue) {
    sub->enqueue(track("A"));
    sub->enqueue(track("B"));
    sub->enqueue_next(track("C"));

    auto rest = sub->queued(0, 10);
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0]->title(), "C");
    EXPECT_EQ(rest[1]->title(), "B");
}

TEST_F(SubscriptionTest, SwapClampsToTheLastEntry) {
    sub->enqueue(track("A"));
    sub->bulk_enqueue({ track("B"), track("C"), track("D") }, false);

    auto swapped = sub->swap(0, 10);

    ASSERT_TRUE(swapped.has_value());
    EXPECT_EQ(swapped->first, 0u);
    EXPECT_EQ(swapped->second, 2u);
    auto rest = sub->queued(0, 10);
    ASSERT_EQ(rest.size(), 3u);
    EXPECT_EQ(rest[0]->title(), "D");
    EXPECT_EQ(rest[2]->title(), "B");
}

TEST_F(SubscriptionTest, SwapAfterTheQueueShrank) {
    sub->enqueue(track("A"));
    sub->enqueue(track("B"));
    sub->enqueue(track("C"));
    engine()->emit(player_status::playing);
    ASSERT_EQ(sub->queue_size(), 2u);

    // A ends between reading the size and swapping.
    engine()->emit(player_status::idle);
    ASSERT_EQ(sub->queue_size(), 1u);

    EXPECT_FALSE(sub->swap(1, 0).has_value());
    auto rest = sub->queued(0, 10);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0]->title(), "C");
}

TEST_F(SubscriptionTest, SwapRejectsTheSameEntry) {
    sub->enqueue(track("A"));
    sub->bulk_enqueue({ track("B"), track("C") }, false);

    EXPECT_FALSE(sub->swap(1, 5).has_value());
    EXPECT_EQ(sub->queued(0, 10)[0]->title(), "B");
}

TEST_F(SubscriptionTest, OperationsAfterStopAreIgnored) {
    sub->stop();

    sub->enqueue(track("A"));
    sub->bulk_enqueue({ track("B") });

    EXPECT_TRUE(engine()->played.empty());
    EXPECT_EQ(sub->queue_size(), 0u);
    EXPECT_FALSE(sub->pause());
    EXPECT_FALSE(sub->skip());
}

TEST_F(SubscriptionTest, NotifyUsesTheLatestTarget) {
    auto same = registry.get_or_create(guild, audio::join_target{ guild, 100 }, 777);
    ASSERT_EQ(same, sub);

    audio::notice message;
    message.text = "hello";
    sub->notify(message);

    ASSERT_EQ(sink.sent.size(), 1u);
    EXPECT_EQ(sink.sent[0].first, 777u);
    EXPECT_EQ(sink.sent[0].second.text, "hello");
}
