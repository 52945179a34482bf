#include <gtest/gtest.h>

#include "minstrel/audio/player_state_machine.hpp"
#include "fakes.hpp"

using namespace minstrel;
using audio::player_status;
using std::chrono::seconds;

class PlayerStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        strand->bind(owner);
        machine = std::make_unique<audio::player_state_machine>(
            std::make_unique<fakes::fake_engine>(probe), strand, timers, seconds(30));
        machine->set_advance_handler([this] { ++advances; });
        machine->set_idle_timeout_handler([this] { ++idle_timeouts; });
        machine->attach();
    }

    std::shared_ptr<audio::track> play(const std::string& title) {
        auto t = fakes::make_track(title, log);
        machine->play(t, t->produce_resource());
        return t;
    }

    std::shared_ptr<int>                 owner  = std::make_shared<int>(0);
    std::shared_ptr<audio::event_strand> strand = std::make_shared<audio::event_strand>();
    fakes::manual_scheduler              timers;
    std::shared_ptr<fakes::engine_probe> probe = std::make_shared<fakes::engine_probe>();
    std::shared_ptr<fakes::event_log>    log   = std::make_shared<fakes::event_log>();
    std::unique_ptr<audio::player_state_machine> machine;
    int advances      = 0;
    int idle_timeouts = 0;
};

TEST_F(PlayerStateMachineTest, PlayLeavesIdleImmediately) {
    auto t = play("A");

    EXPECT_EQ(machine->status(), player_status::buffering);
    EXPECT_EQ(machine->current_track(), t);
    ASSERT_EQ(probe->played.size(), 1u);
    EXPECT_EQ(probe->played[0], "A");
}

TEST_F(PlayerStateMachineTest, OnStartFiresOncePerAttempt) {
    play("A");
    probe->emit(player_status::playing);
    probe->emit(player_status::auto_paused);
    probe->emit(player_status::playing);

    EXPECT_EQ(fakes::count_events(*log, "start:A"), 1u);
}

TEST_F(PlayerStateMachineTest, IdleFinishesTheTrackAndAdvances) {
    play("A");
    probe->emit(player_status::playing);
    probe->emit(player_status::idle);

    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 1u);
    EXPECT_EQ(advances, 1);
    EXPECT_EQ(machine->current_track(), nullptr);
}

TEST_F(PlayerStateMachineTest, ErroredTrackDoesNotFinish) {
    auto t = play("A");
    probe->emit(player_status::playing);
    probe->fail("stream broke");

    EXPECT_TRUE(t->errored());
    EXPECT_EQ(fakes::count_events(*log, "error:A"), 1u);

    probe->emit(player_status::idle);
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 0u);
    EXPECT_EQ(advances, 1);
}

TEST_F(PlayerStateMachineTest, SuppressedAdvanceSkipsTheHandler) {
    machine->suppress_auto_advance(true);
    play("A");
    probe->emit(player_status::playing);
    probe->emit(player_status::idle);

    EXPECT_EQ(advances, 0);
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 1u);
}

TEST_F(PlayerStateMachineTest, IdleWithoutATrackIsHarmless) {
    probe->emit(player_status::buffering);
    probe->emit(player_status::idle);

    EXPECT_TRUE(log->empty());
    EXPECT_EQ(advances, 1);
}

TEST_F(PlayerStateMachineTest, IdleGuardFiresAfterTimeout) {
    play("A");
    probe->emit(player_status::playing);
    probe->emit(player_status::idle);

    timers.advance(seconds(29));
    EXPECT_EQ(idle_timeouts, 0);

    timers.advance(seconds(1));
    EXPECT_EQ(idle_timeouts, 1);
}

TEST_F(PlayerStateMachineTest, IdleGuardRunsWhileTheNextTrackBuffers) {
    machine->set_advance_handler([this] {
        if (++advances == 1) {
            play("B");
        }
    });
    play("A");
    probe->emit(player_status::playing);
    probe->emit(player_status::idle);
    ASSERT_EQ(machine->status(), player_status::buffering);

    timers.advance(seconds(29));
    EXPECT_EQ(idle_timeouts, 0);

    timers.advance(seconds(1));
    EXPECT_EQ(idle_timeouts, 1);
}

TEST_F(PlayerStateMachineTest, LateEventForAReplacedAttemptIsDropped) {
    play("A");
    probe->emit(player_status::playing);

    auto b = play("B");
    ASSERT_EQ(probe->status, player_status::buffering);

    // Idle observed for A, delivered after B was handed over.
    probe->deliver_late(player_status::playing, player_status::idle);

    EXPECT_EQ(machine->current_track(), b);
    EXPECT_EQ(machine->status(), player_status::buffering);
    EXPECT_EQ(fakes::count_events(*log, "finish:B"), 0u);
    EXPECT_EQ(advances, 0);
}

TEST_F(PlayerStateMachineTest, PlayingCancelsTheIdleGuard) {
    play("A");
    probe->emit(player_status::playing);
    probe->emit(player_status::idle);
    timers.advance(seconds(20));

    play("B");
    probe->emit(player_status::playing);
    timers.advance(seconds(60));

    EXPECT_EQ(idle_timeouts, 0);
    EXPECT_EQ(fakes::count_events(*log, "start:B"), 1u);
}

TEST_F(PlayerStateMachineTest, PauseAndResume) {
    play("A");
    probe->emit(player_status::playing);

    EXPECT_TRUE(machine->pause());
    EXPECT_EQ(machine->status(), player_status::paused);
    EXPECT_FALSE(machine->pause());

    EXPECT_TRUE(machine->resume());
    EXPECT_EQ(machine->status(), player_status::playing);
    EXPECT_EQ(fakes::count_events(*log, "start:A"), 1u);
}

TEST_F(PlayerStateMachineTest, StopForcesIdle) {
    play("A");
    probe->emit(player_status::playing);

    EXPECT_TRUE(machine->stop(true));
    EXPECT_EQ(machine->status(), player_status::idle);
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 1u);
    EXPECT_EQ(advances, 1);
}

TEST_F(PlayerStateMachineTest, ShutdownSilencesTheMachine) {
    play("A");
    probe->emit(player_status::playing);

    machine->shutdown();
    EXPECT_EQ(probe->stops, 1);
    EXPECT_EQ(machine->current_track(), nullptr);

    timers.advance(seconds(60));
    EXPECT_EQ(fakes::count_events(*log, "finish:A"), 0u);
    EXPECT_EQ(advances, 0);
    EXPECT_EQ(idle_timeouts, 0);

    play("B");
    EXPECT_EQ(probe->played.size(), 1u);
}
