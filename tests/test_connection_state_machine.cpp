#include <gtest/gtest.h>

#include "minstrel/audio/connection_state_machine.hpp"
#include "fakes.hpp"

using namespace minstrel;
using audio::connection_status;
using audio::destroy_cause;
using audio::disconnect_reason;
using std::chrono::seconds;

class ConnectionStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        strand->bind(owner);
        machine = std::make_unique<audio::connection_state_machine>(
            std::make_unique<fakes::fake_connection>(probe), strand, timers, policy);
        machine->set_destroyed_handler([this](destroy_cause cause) { causes.push_back(cause); });
        machine->attach();
    }

    void join() {
        machine->join(audio::join_target{ 1, 100 });
    }

    std::shared_ptr<int>                 owner  = std::make_shared<int>(0);
    std::shared_ptr<audio::event_strand> strand = std::make_shared<audio::event_strand>();
    fakes::manual_scheduler              timers;
    std::shared_ptr<fakes::connection_probe> probe = std::make_shared<fakes::connection_probe>();
    audio::connection_policy             policy;
    std::unique_ptr<audio::connection_state_machine> machine;
    std::vector<destroy_cause>           causes;
};

TEST_F(ConnectionStateMachineTest, JoinSignalsTheTransport) {
    join();

    EXPECT_EQ(probe->joins, 1);
    EXPECT_EQ(probe->last_target.channel_id, 100u);
    EXPECT_EQ(machine->status(), connection_status::signalling);
}

TEST_F(ConnectionStateMachineTest, ReadyGuardDestroysHalfOpenConnection) {
    join();

    timers.advance(seconds(14));
    EXPECT_FALSE(machine->destroyed());

    timers.advance(seconds(1));
    EXPECT_TRUE(machine->destroyed());
    ASSERT_EQ(causes.size(), 1u);
    EXPECT_EQ(causes[0], destroy_cause::ready_timeout);
    EXPECT_EQ(probe->destroys, 1);
}

TEST_F(ConnectionStateMachineTest, ReadyCancelsTheGuard) {
    join();
    probe->emit(connection_status::connecting);
    probe->emit(connection_status::ready);

    EXPECT_EQ(timers.pending(), 0u);
    timers.advance(seconds(60));
    EXPECT_FALSE(machine->destroyed());
    EXPECT_EQ(machine->status(), connection_status::ready);
}

TEST_F(ConnectionStateMachineTest, GuardIsNotRearmedWhileArmed) {
    join();
    timers.advance(seconds(10));

    probe->emit(connection_status::connecting);
    EXPECT_EQ(timers.pending(), 1u);

    timers.advance(seconds(5));
    EXPECT_TRUE(machine->destroyed());
    EXPECT_EQ(machine->cause(), destroy_cause::ready_timeout);
}

TEST_F(ConnectionStateMachineTest, RejoinUsesLinearBackoff) {
    probe->emit(connection_status::ready);

    probe->disconnect(disconnect_reason::endpoint_removed);
    timers.advance(seconds(4));
    EXPECT_EQ(probe->rejoins, 0);
    timers.advance(seconds(1));
    EXPECT_EQ(probe->rejoins, 1);
    EXPECT_EQ(machine->rejoin_attempts(), 1u);

    probe->disconnect(disconnect_reason::endpoint_removed);
    timers.advance(seconds(9));
    EXPECT_EQ(probe->rejoins, 1);
    timers.advance(seconds(1));
    EXPECT_EQ(probe->rejoins, 2);
}

TEST_F(ConnectionStateMachineTest, ReadyResetsTheRejoinCounter) {
    probe->disconnect(disconnect_reason::adapter_unavailable);
    timers.advance(seconds(5));
    probe->disconnect(disconnect_reason::adapter_unavailable);
    timers.advance(seconds(10));
    EXPECT_EQ(machine->rejoin_attempts(), 2u);

    probe->emit(connection_status::ready);
    EXPECT_EQ(machine->rejoin_attempts(), 0u);

    // The next loss starts again from the shortest wait.
    probe->disconnect(disconnect_reason::adapter_unavailable);
    timers.advance(seconds(5));
    EXPECT_EQ(probe->rejoins, 3);
}

TEST_F(ConnectionStateMachineTest, DestroysOnTheFifthFailedRejoin) {
    probe->emit(connection_status::ready);

    for (int attempt = 0; attempt < 5; ++attempt) {
        probe->disconnect(disconnect_reason::websocket_close, 1006);
        timers.advance(seconds(5 * (attempt + 1)));
        EXPECT_EQ(probe->rejoins, attempt + 1);
        EXPECT_FALSE(machine->destroyed());
    }

    probe->disconnect(disconnect_reason::websocket_close, 1006);
    EXPECT_TRUE(machine->destroyed());
    EXPECT_EQ(probe->rejoins, 5);
    ASSERT_EQ(causes.size(), 1u);
    EXPECT_EQ(causes[0], destroy_cause::rejoin_exhausted);
}

TEST_F(ConnectionStateMachineTest, MovedConnectionRecoversThroughConnecting) {
    probe->emit(connection_status::ready);

    probe->disconnect(disconnect_reason::websocket_close, audio::close_code_moved_or_kicked);
    timers.advance(seconds(3));
    probe->emit(connection_status::connecting);
    timers.advance(seconds(5));
    EXPECT_FALSE(machine->destroyed());

    probe->emit(connection_status::ready);
    EXPECT_EQ(machine->status(), connection_status::ready);
    EXPECT_EQ(probe->rejoins, 0);
    EXPECT_TRUE(causes.empty());
}

TEST_F(ConnectionStateMachineTest, KickedConnectionIsDestroyedAfterTheWindow) {
    probe->emit(connection_status::ready);

    probe->disconnect(disconnect_reason::websocket_close, audio::close_code_moved_or_kicked);
    timers.advance(seconds(4));
    EXPECT_FALSE(machine->destroyed());

    timers.advance(seconds(1));
    EXPECT_TRUE(machine->destroyed());
    EXPECT_EQ(machine->cause(), destroy_cause::kicked);
    EXPECT_EQ(probe->rejoins, 0);
}

TEST_F(ConnectionStateMachineTest, DestroyIsIdempotent) {
    probe->emit(connection_status::ready);

    machine->destroy();
    machine->destroy(destroy_cause::idle_timeout);

    EXPECT_EQ(machine->status(), connection_status::destroyed);
    ASSERT_EQ(causes.size(), 1u);
    EXPECT_EQ(causes[0], destroy_cause::requested);
    EXPECT_EQ(probe->destroys, 1);

    join();
    EXPECT_EQ(probe->joins, 0);
}

TEST_F(ConnectionStateMachineTest, TransportDestructionIsReportedOnce) {
    probe->emit(connection_status::ready);

    probe->emit(connection_status::destroyed);
    probe->emit(connection_status::destroyed);

    ASSERT_EQ(causes.size(), 1u);
    EXPECT_EQ(causes[0], destroy_cause::transport);
    EXPECT_EQ(probe->destroys, 0);
}

TEST_F(ConnectionStateMachineTest, AwaitReadyReportsTimeoutWithoutThrowing) {
    join();
    EXPECT_FALSE(machine->await_ready(std::chrono::milliseconds(10)));
}

TEST_F(ConnectionStateMachineTest, AwaitReadySucceedsOnceReady) {
    join();
    probe->emit(connection_status::ready);
    EXPECT_TRUE(machine->await_ready(std::chrono::milliseconds(0)));
}

TEST_F(ConnectionStateMachineTest, AwaitReadyFailsAfterDestruction) {
    probe->emit(connection_status::ready);
    machine->destroy();
    EXPECT_FALSE(machine->await_ready(std::chrono::milliseconds(0)));
}
