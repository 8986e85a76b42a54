/**
 * @file event_bus_test.cpp
 * @brief Unit tests for the typed event channels
 */

#include "peerdrop/TransferEventBus.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace PeerDrop;

TEST(EventChannelTest, PublishWithoutHandlerIsDropped)
{
    EventChannel<PeerDisconnectedEvent> channel;
    EXPECT_FALSE(channel.isConnected());
    EXPECT_FALSE(channel.publish(PeerDisconnectedEvent{"peer_1", "One"}));
}

TEST(EventChannelTest, HandlerReceivesEvent)
{
    EventChannel<PeerDisconnectedEvent> channel;
    std::vector<std::string> seen;
    channel.connect([&](const PeerDisconnectedEvent& e) { seen.push_back(e.peerId); });

    EXPECT_TRUE(channel.publish(PeerDisconnectedEvent{"peer_1", "One"}));
    EXPECT_TRUE(channel.publish(PeerDisconnectedEvent{"peer_2", "Two"}));
    EXPECT_EQ(seen, std::vector<std::string>({"peer_1", "peer_2"}));
}

TEST(EventChannelTest, ConnectReplacesPreviousHandler)
{
    EventChannel<PeerDisconnectedEvent> channel;
    int first = 0;
    int second = 0;
    channel.connect([&](const PeerDisconnectedEvent&) { ++first; });
    channel.connect([&](const PeerDisconnectedEvent&) { ++second; });

    channel.publish(PeerDisconnectedEvent{});
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(EventChannelTest, HandlerMayDisconnectItself)
{
    EventChannel<PeerDisconnectedEvent> channel;
    int calls = 0;
    channel.connect([&](const PeerDisconnectedEvent&) {
        ++calls;
        channel.disconnect();
    });

    EXPECT_TRUE(channel.publish(PeerDisconnectedEvent{}));
    EXPECT_FALSE(channel.publish(PeerDisconnectedEvent{}));
    EXPECT_EQ(calls, 1);
}

TEST(TransferEventBusTest, DisconnectAllClearsEveryChannel)
{
    TransferEventBus bus;
    bus.peerConnected().connect([](const PeerConnectedEvent&) {});
    bus.peerDisconnected().connect([](const PeerDisconnectedEvent&) {});
    bus.fileReceived().connect([](const FileReceivedEvent&) {});
    bus.transferProgress().connect([](const TransferProgressEvent&) {});

    bus.disconnectAll();

    EXPECT_FALSE(bus.peerConnected().isConnected());
    EXPECT_FALSE(bus.peerDisconnected().isConnected());
    EXPECT_FALSE(bus.fileReceived().isConnected());
    EXPECT_FALSE(bus.transferProgress().isConnected());
}

TEST(TransferEventBusTest, ProgressPercentage)
{
    TransferProgressEvent e;
    e.bytesTransferred = 16384;
    e.totalBytes = 65536;
    EXPECT_DOUBLE_EQ(e.percentage(), 25.0);

    e.bytesTransferred = 0;
    e.totalBytes = 0;
    EXPECT_DOUBLE_EQ(e.percentage(), 100.0);
}
