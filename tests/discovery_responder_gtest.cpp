// GoogleTest unit tests for the discovery reply handler
#include "beaconpp/DiscoveryReply.hpp"
#include "beaconpp/DiscoveryResponder.hpp"
#include "beaconpp/SocketInitializer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using namespace beaconpp;
using namespace beaconpp::test_support;

namespace
{

class DiscoveryResponderTest : public ::testing::Test
{
  protected:
    void SetUp() override { sender->attach(outbound); }

    DiscoveryResponder makeResponder(std::optional<std::string> url)
    {
        host = std::make_shared<FakeServerHost>(std::move(url), "f4c1d2", "Living Room");
        return DiscoveryResponder(host, sender, logger);
    }

    std::string receiverEndpoint() const { return formatEndpoint("127.0.0.1", receiver.getLocalPort()); }

    SocketInitializer init;
    std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
    std::shared_ptr<ReplySender> sender = std::make_shared<ReplySender>(logger);
    std::shared_ptr<DatagramSocket> outbound = std::make_shared<DatagramSocket>(0, "127.0.0.1");
    std::shared_ptr<FakeServerHost> host;
    DatagramSocket receiver{0, "127.0.0.1"};
};

} // namespace

TEST_F(DiscoveryResponderTest, RepliesWithJsonDescription)
{
    const auto responder = makeResponder("http://192.0.2.5:8096");
    responder("who is EmbyServer?", receiverEndpoint(), TextEncoding::Utf8);

    const auto packet = receiveWithin(receiver);
    ASSERT_TRUE(packet.has_value());
    const auto json = nlohmann::json::parse(decodeText(packet->bytes(), TextEncoding::Utf8));
    EXPECT_EQ(json.at("Address"), "http://192.0.2.5:8096");
    EXPECT_EQ(json.at("Id"), "f4c1d2");
    EXPECT_EQ(json.at("Name"), "Living Room");
    EXPECT_TRUE(host->loopbackRequests().empty());
}

TEST_F(DiscoveryResponderTest, ReplyUsesProbeEncoding)
{
    const auto responder = makeResponder("http://192.0.2.5:8096");
    responder("who is EmbyServer?", receiverEndpoint(), TextEncoding::Utf16LE);

    const auto packet = receiveWithin(receiver);
    ASSERT_TRUE(packet.has_value());
    const auto reply = parseDiscoveryReply(decodeText(packet->bytes(), TextEncoding::Utf16LE));
    EXPECT_EQ(reply, (DiscoveryReply{"http://192.0.2.5:8096", "f4c1d2", "Living Room"}));
}

TEST_F(DiscoveryResponderTest, PipeArgumentEnablesLoopback)
{
    const auto responder = makeResponder("http://192.0.2.5:8096");
    responder("who is EmbyServer?|192.0.2.10", receiverEndpoint(), TextEncoding::Utf8);

    EXPECT_TRUE(receiveWithin(receiver).has_value());
    EXPECT_EQ(host->loopbackRequests(), std::vector<std::string>{"192.0.2.10"});
}

TEST_F(DiscoveryResponderTest, OnlySecondSegmentIsUsed)
{
    const auto responder = makeResponder("http://192.0.2.5:8096");
    responder("who is EmbyServer?|192.0.2.10|extra", receiverEndpoint(), TextEncoding::Utf8);
    responder("who is EmbyServer?|", receiverEndpoint(), TextEncoding::Utf8);

    EXPECT_EQ(host->loopbackRequests(), (std::vector<std::string>{"192.0.2.10", ""}));
}

TEST_F(DiscoveryResponderTest, UnknownAddressWarnsAndStaysSilent)
{
    for (const auto& url : {std::optional<std::string>{}, std::optional<std::string>{""}})
    {
        const auto responder = makeResponder(url);
        responder("who is EmbyServer?|192.0.2.10", receiverEndpoint(), TextEncoding::Utf8);

        EXPECT_EQ(host->loopbackRequests(), std::vector<std::string>{"192.0.2.10"});
    }

    EXPECT_FALSE(receiver.hasPendingData(200));
    EXPECT_EQ(logger->count(LogLevel::Warn), 2u);
    EXPECT_TRUE(logger->contains(LogLevel::Warn, "local ip address could not be determined"));
}

TEST_F(DiscoveryResponderTest, SendFailureIsLogged)
{
    const auto responder = makeResponder("http://192.0.2.5:8096");
    outbound->close();

    EXPECT_NO_THROW(responder("who is EmbyServer?", receiverEndpoint(), TextEncoding::Utf8));
    EXPECT_TRUE(logger->contains(LogLevel::Error, "Error sending message to"));
}

TEST(DiscoveryResponderArgsTest, RejectsNullCollaborators)
{
    auto logger = std::make_shared<RecordingLogger>();
    auto sender = std::make_shared<ReplySender>(logger);
    auto host = std::make_shared<FakeServerHost>("http://x", "id", "name");
    EXPECT_THROW(DiscoveryResponder(nullptr, sender, logger), std::invalid_argument);
    EXPECT_THROW(DiscoveryResponder(host, nullptr, logger), std::invalid_argument);
    EXPECT_THROW(DiscoveryResponder(host, sender, nullptr), std::invalid_argument);
}

TEST(DiscoveryReplyTest, SerializesWithWireKeys)
{
    const DiscoveryReply reply{"http://192.0.2.5:8096", "f4c1d2", "Living \"Room\""};
    const auto json = nlohmann::json::parse(serializeToString(reply));
    EXPECT_EQ(json.size(), 3u);
    EXPECT_EQ(json.at("Address"), reply.address);
    EXPECT_EQ(json.at("Id"), reply.id);
    EXPECT_EQ(json.at("Name"), reply.name);
    EXPECT_EQ(parseDiscoveryReply(serializeToString(reply)), reply);
}

TEST(DiscoveryReplyTest, ParseRejectsIncompleteObjects)
{
    EXPECT_THROW(parseDiscoveryReply(R"({"Address":"a","Id":"b"})"), nlohmann::json::exception);
    EXPECT_THROW(parseDiscoveryReply("not json"), nlohmann::json::exception);
}
