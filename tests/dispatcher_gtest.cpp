// GoogleTest unit tests for datagram dispatch
#include "beaconpp/Dispatcher.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace beaconpp;
using namespace beaconpp::test_support;

namespace
{

struct Call
{
    std::string responder;
    std::string text;
    std::string endpoint;
    TextEncoding encoding;
};

class DispatcherTest : public ::testing::Test
{
  protected:
    ResponderHandler recorder(const std::string& name)
    {
        return [this, name](const std::string& text, const std::string& endpoint, const TextEncoding encoding)
        { calls.push_back(Call{name, text, endpoint, encoding}); };
    }

    Dispatcher makeDispatcher(const std::shared_ptr<ResponderRegistry>& registry)
    {
        return Dispatcher(registry, logger, inlineExecutor());
    }

    std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
    std::vector<Call> calls;
};

} // namespace

TEST_F(DispatcherTest, Utf8MatchIsPreferred)
{
    // {'a','b'} reads "ab" as UTF-8 and U+6261 as UTF-16LE.
    auto registry = std::make_shared<ResponderRegistry>();
    registry->add("\xE6\x89\xA1", MatchKind::Exact, recorder("utf16-pattern"));
    registry->add("ab", MatchKind::Exact, recorder("utf8-pattern"));
    const auto dispatcher = makeDispatcher(registry);

    EXPECT_TRUE(dispatcher.dispatch(InboundMessage{bytesOf("ab"), "192.0.2.1:5000"}));

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].responder, "utf8-pattern");
    EXPECT_EQ(calls[0].encoding, TextEncoding::Utf8);
}

TEST_F(DispatcherTest, FallsBackToUtf16)
{
    auto registry = std::make_shared<ResponderRegistry>();
    registry->add(std::string(DiscoveryPhrase), MatchKind::Substring, recorder("discovery"));
    const auto dispatcher = makeDispatcher(registry);

    const auto bytes = bytesOf("who is EmbyServer?", TextEncoding::Utf16LE);
    EXPECT_TRUE(dispatcher.dispatch(InboundMessage{bytes, "192.0.2.1:5000"}));

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].text, "who is EmbyServer?");
    EXPECT_EQ(calls[0].endpoint, "192.0.2.1:5000");
    EXPECT_EQ(calls[0].encoding, TextEncoding::Utf16LE);
}

TEST_F(DispatcherTest, SelectIsPure)
{
    auto registry = std::make_shared<ResponderRegistry>();
    registry->add("hello", MatchKind::Substring, recorder("hello"));
    const auto dispatcher = makeDispatcher(registry);

    const auto selection = dispatcher.select(bytesOf("HELLO", TextEncoding::Utf16LE));
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->encoding, TextEncoding::Utf16LE);
    EXPECT_EQ(selection->match.matchedText, "HELLO");
    EXPECT_TRUE(calls.empty());
}

TEST_F(DispatcherTest, NoMatchIsDroppedSilently)
{
    auto registry = std::make_shared<ResponderRegistry>();
    registry->add(std::string(DiscoveryPhrase), MatchKind::Substring, recorder("discovery"));
    const auto dispatcher = makeDispatcher(registry);

    EXPECT_FALSE(dispatcher.dispatch(InboundMessage{bytesOf("hello?"), "192.0.2.1:5000"}));
    EXPECT_FALSE(dispatcher.dispatch(InboundMessage{{}, "192.0.2.1:5000"}));

    EXPECT_TRUE(calls.empty());
    EXPECT_TRUE(logger->entries().empty());
}

TEST_F(DispatcherTest, HandlerFailureIsLoggedNotPropagated)
{
    auto registry = std::make_shared<ResponderRegistry>();
    registry->add("boom", MatchKind::Substring,
                  [](const std::string&, const std::string&, TextEncoding) { throw std::runtime_error("kaput"); });
    const auto dispatcher = makeDispatcher(registry);

    EXPECT_NO_THROW(dispatcher.dispatch(InboundMessage{bytesOf("boom"), "192.0.2.1:5000"}));

    const auto entries = logger->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Error);
    EXPECT_NE(entries[0].message.find("192.0.2.1:5000"), std::string::npos);
    EXPECT_NE(entries[0].exception.find("kaput"), std::string::npos);
}

TEST_F(DispatcherTest, DefaultExecutorRunsHandlerOnAnotherThread)
{
    auto registry = std::make_shared<ResponderRegistry>();
    const auto caller = std::this_thread::get_id();
    auto handlerThread = std::make_shared<std::thread::id>();
    auto sink = logger;
    registry->add("ping", MatchKind::Exact,
                  [handlerThread, sink](const std::string&, const std::string&, TextEncoding)
                  {
                      *handlerThread = std::this_thread::get_id();
                      sink->info("ran");
                  });
    const Dispatcher dispatcher(registry, logger);

    EXPECT_TRUE(dispatcher.dispatch(InboundMessage{bytesOf("ping"), "192.0.2.1:5000"}));
    ASSERT_TRUE(logger->waitFor(LogLevel::Info, "ran"));
    EXPECT_NE(*handlerThread, caller);
}

TEST_F(DispatcherTest, RejectsMissingCollaborators)
{
    auto registry = std::make_shared<ResponderRegistry>();
    EXPECT_THROW(Dispatcher(nullptr, logger), std::invalid_argument);
    EXPECT_THROW(Dispatcher(registry, nullptr), std::invalid_argument);
    EXPECT_THROW(Dispatcher(registry, logger, Executor{}), std::invalid_argument);
}
