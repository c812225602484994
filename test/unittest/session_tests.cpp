#include "fake_transport.h"
#include <gtest/gtest.h>
#include <session/session.h>

#include <fmt/core.h>

#include <limits>
#include <memory>

using dapc::Command;
using dapc::ErrorCode;
using dapc::SessionState;
using dapc::Value;

static constexpr Milliseconds kNoWait{ 0 };

class SessionTest : public ::testing::Test
{
protected:
  FakeTransport *mTransport;
  dapc::Session mSession;

  SessionTest() : mTransport(new FakeTransport{}), mSession(std::unique_ptr<dapc::AdapterTransport>{ mTransport }, Milliseconds{ 1 })
  {
  }

  void
  QueueAll()
  {
    while (!mTransport->mIncoming.empty()) {
      ASSERT_TRUE(mSession.QueueMessages(kNoWait).has_value());
    }
  }

  // Initialize with an adapter that declares `body`
  void
  Initialize(Value body)
  {
    const auto seq = mSession.SendInitRequest(dapc::InitializeRequestArguments{ .mAdapterId = "fake" });
    ASSERT_TRUE(seq.has_value());
    mTransport->Push(MakeResponse(*seq, "initialize", true, std::move(body)));
    QueueAll();
    ASSERT_TRUE(mSession.HandleInitResponse(*seq).has_value());
  }

  void
  Launch()
  {
    const auto seq = mSession.SendLaunchRequest(dapc::LaunchRequestArguments{});
    ASSERT_TRUE(seq.has_value());
    mTransport->Push(MakeResponse(*seq, "launch"));
    QueueAll();
    ASSERT_TRUE(mSession.HandleLaunchResponse(*seq).has_value());
    ASSERT_EQ(mSession.State(), SessionState::Launched);
  }
};

TEST_F(SessionTest, SeqsAreHandedOutInOrderStartingAtOne)
{
  constexpr auto N = 5;
  for (auto i = 1; i <= N; ++i) {
    const auto seq = mSession.SendThreadsRequest();
    ASSERT_TRUE(seq.has_value());
    EXPECT_EQ(*seq, i);
  }
  ASSERT_EQ(mTransport->mWritten.size(), N);
  for (auto i = 0; i < N; ++i) {
    const auto message = mTransport->WrittenMessage(i);
    EXPECT_EQ(message["seq"], i + 1);
    EXPECT_EQ(message["type"], "request");
    EXPECT_EQ(message["command"], "threads");
  }
  EXPECT_EQ(mSession.SentRequests().size(), N);
}

TEST_F(SessionTest, WrittenFrameHasContentLengthOfBody)
{
  ASSERT_TRUE(mSession.SendThreadsRequest().has_value());
  const auto &frame = mTransport->mWritten.front();
  const auto headerEnd = frame.find("\r\n\r\n");
  ASSERT_NE(headerEnd, std::string::npos);
  const auto body = frame.substr(headerEnd + 4);
  EXPECT_EQ(frame.substr(0, headerEnd), fmt::format("Content-Length: {}", body.size()));
}

TEST_F(SessionTest, InitResponseThatIsNotQueuedDoesNotExist)
{
  const auto seq = mSession.SendInitRequest(dapc::InitializeRequestArguments{ .mAdapterId = "fake" });
  ASSERT_TRUE(seq.has_value());
  const auto res = mSession.HandleInitResponse(*seq);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::ResponseDoesNotExist);
  EXPECT_TRUE(mSession.GetAdapterCapabilities().mSupport.Empty());
  EXPECT_FALSE(mSession.GetAdapterCapabilities().mExceptionBreakpointFilters.has_value());
}

TEST_F(SessionTest, ClientCapabilitiesComeFromInitializeArguments)
{
  const auto seq = mSession.SendInitRequest(dapc::InitializeRequestArguments{ .mAdapterId = "fake",
    .mSupportsVariableType = true,
    .mSupportsMemoryReferences = false,
    .mSupportsANSIStyling = true });
  ASSERT_TRUE(seq.has_value());
  const auto &caps = mSession.GetClientCapabilities();
  EXPECT_EQ(caps.Count(), 2);
  EXPECT_TRUE(caps.Contains(dapc::ClientCapability::SupportsVariableType));
  EXPECT_TRUE(caps.Contains(dapc::ClientCapability::SupportsANSIStyling));
  EXPECT_FALSE(caps.Contains(dapc::ClientCapability::SupportsMemoryReferences));

  const auto message = mTransport->WrittenMessage(0);
  EXPECT_EQ(message["arguments"]["adapterID"], "fake");
  EXPECT_EQ(message["arguments"]["supportsVariableType"], true);
}

TEST_F(SessionTest, AdapterCapabilitiesAndArraysComeFromInitializeResponse)
{
  Initialize(Value::parse(R"({
    "supportsConfigurationDoneRequest": true,
    "supportsTerminateRequest": false,
    "supportsStepBack": "yes",
    "completionTriggerCharacters": [".", "->"],
    "exceptionBreakpointFilters": [{"filter": "cpp_throw", "label": "C++: on throw", "default": false}],
    "supportedChecksumAlgorithms": ["MD5", "timestamp"],
    "breakpointModes": [{"mode": "hw", "label": "Hardware", "appliesTo": ["source", "somethingElse"]}]
  })"));

  const auto &caps = mSession.GetAdapterCapabilities();
  EXPECT_TRUE(caps.mSupport.Contains(dapc::AdapterCapability::SupportsConfigurationDoneRequest));
  EXPECT_FALSE(caps.mSupport.Contains(dapc::AdapterCapability::SupportsTerminateRequest));
  // Only booleans count
  EXPECT_FALSE(caps.mSupport.Contains(dapc::AdapterCapability::SupportsStepBack));
  EXPECT_EQ(caps.mSupport.Count(), 1);

  ASSERT_TRUE(caps.mCompletionTriggerCharacters.has_value());
  EXPECT_EQ(caps.mCompletionTriggerCharacters->size(), 2);
  EXPECT_EQ(caps.mCompletionTriggerCharacters->at(1), "->");

  ASSERT_TRUE(caps.mExceptionBreakpointFilters.has_value());
  ASSERT_EQ(caps.mExceptionBreakpointFilters->size(), 1);
  EXPECT_EQ(caps.mExceptionBreakpointFilters->front().mFilter, "cpp_throw");
  EXPECT_EQ(caps.mExceptionBreakpointFilters->front().mLabel, "C++: on throw");
  EXPECT_EQ(caps.mExceptionBreakpointFilters->front().mDefault, false);

  ASSERT_TRUE(caps.mSupportedChecksumAlgorithms.has_value());
  EXPECT_EQ(caps.mSupportedChecksumAlgorithms->at(0), dapc::ChecksumAlgorithm::MD5);
  EXPECT_EQ(caps.mSupportedChecksumAlgorithms->at(1), dapc::ChecksumAlgorithm::Timestamp);

  ASSERT_TRUE(caps.mBreakpointModes.has_value());
  const auto &appliesTo = caps.mBreakpointModes->front().mAppliesTo;
  ASSERT_EQ(appliesTo.size(), 2);
  EXPECT_EQ(std::get<dapc::BreakpointModeApplicability>(appliesTo[0]), dapc::BreakpointModeApplicability::Source);
  EXPECT_EQ(std::get<std::string_view>(appliesTo[1]), "somethingElse");

  EXPECT_FALSE(caps.mAdditionalModuleColumns.has_value());
}

TEST_F(SessionTest, BadCapabilityArrayLeavesCapabilitiesUntouched)
{
  const auto seq = mSession.SendInitRequest(dapc::InitializeRequestArguments{ .mAdapterId = "fake" });
  ASSERT_TRUE(seq.has_value());
  mTransport->Push(MakeResponse(*seq, "initialize", true,
    Value::parse(R"({"supportsConfigurationDoneRequest": true, "exceptionBreakpointFilters": [{"label": "x"}]})")));
  QueueAll();
  const auto res = mSession.HandleInitResponse(*seq);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::MissingField);
  EXPECT_TRUE(mSession.GetAdapterCapabilities().mSupport.Empty());
  // The envelope was fine, the body wasn't
  ASSERT_EQ(mSession.HandledResponses().size(), 1);
  EXPECT_FALSE(mSession.HandledResponses().back().mSuccess);
}

TEST_F(SessionTest, GoodInitializeResponseIsRecordedAsSuccess)
{
  Initialize(Value::parse(R"({"supportsConfigurationDoneRequest": true})"));
  ASSERT_EQ(mSession.HandledResponses().size(), 1);
  EXPECT_TRUE(mSession.HandledResponses().back().mSuccess);
}

TEST_F(SessionTest, ConfigurationDoneIsRefusedWithoutCapability)
{
  Initialize(Value::object());
  const auto written = mTransport->mWritten.size();
  const auto nextSeq = mSession.PeekSeq();

  const auto res = mSession.SendConfigurationDoneRequest();
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::AdapterDoesNotSupportConfigurationDone);
  EXPECT_EQ(mTransport->mWritten.size(), written);
  EXPECT_EQ(mSession.PeekSeq(), nextSeq);
}

TEST_F(SessionTest, InitializeThenConfigurationDone)
{
  const auto initSeq = mSession.SendInitRequest(dapc::InitializeRequestArguments{ .mAdapterId = "fake" });
  ASSERT_TRUE(initSeq.has_value());
  mTransport->Push(
    MakeResponse(*initSeq, "initialize", true, Value::parse(R"({"supportsConfigurationDoneRequest": true})")));
  ASSERT_TRUE(mSession.QueueMessages(kNoWait).has_value());
  ASSERT_TRUE(mSession.HandleInitResponse(*initSeq).has_value());

  const auto seq = mSession.SendConfigurationDoneRequest();
  ASSERT_TRUE(seq.has_value());
  ASSERT_EQ(mTransport->mWritten.size(), 2);
  EXPECT_TRUE(mTransport->mWritten.back().starts_with("Content-Length: "));
  const auto message = mTransport->WrittenMessage(1);
  EXPECT_EQ(message["command"], "configurationDone");
  EXPECT_EQ(message["seq"], *seq);
  EXPECT_TRUE(message["arguments"].is_object());
}

TEST_F(SessionTest, TerminateIsRefusedWithoutCapability)
{
  const auto res = mSession.SendTerminateRequest(dapc::TerminateArguments{});
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::AdapterDoesNotSupportTerminate);
  EXPECT_TRUE(mTransport->mWritten.empty());
}

TEST_F(SessionTest, GatedRequestIsRefusedWithGenericError)
{
  const auto res = mSession.SendRequest(Command::Modules, dapc::ThreadsArguments{});
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::AdapterDoesNotSupportRequest);
  EXPECT_TRUE(mTransport->mWritten.empty());

  Initialize(Value::parse(R"({"supportsModulesRequest": true})"));
  EXPECT_TRUE(mSession.SendRequest(Command::Modules, dapc::ThreadsArguments{}).has_value());
}

TEST_F(SessionTest, SetExceptionBreakpointsNeedsFilters)
{
  Initialize(Value::parse(R"({"exceptionBreakpointFilters": []})"));
  auto res = mSession.SendRequest(Command::SetExceptionBreakpoints, dapc::ThreadsArguments{});
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::AdapterDoesNotSupportRequest);
}

TEST_F(SessionTest, ExtraFieldsAreMergedIntoArguments)
{
  Value extra = Value::object();
  extra["program"] = "/usr/bin/true";
  extra["noDebug"] = true;
  const auto seq = mSession.SendLaunchRequest(dapc::LaunchRequestArguments{ .mNoDebug = false }, extra);
  ASSERT_TRUE(seq.has_value());
  const auto message = mTransport->WrittenMessage(0);
  EXPECT_EQ(message["arguments"]["program"], "/usr/bin/true");
  // Extra fields overwrite typed ones
  EXPECT_EQ(message["arguments"]["noDebug"], true);
  EXPECT_TRUE(message["arguments"]["__restart"].is_null());
}

TEST_F(SessionTest, LaunchResponseMovesToLaunched)
{
  EXPECT_EQ(mSession.State(), SessionState::NotStarted);
  Launch();
  EXPECT_EQ(mSession.State(), SessionState::Launched);
  EXPECT_TRUE(mSession.PendingResponses().empty());
  ASSERT_EQ(mSession.HandledResponses().size(), 1);
  EXPECT_TRUE(mSession.HandledResponses().front().mSuccess);
}

TEST_F(SessionTest, FailedResponseIsHandledAndReported)
{
  const auto seq = mSession.SendThreadsRequest();
  ASSERT_TRUE(seq.has_value());
  auto response = MakeResponse(*seq, "threads", false);
  response["message"] = "not stopped";
  mTransport->Push(std::move(response));
  QueueAll();

  const auto res = mSession.AcknowledgeResponse(*seq, Command::Threads);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::RequestFailed);
  EXPECT_TRUE(mSession.PendingResponses().empty());
  ASSERT_EQ(mSession.HandledResponses().size(), 1);
  EXPECT_FALSE(mSession.HandledResponses().front().mSuccess);
}

TEST_F(SessionTest, ResponseForWrongCommandIsRejected)
{
  const auto seq = mSession.SendThreadsRequest();
  ASSERT_TRUE(seq.has_value());
  mTransport->Push(MakeResponse(*seq, "stackTrace"));
  QueueAll();
  const auto res = mSession.AcknowledgeResponse(*seq, Command::Threads);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::WrongCommandForResponse);
}

TEST_F(SessionTest, NonIntegerRequestSeqIsInvalid)
{
  auto response = MakeResponse(1, "threads");
  response["request_seq"] = "1";
  mTransport->Push(std::move(response));
  QueueAll();
  const auto res = mSession.AcknowledgeResponse(1, Command::Threads);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::InvalidSeqFromAdapter);
}

TEST_F(SessionTest, ResponseWithNonIntegerSeqDoesNotBlockOthers)
{
  const auto seq = mSession.SendThreadsRequest();
  ASSERT_TRUE(seq.has_value());
  auto bad = MakeResponse(*seq, "threads");
  bad["request_seq"] = Value::parse(R"({"seq": 1})");
  mTransport->Push(std::move(bad));
  mTransport->Push(MakeResponse(*seq, "threads"));
  QueueAll();
  ASSERT_EQ(mSession.PendingResponses().size(), 2);

  const auto first = mSession.HasResponse(*seq);
  ASSERT_FALSE(first.has_value());
  EXPECT_EQ(first.error().mCode, ErrorCode::InvalidSeqFromAdapter);
  ASSERT_EQ(mSession.HandledResponses().size(), 1);
  EXPECT_FALSE(mSession.HandledResponses().back().mSuccess);
  EXPECT_EQ(mSession.PendingResponses().size(), 1);

  ASSERT_TRUE(mSession.WaitForResponse(*seq).has_value());
  const auto res = mSession.AcknowledgeResponse(*seq, Command::Threads);
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE((*res)->mSuccess);
  EXPECT_TRUE(mSession.PendingResponses().empty());
}

TEST_F(SessionTest, QueueSortsResponsesAndEvents)
{
  mTransport->Push(MakeEvent(1, "output", Value::parse(R"({"output": "hi"})")));
  mTransport->Push(MakeResponse(1, "threads"));
  mTransport->Push(MakeEvent(2, "stopped", Value::parse(R"({"reason": "step"})")));
  QueueAll();
  EXPECT_EQ(mSession.PendingEvents().size(), 2);
  EXPECT_EQ(mSession.PendingResponses().size(), 1);
  EXPECT_EQ(mSession.EventsReceived(), 2);
  EXPECT_EQ(mSession.ResponsesReceived(), 1);
}

TEST_F(SessionTest, QueueWithNothingAvailableIsNotAnError)
{
  EXPECT_TRUE(mSession.QueueMessages(kNoWait).has_value());
  EXPECT_TRUE(mSession.PendingEvents().empty());
}

TEST_F(SessionTest, MalformedMessagesAreRejected)
{
  mTransport->Push(Value::array());
  auto res = mSession.QueueMessages(kNoWait);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::InvalidMessage);

  mTransport->Push(Value::parse(R"({"seq": 1, "type": 7})"));
  res = mSession.QueueMessages(kNoWait);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::InvalidMessage);

  mTransport->Push(Value::parse(R"({"seq": 1})"));
  res = mSession.QueueMessages(kNoWait);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::InvalidMessage);

  mTransport->Push(Value::parse(R"({"seq": 1, "type": "request", "command": "runInTerminal"})"));
  res = mSession.QueueMessages(kNoWait);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::UnknownMessage);

  EXPECT_TRUE(mSession.PendingEvents().empty());
  EXPECT_TRUE(mSession.PendingResponses().empty());
}

TEST_F(SessionTest, EndOfStreamIsTerminal)
{
  Launch();
  mTransport->mDead = true;
  auto res = mSession.QueueMessages(kNoWait);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::EndOfStream);
  EXPECT_TRUE(mSession.AdapterDied());
  EXPECT_EQ(mSession.State(), SessionState::Terminated);

  // Not retried, even if the transport had more to say
  mTransport->mDead = false;
  mTransport->Push(MakeEvent(1, "output"));
  res = mSession.QueueMessages(kNoWait);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::EndOfStream);
  EXPECT_EQ(mTransport->mIncoming.size(), 1);
}

TEST_F(SessionTest, NamedEventsAreHandledOldestFirst)
{
  mTransport->Push(MakeEvent(10, "stopped"));
  mTransport->Push(MakeEvent(11, "stopped"));
  QueueAll();

  auto event = mSession.AcknowledgeEvent("stopped");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ((*event)->mMessage["seq"], 10);
  EXPECT_EQ(mSession.PendingEvents().size(), 1);
  EXPECT_EQ(mSession.HandledEvents().size(), 1);

  EXPECT_TRUE(mSession.HandleNamedEvent("stopped").has_value());
  const auto res = mSession.HandleNamedEvent("stopped");
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::EventDoesNotExist);
}

TEST_F(SessionTest, EventsCanBeHandledBySeq)
{
  mTransport->Push(MakeEvent(20, "process"));
  mTransport->Push(MakeEvent(21, "thread"));
  QueueAll();

  EXPECT_TRUE(mSession.HandleEvent(21).has_value());
  ASSERT_EQ(mSession.PendingEvents().size(), 1);
  EXPECT_EQ(mSession.PendingEvents().front()["event"], "process");

  const auto missing = mSession.HandleEvent(22);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().mCode, ErrorCode::EventDoesNotExist);
}

TEST_F(SessionTest, NonIntegerEventSeqIsInvalid)
{
  auto event = MakeEvent(1, "process");
  event["seq"] = 1.5;
  mTransport->Push(std::move(event));
  QueueAll();
  const auto res = mSession.HandleEvent(1);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::InvalidSeqFromAdapter);
}

TEST_F(SessionTest, EventWithNonIntegerSeqDoesNotBlockOthers)
{
  auto bad = MakeEvent(1, "process");
  bad["seq"] = "1";
  mTransport->Push(std::move(bad));
  mTransport->Push(MakeEvent(2, "process"));
  QueueAll();

  const auto first = mSession.HandleEvent(2);
  ASSERT_FALSE(first.has_value());
  EXPECT_EQ(first.error().mCode, ErrorCode::InvalidSeqFromAdapter);
  ASSERT_EQ(mSession.HandledEvents().size(), 1);
  EXPECT_FALSE(mSession.HandledEvents().back().mSuccess);

  ASSERT_TRUE(mSession.HandleEvent(2).has_value());
  EXPECT_TRUE(mSession.HandledEvents().back().mSuccess);
  EXPECT_TRUE(mSession.PendingEvents().empty());
}

TEST_F(SessionTest, WaitForEventSkipsEventWithNonIntegerSeq)
{
  auto bad = MakeEvent(1, "initialized");
  bad["seq"] = nullptr;
  mTransport->Push(std::move(bad));
  mTransport->Push(MakeEvent(2, "initialized"));

  const auto first = mSession.WaitForEvent("initialized");
  ASSERT_FALSE(first.has_value());
  EXPECT_EQ(first.error().mCode, ErrorCode::InvalidSeqFromAdapter);
  ASSERT_EQ(mSession.HandledEvents().size(), 1);
  EXPECT_FALSE(mSession.HandledEvents().back().mSuccess);

  const auto second = mSession.WaitForEvent("initialized");
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, 2);
}

TEST_F(SessionTest, InitializedEventReturnsItsSeq)
{
  mTransport->Push(MakeEvent(42, "initialized"));
  QueueAll();
  const auto seq = mSession.HandleInitializedEvent();
  ASSERT_TRUE(seq.has_value());
  EXPECT_EQ(*seq, 42);
}

TEST_F(SessionTest, TerminatedEventRetainsRestartData)
{
  Launch();
  mTransport->Push(MakeEvent(5, "terminated", Value::parse(R"({"restart": {"token": "abc", "ids": [1, 2]}})")));
  // Messages queued after it must not disturb the retained data
  mTransport->Push(MakeEvent(6, "output", Value::parse(R"({"output": "bye"})")));
  mTransport->Push(MakeEvent(7, "exited", Value::parse(R"({"exitCode": 0})")));
  QueueAll();

  ASSERT_TRUE(mSession.HandleTerminatedEvent().has_value());
  EXPECT_EQ(mSession.State(), SessionState::Terminated);
  EXPECT_TRUE(mSession.HandleNamedEvent("output").has_value());
  EXPECT_TRUE(mSession.HandleNamedEvent("exited").has_value());

  ASSERT_TRUE(mSession.RestartData().has_value());
  EXPECT_EQ(*mSession.RestartData(), Value::parse(R"({"token": "abc", "ids": [1, 2]})"));
}

TEST_F(SessionTest, TerminatedEventWithoutBody)
{
  Launch();
  mTransport->Push(MakeEvent(5, "terminated"));
  QueueAll();
  ASSERT_TRUE(mSession.HandleTerminatedEvent().has_value());
  EXPECT_FALSE(mSession.RestartData().has_value());
}

TEST_F(SessionTest, DisconnectResetsState)
{
  Launch();
  const auto seq = mSession.EndSession(dapc::EndSessionMode::Disconnect);
  ASSERT_TRUE(seq.has_value());
  const auto message = mTransport->WrittenMessage(mTransport->mWritten.size() - 1);
  EXPECT_EQ(message["command"], "disconnect");
  EXPECT_EQ(message["arguments"]["restart"], false);

  mTransport->Push(MakeResponse(*seq, "disconnect"));
  QueueAll();
  ASSERT_TRUE(mSession.HandleDisconnectResponse(*seq).has_value());
  EXPECT_EQ(mSession.State(), SessionState::NotStarted);
}

TEST_F(SessionTest, FailedDisconnectKeepsState)
{
  Launch();
  const auto seq = mSession.SendDisconnectRequest(dapc::DisconnectArguments{});
  ASSERT_TRUE(seq.has_value());
  mTransport->Push(MakeResponse(*seq, "disconnect", false));
  QueueAll();
  EXPECT_FALSE(mSession.HandleDisconnectResponse(*seq).has_value());
  EXPECT_EQ(mSession.State(), SessionState::Launched);
}

TEST_F(SessionTest, EndSessionBeforeLaunch)
{
  const auto res = mSession.EndSession(dapc::EndSessionMode::Terminate);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::SessionNotStarted);
  EXPECT_TRUE(mTransport->mWritten.empty());
}

TEST_F(SessionTest, EndSessionWithTerminate)
{
  Initialize(Value::parse(R"({"supportsTerminateRequest": true})"));
  Launch();
  const auto seq = mSession.EndSession(dapc::EndSessionMode::Terminate);
  ASSERT_TRUE(seq.has_value());
  const auto message = mTransport->WrittenMessage(mTransport->mWritten.size() - 1);
  EXPECT_EQ(message["command"], "terminate");
  EXPECT_EQ(message["seq"], *seq);
  EXPECT_EQ(message["arguments"]["restart"], false);

  mTransport->Push(MakeResponse(*seq, "terminate"));
  QueueAll();
  EXPECT_TRUE(mSession.HandleTerminateResponse(*seq).has_value());
}

TEST_F(SessionTest, EndSessionWithTerminateNeedsCapability)
{
  Launch();
  const auto res = mSession.EndSession(dapc::EndSessionMode::Terminate);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().mCode, ErrorCode::AdapterDoesNotSupportTerminate);
}

TEST_F(SessionTest, WaitForResponseQueuesUntilSeen)
{
  const auto seq = mSession.SendThreadsRequest();
  ASSERT_TRUE(seq.has_value());
  mTransport->Push(MakeEvent(1, "process"));
  mTransport->Push(MakeEvent(2, "thread"));
  mTransport->Push(MakeResponse(*seq, "threads"));
  ASSERT_TRUE(mSession.WaitForResponse(*seq).has_value());
  EXPECT_TRUE(mTransport->mIncoming.empty());
  EXPECT_EQ(mSession.PendingEvents().size(), 2);
  EXPECT_TRUE(mSession.HasResponse(*seq).value());
}

TEST_F(SessionTest, WaitForEventReturnsItsSeq)
{
  mTransport->Push(MakeEvent(3, "output"));
  mTransport->Push(MakeEvent(4, "initialized"));
  mTransport->Push(MakeEvent(5, "output"));
  const auto seq = mSession.WaitForEvent("initialized");
  ASSERT_TRUE(seq.has_value());
  EXPECT_EQ(*seq, 4);
  // Stops as soon as it has seen it
  EXPECT_EQ(mTransport->mIncoming.size(), 1);
}

TEST_F(SessionTest, WaitForEventFailsWhenAdapterDies)
{
  mTransport->Push(MakeEvent(3, "output"));
  mTransport->mDead = true;
  const auto seq = mSession.WaitForEvent("initialized");
  ASSERT_FALSE(seq.has_value());
  EXPECT_EQ(seq.error().mCode, ErrorCode::EndOfStream);
}

TEST_F(SessionTest, RepeatedTransportErrorsEndTheSession)
{
  mTransport->mPollError = ErrorCode::PollFailed;
  for (auto i = 1u; i < dapc::Session::kMaxConsecutiveTransportErrors; ++i) {
    const auto res = mSession.QueueMessages(kNoWait);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().mCode, ErrorCode::PollFailed);
    EXPECT_FALSE(mSession.AdapterDied());
  }
  const auto last = mSession.QueueMessages(kNoWait);
  ASSERT_FALSE(last.has_value());
  EXPECT_EQ(last.error().mCode, ErrorCode::EndOfStream);
  EXPECT_TRUE(mSession.AdapterDied());
  EXPECT_EQ(mSession.State(), SessionState::Terminated);

  // Dead stays dead
  mTransport->mPollError.reset();
  EXPECT_EQ(mSession.QueueMessages(kNoWait).error().mCode, ErrorCode::EndOfStream);
}

TEST_F(SessionTest, TransportErrorCountResetsOnSuccess)
{
  const auto failTimes = [this](u32 n) {
    mTransport->mPollError = ErrorCode::ReadFailed;
    for (auto i = 0u; i < n; ++i) {
      EXPECT_FALSE(mSession.QueueMessages(kNoWait).has_value());
    }
    mTransport->mPollError.reset();
  };
  failTimes(dapc::Session::kMaxConsecutiveTransportErrors - 1);
  ASSERT_TRUE(mSession.QueueMessages(kNoWait).has_value());
  failTimes(dapc::Session::kMaxConsecutiveTransportErrors - 1);
  EXPECT_FALSE(mSession.AdapterDied());
}

TEST_F(SessionTest, WaitForAdapterPassesGracePeriod)
{
  mTransport->mExitCode = 3;
  const auto exited = mSession.WaitForAdapter(Milliseconds{ 250 });
  ASSERT_TRUE(exited.has_value());
  EXPECT_EQ(*exited, 3);
  EXPECT_EQ(mTransport->mWaitGrace, Milliseconds{ 250 });
}

using SessionDeathTest = SessionTest;

TEST_F(SessionDeathTest, HandlingLaunchTwiceIsAContractViolation)
{
  Launch();
  const auto seq = mSession.PeekSeq() - 1;
  EXPECT_DEATH({ (void)mSession.HandleLaunchResponse(seq); }, "");
}

TEST_F(SessionDeathTest, SendingReverseRequestIsAContractViolation)
{
  EXPECT_DEATH({ (void)mSession.SendRequest(Command::RunInTerminal, dapc::ThreadsArguments{}); }, "");
}

TEST(SessionSeqDeathTest, RunningOutOfSeqsIsAContractViolation)
{
  dapc::Session session{ std::make_unique<FakeTransport>(), Milliseconds{ 1 }, std::numeric_limits<Seq>::max() - 1 };
  const auto last = session.SendThreadsRequest();
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(*last, std::numeric_limits<Seq>::max() - 1);
  EXPECT_DEATH({ (void)session.SendThreadsRequest(); }, "");
}
