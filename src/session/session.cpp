/** LICENSE TEMPLATE */
#include "session.h"

// std
#include <algorithm>
#include <limits>

namespace dapc {

static HandledMessage
MakeHandled(Value &&message, bool success) noexcept
{
  return HandledMessage{
    .mMessage = std::move(message), .mSuccess = success, .mHandledAt = std::chrono::system_clock::now()
  };
}

Session::Session(std::unique_ptr<AdapterTransport> transport, Milliseconds pollInterval, Seq firstSeq) noexcept
    : mTransport(std::move(transport)), mPollInterval(pollInterval), mSeq(firstSeq)
{
  VERIFY(mTransport != nullptr, "A session needs a transport");
  VERIFY(firstSeq > 0, "Sequence numbers start at 1 or later, not {}", firstSeq);
}

Seq
Session::NewSeq() noexcept
{
  VERIFY(mSeq < std::numeric_limits<Seq>::max(), "Out of sequence numbers after {}", mSeq);
  const auto seq = mSeq;
  ++mSeq;
  return seq;
}

Result<void>
Session::SpawnAdapter() noexcept
{
  return mTransport->Spawn();
}

Result<int>
Session::WaitForAdapter(Milliseconds grace) noexcept
{
  return mTransport->Wait(grace);
}

Result<void>
Session::Write(Seq seq, Command command, const Value &message) noexcept
{
  const auto framed = AdapterTransport::CreateMessage(message);
  if (auto res = mTransport->WriteAll(framed); !res) {
    DBGLOG(warning, "failed to write {} request seq={}: {}", Enum<Command>::ToString(command), seq,
      res.error().Message());
    return res;
  }
  mSentRequests.push_back(SentRequest{ .mSeq = seq, .mCommand = command });
  DBGLOG(session, "sent {} seq={}", Enum<Command>::ToString(command), seq);
  return {};
}

Result<void>
Session::QueueMessages(Milliseconds timeout) noexcept
{
  if (mAdapterDied) {
    return MakeError(ErrorCode::EndOfStream, "adapter is dead");
  }

  const auto failed = [this](Error &&error) -> std::unexpected<Error> {
    if (error.mCode == ErrorCode::PollFailed || error.mCode == ErrorCode::ReadFailed) {
      ++mConsecutiveTransportErrors;
      if (mConsecutiveTransportErrors >= kMaxConsecutiveTransportErrors) {
        DBGLOG(warning, "{} transport errors in a row, giving up on the adapter: {}", mConsecutiveTransportErrors,
          error.Message());
        error.mCode = ErrorCode::EndOfStream;
      }
    }
    if (error.mCode == ErrorCode::EndOfStream) {
      DBGLOG(session, "adapter closed its output, session terminated");
      mAdapterDied = true;
      mState = SessionState::Terminated;
    }
    return std::unexpected{ std::move(error) };
  };

  auto exists = mTransport->MessageExists(timeout);
  if (!exists) {
    return failed(std::move(exists.error()));
  }
  if (!*exists) {
    mConsecutiveTransportErrors = 0;
    return {};
  }

  auto read = mTransport->ReadMessage();
  if (!read) {
    return failed(std::move(read.error()));
  }
  mConsecutiveTransportErrors = 0;

  Value message = std::move(*read);
  const auto type = GetString(message, "type");
  if (!type) {
    DBGLOG(warning, "invalid message from adapter: {}", message.dump());
    return MakeError(ErrorCode::InvalidMessage);
  }

  const auto messageType = Enum<MessageType>::FromString(*type);
  if (messageType == MessageType::Response) {
    mPendingResponses.push_back(std::move(message));
    ++mResponsesReceived;
  } else if (messageType == MessageType::Event) {
    mPendingEvents.push_back(std::move(message));
    ++mEventsReceived;
  } else {
    DBGLOG(warning, "unknown message type from adapter: {}", *type);
    return MakeError(ErrorCode::UnknownMessage, std::string{ *type });
  }
  return {};
}

Result<std::optional<size_t>>
Session::FindResponseIndex(Seq seq) noexcept
{
  for (auto i = 0u; i < mPendingResponses.size(); ++i) {
    const auto *requestSeq = GetField(mPendingResponses[i], "request_seq");
    if (!requestSeq) {
      continue;
    }
    if (!requestSeq->is_number_integer()) {
      auto error = MakeError(ErrorCode::InvalidSeqFromAdapter, fmt::format("request_seq: {}", requestSeq->dump()));
      DBGLOG(warning, "retiring response with {}", error.error().mDetail);
      MoveResponseToHandled(i, false);
      return error;
    }
    if (requestSeq->get<i64>() == seq) {
      return i;
    }
  }
  return std::nullopt;
}

Result<std::optional<size_t>>
Session::FindEventIndex(Seq seq) noexcept
{
  for (auto i = 0u; i < mPendingEvents.size(); ++i) {
    const auto *eventSeq = GetField(mPendingEvents[i], "seq");
    if (!eventSeq) {
      continue;
    }
    if (!eventSeq->is_number_integer()) {
      auto error = MakeError(ErrorCode::InvalidSeqFromAdapter, fmt::format("seq: {}", eventSeq->dump()));
      DBGLOG(warning, "retiring event with {}", error.error().mDetail);
      MoveEventToHandled(i, false);
      return error;
    }
    if (eventSeq->get<i64>() == seq) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<size_t>
Session::FindEventIndex(std::string_view name) const noexcept
{
  const auto it = std::find_if(mPendingEvents.begin(), mPendingEvents.end(),
    [name](const Value &event) { return GetString(event, "event") == name; });
  if (it == mPendingEvents.end()) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::distance(mPendingEvents.begin(), it));
}

HandledMessage &
Session::MoveResponseToHandled(size_t index, bool success) noexcept
{
  DAPC_ASSERT(index < mPendingResponses.size(), "response index {} out of range", index);
  auto &handled = mHandledResponses.emplace_back(MakeHandled(std::move(mPendingResponses[index]), success));
  mPendingResponses.erase(mPendingResponses.begin() + index);
  return handled;
}

HandledMessage &
Session::MoveEventToHandled(size_t index, bool success) noexcept
{
  DAPC_ASSERT(index < mPendingEvents.size(), "event index {} out of range", index);
  auto &handled = mHandledEvents.emplace_back(MakeHandled(std::move(mPendingEvents[index]), success));
  mPendingEvents.erase(mPendingEvents.begin() + index);
  return handled;
}

Result<bool>
Session::HasResponse(Seq seq) noexcept
{
  return TRY(FindResponseIndex(seq)).has_value();
}

bool
Session::HasEvent(std::string_view name) const noexcept
{
  return FindEventIndex(name).has_value();
}

Result<HandledMessage *>
Session::AcknowledgeResponse(Seq seq, Command command) noexcept
{
  const auto index = TRY(FindResponseIndex(seq));
  if (!index) {
    return MakeError(ErrorCode::ResponseDoesNotExist, fmt::format("request_seq={}", seq));
  }

  auto &handled = MoveResponseToHandled(*index, false);
  const Value &response = handled.mMessage;

  if (GetBool(response, "success") != true) {
    const auto message = GetString(response, "message").value_or("");
    DBGLOG(session, "{} request seq={} failed: {}", Enum<Command>::ToString(command), seq, message);
    return MakeError(ErrorCode::RequestFailed, fmt::format("{}: {}", Enum<Command>::ToString(command), message));
  }
  if (GetInteger(response, "request_seq") != seq) {
    return MakeError(ErrorCode::RequestResponseMismatchedSeq, fmt::format("expected {}", seq));
  }
  const auto expectedCommand = Enum<Command>::ToString(command);
  if (const auto responseCommand = GetString(response, "command"); responseCommand != expectedCommand) {
    return MakeError(ErrorCode::WrongCommandForResponse,
      fmt::format("expected {}, got {}", expectedCommand, responseCommand.value_or("<none>")));
  }

  handled.mSuccess = true;
  return &handled;
}

Result<HandledMessage *>
Session::AcknowledgeEvent(std::string_view name) noexcept
{
  const auto index = FindEventIndex(name);
  if (!index) {
    return MakeError(ErrorCode::EventDoesNotExist, std::string{ name });
  }
  return &MoveEventToHandled(*index, true);
}

Result<HandledMessage *>
Session::AcknowledgeEvent(Seq seq) noexcept
{
  const auto index = TRY(FindEventIndex(seq));
  if (!index) {
    return MakeError(ErrorCode::EventDoesNotExist, fmt::format("seq={}", seq));
  }
  return &MoveEventToHandled(*index, true);
}

Result<Seq>
Session::SendInitRequest(const InitializeRequestArguments &arguments, const Value &extra) noexcept
{
  const auto seq = TRY(SendRequest(Command::Initialize, arguments, extra));
  mClientCapabilities = ClientCapabilitySet::FromObject(ToObject(arguments));
  DBGLOG(session, "client capabilities: {} set", mClientCapabilities.Count());
  return seq;
}

Result<void>
Session::HandleInitResponse(Seq seq) noexcept
{
  auto *handled = TRY(AcknowledgeResponse(seq, Command::Initialize));
  if (auto applied = ApplyInitResponseBody(handled->mMessage); !applied) {
    handled->mSuccess = false;
    return applied;
  }
  return {};
}

Result<void>
Session::ApplyInitResponseBody(const Value &response) noexcept
{
  const Value *body = GetField(response, "body");
  if (!body || body->is_null()) {
    DBGLOG(session, "initialize response without capabilities");
    return {};
  }
  if (!body->is_object()) {
    return MakeError(ErrorCode::InvalidField, "body: expected object");
  }

  // Parse everything before committing any of it, a bad body leaves the capabilities as they were.
  const auto parseArray = [body]<typename T>(std::string_view name, std::optional<std::vector<T>> &out) -> Result<void> {
    const Value *field = GetField(*body, name);
    if (!field) {
      return {};
    }
    auto parsed = FromObject<std::optional<std::vector<T>>>(*field);
    if (!parsed) {
      return std::unexpected{ detail::PrefixError(name, std::move(parsed.error())) };
    }
    out = std::move(*parsed);
    return {};
  };

  AdapterCapabilities capabilities{};
  capabilities.mSupport = AdapterCapabilitySet::FromObject(*body);
  TRY_VOID(parseArray("completionTriggerCharacters", capabilities.mCompletionTriggerCharacters));
  TRY_VOID(parseArray("exceptionBreakpointFilters", capabilities.mExceptionBreakpointFilters));
  TRY_VOID(parseArray("additionalModuleColumns", capabilities.mAdditionalModuleColumns));
  TRY_VOID(parseArray("supportedChecksumAlgorithms", capabilities.mSupportedChecksumAlgorithms));
  TRY_VOID(parseArray("breakpointModes", capabilities.mBreakpointModes));

  // The parsed arrays view into the response; give the session its own copy.
  mAdapterCapabilities.mSupport = capabilities.mSupport;
  mAdapterCapabilities.mCompletionTriggerCharacters = DeepClone(mStorage, capabilities.mCompletionTriggerCharacters);
  mAdapterCapabilities.mExceptionBreakpointFilters = DeepClone(mStorage, capabilities.mExceptionBreakpointFilters);
  mAdapterCapabilities.mAdditionalModuleColumns = DeepClone(mStorage, capabilities.mAdditionalModuleColumns);
  mAdapterCapabilities.mSupportedChecksumAlgorithms = capabilities.mSupportedChecksumAlgorithms;
  mAdapterCapabilities.mBreakpointModes = DeepClone(mStorage, capabilities.mBreakpointModes);
  DBGLOG(session, "adapter capabilities: {} set", mAdapterCapabilities.mSupport.Count());
  return {};
}

Result<Seq>
Session::SendLaunchRequest(const LaunchRequestArguments &arguments, const Value &extra) noexcept
{
  return SendRequest(Command::Launch, arguments, extra);
}

Result<void>
Session::HandleLaunchResponse(Seq seq) noexcept
{
  VERIFY(mState == SessionState::NotStarted, "Launch response handled in state {}",
    Enum<SessionState>::ToString(mState));
  TRY(AcknowledgeResponse(seq, Command::Launch));
  mState = SessionState::Launched;
  DBGLOG(session, "state: launched");
  return {};
}

Result<Seq>
Session::SendConfigurationDoneRequest(const Value &extra) noexcept
{
  return SendRequest(Command::ConfigurationDone, ConfigurationDoneArguments{}, extra);
}

Result<void>
Session::HandleConfigurationDoneResponse(Seq seq) noexcept
{
  TRY(AcknowledgeResponse(seq, Command::ConfigurationDone));
  return {};
}

Result<Seq>
Session::SendTerminateRequest(const TerminateArguments &arguments, const Value &extra) noexcept
{
  return SendRequest(Command::Terminate, arguments, extra);
}

Result<void>
Session::HandleTerminateResponse(Seq seq) noexcept
{
  TRY(AcknowledgeResponse(seq, Command::Terminate));
  return {};
}

Result<Seq>
Session::SendDisconnectRequest(const DisconnectArguments &arguments, const Value &extra) noexcept
{
  return SendRequest(Command::Disconnect, arguments, extra);
}

Result<void>
Session::HandleDisconnectResponse(Seq seq) noexcept
{
  TRY(AcknowledgeResponse(seq, Command::Disconnect));
  mState = SessionState::NotStarted;
  DBGLOG(session, "state: not_started");
  return {};
}

Result<Seq>
Session::SendThreadsRequest() noexcept
{
  return SendRequest(Command::Threads, ThreadsArguments{});
}

Result<Seq>
Session::EndSession(EndSessionMode mode) noexcept
{
  switch (mState) {
  case SessionState::NotStarted:
    return MakeError(ErrorCode::SessionNotStarted);
  case SessionState::Attached:
    PANIC("Ending an attached session is not implemented");
  case SessionState::Launched:
  case SessionState::Terminated:
    break;
  }

  switch (mode) {
  case EndSessionMode::Terminate:
    return SendTerminateRequest(TerminateArguments{ .mRestart = false });
  case EndSessionMode::Disconnect:
    return SendDisconnectRequest(DisconnectArguments{ .mRestart = false });
  }
  NEVER("Unhandled end session mode");
}

Result<void>
Session::HandleNamedEvent(std::string_view name) noexcept
{
  TRY(AcknowledgeEvent(name));
  return {};
}

Result<void>
Session::HandleEvent(Seq seq) noexcept
{
  TRY(AcknowledgeEvent(seq));
  return {};
}

Result<Seq>
Session::HandleInitializedEvent() noexcept
{
  auto *handled = TRY(AcknowledgeEvent(Enum<EventKind>::ToString(EventKind::Initialized)));
  const auto seq = GetInteger(handled->mMessage, "seq");
  if (!seq || !std::in_range<Seq>(*seq)) {
    handled->mSuccess = false;
    return MakeError(ErrorCode::InvalidSeqFromAdapter, "initialized event seq");
  }
  return static_cast<Seq>(*seq);
}

Result<void>
Session::HandleTerminatedEvent() noexcept
{
  auto *handled = TRY(AcknowledgeEvent(Enum<EventKind>::ToString(EventKind::Terminated)));
  mState = SessionState::Terminated;
  DBGLOG(session, "state: terminated");

  const Value *body = GetField(handled->mMessage, "body");
  if (!body || body->is_null()) {
    return {};
  }
  auto parsed = FromObject<TerminatedEventBody>(*body);
  if (!parsed) {
    handled->mSuccess = false;
    return std::unexpected{ std::move(parsed.error()) };
  }
  if (parsed->mRestart) {
    mRestartData = DeepClone(mStorage, *parsed->mRestart);
  }
  return {};
}

Result<void>
Session::WaitForResponse(Seq seq) noexcept
{
  while (!TRY(HasResponse(seq))) {
    TRY_VOID(QueueMessages(mPollInterval));
  }
  return {};
}

Result<Seq>
Session::WaitForEvent(std::string_view name) noexcept
{
  while (true) {
    if (const auto index = FindEventIndex(name); index) {
      const auto seq = GetInteger(mPendingEvents[*index], "seq");
      if (!seq || !std::in_range<Seq>(*seq)) {
        // It would be found first by every later wait for `name`.
        MoveEventToHandled(*index, false);
        return MakeError(ErrorCode::InvalidSeqFromAdapter, fmt::format("{} event seq", name));
      }
      return static_cast<Seq>(*seq);
    }
    TRY_VOID(QueueMessages(mPollInterval));
  }
}

} // namespace dapc
