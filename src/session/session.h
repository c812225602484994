/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common.h>
#include <marshal/marshal.h>
#include <protocol/capabilities.h>
#include <protocol/dap_defs.h>
#include <protocol/error.h>
#include <protocol/types.h>
#include <protocol/value.h>
#include <transport/transport.h>
#include <utils/logger.h>

// std
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace dapc {

// A message that has been consumed by a handler. Kept for the lifetime of the session.
struct HandledMessage
{
  Value mMessage;
  // Whether the handler accepted it. A message whose envelope or body failed validation is still handled, with
  // this cleared.
  bool mSuccess;
  std::chrono::system_clock::time_point mHandledAt;
};

struct SentRequest
{
  Seq mSeq;
  Command mCommand;
};

// One debug session: the adapter connection, the request sequence, the negotiated capabilities and the queues of
// messages received from the adapter. Messages move from a pending queue to a handled one exactly once, and
// handled messages never move again, so a pointer to one stays valid for as long as the session lives.
//
// Everything here runs on one thread. Nothing blocks except the transport poll and the two Wait* helpers.
class Session
{
  std::unique_ptr<AdapterTransport> mTransport;
  Milliseconds mPollInterval;
  // Next seq to hand out. Never reused.
  Seq mSeq;
  SessionState mState{ SessionState::NotStarted };
  bool mAdapterDied{ false };
  u32 mConsecutiveTransportErrors{ 0 };

  ClientCapabilitySet mClientCapabilities{};
  AdapterCapabilities mAdapterCapabilities{};
  // Backing storage for the strings in mAdapterCapabilities
  ScratchCloner mStorage{};
  // body.restart of the last terminated event, to be passed along as `__restart` on a relaunch.
  std::optional<Value> mRestartData{};

  std::vector<Value> mPendingResponses{};
  std::vector<Value> mPendingEvents{};
  std::deque<HandledMessage> mHandledResponses{};
  std::deque<HandledMessage> mHandledEvents{};
  std::vector<SentRequest> mSentRequests{};
  u64 mResponsesReceived{ 0 };
  u64 mEventsReceived{ 0 };

  Seq NewSeq() noexcept;
  Result<void> Write(Seq seq, Command command, const Value &message) noexcept;
  // A pending message whose seq field isn't an integer can never be looked up. The lookups that run into one
  // move it to the handled list as failed and report it.
  Result<std::optional<size_t>> FindResponseIndex(Seq seq) noexcept;
  Result<std::optional<size_t>> FindEventIndex(Seq seq) noexcept;
  std::optional<size_t> FindEventIndex(std::string_view name) const noexcept;
  HandledMessage &MoveResponseToHandled(size_t index, bool success) noexcept;
  HandledMessage &MoveEventToHandled(size_t index, bool success) noexcept;
  Result<void> ApplyInitResponseBody(const Value &response) noexcept;

public:
  // Poll or read failures in a row after which the adapter is considered dead
  static constexpr u32 kMaxConsecutiveTransportErrors = 8;

  // Requests are numbered from `firstSeq`.
  Session(std::unique_ptr<AdapterTransport> transport, Milliseconds pollInterval, Seq firstSeq = 1) noexcept;
  NO_COPY(Session);

  Result<void> SpawnAdapter() noexcept;
  // Close the adapter's input and reap it. An adapter still running after `grace` is sent SIGTERM.
  Result<int> WaitForAdapter(Milliseconds grace) noexcept;

  // Poll the transport once, for at most `timeout`, and queue the message that arrived, if any. A transport that
  // keeps failing to poll or read is treated like one that reached end of stream.
  Result<void> QueueMessages(Milliseconds timeout) noexcept;

  // The single send path. Checks that the adapter supports `command`, takes a new seq, marshals the request and
  // merges `extra` into its arguments before writing it. A refused request consumes no seq.
  template <typename Arguments>
  Result<Seq>
  SendRequest(Command command, const Arguments &arguments, const Value &extra = Value::object()) noexcept
  {
    VERIFY(!IsReverseRequest(command), "{} is sent by the adapter, not to it", Enum<Command>::ToString(command));
    TRY_VOID(CheckRequestCapability(mAdapterCapabilities, command));
    const Request<Arguments> request{
      .mSeq = NewSeq(), .mType = MessageType::Request, .mCommand = command, .mArguments = arguments
    };
    Value message = ToObject(request);
    if (!extra.empty()) {
      auto &args = message["arguments"];
      if (args.is_null()) {
        args = Value::object();
      }
      TRY_VOID(MergeIntoAncestor(message, "arguments", extra));
    }
    TRY_VOID(Write(request.mSeq, command, message));
    return request.mSeq;
  }

  Result<Seq> SendInitRequest(const InitializeRequestArguments &arguments,
    const Value &extra = Value::object()) noexcept;
  Result<void> HandleInitResponse(Seq seq) noexcept;

  Result<Seq> SendLaunchRequest(const LaunchRequestArguments &arguments,
    const Value &extra = Value::object()) noexcept;
  // Contract: the session must not have been launched already.
  Result<void> HandleLaunchResponse(Seq seq) noexcept;

  Result<Seq> SendConfigurationDoneRequest(const Value &extra = Value::object()) noexcept;
  Result<void> HandleConfigurationDoneResponse(Seq seq) noexcept;

  Result<Seq> SendTerminateRequest(const TerminateArguments &arguments,
    const Value &extra = Value::object()) noexcept;
  Result<void> HandleTerminateResponse(Seq seq) noexcept;

  Result<Seq> SendDisconnectRequest(const DisconnectArguments &arguments,
    const Value &extra = Value::object()) noexcept;
  Result<void> HandleDisconnectResponse(Seq seq) noexcept;

  Result<Seq> SendThreadsRequest() noexcept;

  // Ask the adapter to end the debuggee, the way `mode` says. Returns the seq of the request that was sent.
  Result<Seq> EndSession(EndSessionMode mode) noexcept;

  // Validate the envelope of the response to `seq` and move it to the handled list. The response is handled
  // even when validation fails, in which case the error says why. A handler that goes on to reject the body
  // clears `mSuccess` of the returned record.
  Result<HandledMessage *> AcknowledgeResponse(Seq seq, Command command) noexcept;
  // Move the oldest pending event called `name` to the handled list.
  Result<HandledMessage *> AcknowledgeEvent(std::string_view name) noexcept;
  Result<HandledMessage *> AcknowledgeEvent(Seq seq) noexcept;

  Result<void> HandleNamedEvent(std::string_view name) noexcept;
  Result<void> HandleEvent(Seq seq) noexcept;
  // Returns the seq of the initialized event.
  Result<Seq> HandleInitializedEvent() noexcept;
  Result<void> HandleTerminatedEvent() noexcept;

  // Block until the response to `seq` has been queued. There is no deadline.
  Result<void> WaitForResponse(Seq seq) noexcept;
  // Block until an event called `name` has been queued and return its seq. There is no deadline.
  Result<Seq> WaitForEvent(std::string_view name) noexcept;

  Result<bool> HasResponse(Seq seq) noexcept;
  bool HasEvent(std::string_view name) const noexcept;

  SessionState
  State() const noexcept
  {
    return mState;
  }

  bool
  AdapterDied() const noexcept
  {
    return mAdapterDied;
  }

  // The seq the next request will get
  Seq
  PeekSeq() const noexcept
  {
    return mSeq;
  }

  const ClientCapabilitySet &
  GetClientCapabilities() const noexcept
  {
    return mClientCapabilities;
  }

  const AdapterCapabilities &
  GetAdapterCapabilities() const noexcept
  {
    return mAdapterCapabilities;
  }

  const std::optional<Value> &
  RestartData() const noexcept
  {
    return mRestartData;
  }

  const std::vector<Value> &
  PendingResponses() const noexcept
  {
    return mPendingResponses;
  }

  const std::vector<Value> &
  PendingEvents() const noexcept
  {
    return mPendingEvents;
  }

  const std::deque<HandledMessage> &
  HandledResponses() const noexcept
  {
    return mHandledResponses;
  }

  const std::deque<HandledMessage> &
  HandledEvents() const noexcept
  {
    return mHandledEvents;
  }

  const std::vector<SentRequest> &
  SentRequests() const noexcept
  {
    return mSentRequests;
  }

  u64
  ResponsesReceived() const noexcept
  {
    return mResponsesReceived;
  }

  u64
  EventsReceived() const noexcept
  {
    return mEventsReceived;
  }
};

} // namespace dapc
