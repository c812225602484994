/** LICENSE TEMPLATE */
// dapc
#include <common.h>
#include <configuration/command_line.h>
#include <configuration/config.h>
#include <session/session.h>
#include <session_data/session_data.h>
#include <transport/pipe_transport.h>
#include <utils/logger.h>

// dependency
#include <fmt/core.h>

// std
#include <algorithm>
#include <csignal>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
volatile std::sig_atomic_t sStopRequested = 0;

void
InstallSignalHandlers() noexcept
{
  struct sigaction action
  {
  };
  action.sa_handler = [](int) { sStopRequested = 1; };
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: a blocked poll returns so the control loop gets to see the request.
  action.sa_flags = 0;
  VERIFY(sigaction(SIGINT, &action, nullptr) == 0, "Failed to install SIGINT handler");
  VERIFY(sigaction(SIGTERM, &action, nullptr) == 0, "Failed to install SIGTERM handler");
  // A write to an adapter that has died must fail with EPIPE, not kill us.
  std::signal(SIGPIPE, SIG_IGN);
}

void
ReportError(std::string_view what, const dapc::Error &error) noexcept
{
  DBGLOG(core, "{}: {}", what, error.Message());
  fmt::print(stderr, "dapc: {}: {}\n", what, error.Message());
}
} // namespace

namespace dapc {

// How long the adapter gets to exit on its own once its stdin is closed
static constexpr Milliseconds kAdapterExitGrace{ 2000 };

// spawn, initialize, launch, configurationDone. Returns once the launch response has been handled.
static Result<void>
BeginDebugging(Session &session, const cfg::InitializationConfiguration &config) noexcept
{
  TRY_VOID(session.SpawnAdapter());

  const auto adapterId = config.AdapterId();
  const auto initSeq = TRY(session.SendInitRequest(InitializeRequestArguments{ .mClientId = "dapc",
    .mClientName = "dapc",
    .mAdapterId = adapterId,
    .mLinesStartAt1 = true,
    .mColumnsStartAt1 = true,
    .mPathFormat = OpenEnum<PathFormat>{ PathFormat::Path },
    .mSupportsVariableType = true,
    .mSupportsProgressReporting = false }));
  TRY_VOID(session.WaitForResponse(initSeq));
  TRY_VOID(session.HandleInitResponse(initSeq));

  Value extra = Value::object();
  extra["program"] = config.mDebugee.string();
  const auto launchSeq = TRY(session.SendLaunchRequest(LaunchRequestArguments{}, extra));

  TRY(session.WaitForEvent(Enum<EventKind>::ToString(EventKind::Initialized)));
  TRY(session.HandleInitializedEvent());

  if (session.GetAdapterCapabilities().mSupport.Contains(AdapterCapability::SupportsConfigurationDoneRequest)) {
    const auto configurationDoneSeq = TRY(session.SendConfigurationDoneRequest());
    TRY_VOID(session.WaitForResponse(configurationDoneSeq));
    TRY_VOID(session.HandleConfigurationDoneResponse(configurationDoneSeq));
  }

  TRY_VOID(session.WaitForResponse(launchSeq));
  TRY_VOID(session.HandleLaunchResponse(launchSeq));
  return {};
}

// What the control loop is still waiting on.
struct ControlState
{
  std::vector<Seq> mThreadRequests{};
  std::optional<Seq> mDisconnect{};
  bool mDone{ false };
};

static Result<void>
DispatchEvent(Session &session, SessionData &data, ControlState &state) noexcept
{
  const Value &next = session.PendingEvents().front();
  const auto name = std::string{ GetString(next, "event").value_or("") };
  const auto kind = Enum<EventKind>::FromString(name);
  if (!kind) {
    // Unknown or missing event name. Acknowledge it by its seq so it doesn't block the queue.
    const auto seq = GetInteger(next, "seq");
    if (!seq || !std::in_range<Seq>(*seq)) {
      return MakeError(ErrorCode::InvalidSeqFromAdapter, fmt::format("event '{}'", name));
    }
    DBGLOG(core, "ignoring event '{}'", name);
    return session.HandleEvent(static_cast<Seq>(*seq));
  }

  switch (*kind) {
  case EventKind::Module:
    return data.HandleEventModules(session);
  case EventKind::Output: {
    TRY_VOID(data.HandleEventOutput(session));
    fmt::print("{}", data.Output().back().mOutput);
    return {};
  }
  case EventKind::Exited: {
    TRY_VOID(data.HandleEventExited(session));
    fmt::print("debuggee exited with {}\n", data.ExitCode().value_or(-1));
    return {};
  }
  case EventKind::Stopped: {
    TRY_VOID(data.HandleEventStopped(session));
    state.mThreadRequests.push_back(TRY(session.SendThreadsRequest()));
    return {};
  }
  case EventKind::Continued:
    return data.HandleEventContinued(session);
  case EventKind::Terminated: {
    TRY_VOID(session.HandleTerminatedEvent());
    data.SetTerminated();
    if (!state.mDisconnect) {
      state.mDisconnect = TRY(session.EndSession(EndSessionMode::Disconnect));
    }
    return {};
  }
  default:
    return session.HandleNamedEvent(name);
  }
}

static Result<void>
DispatchResponses(Session &session, SessionData &data, ControlState &state) noexcept
{
  for (auto it = state.mThreadRequests.begin(); it != state.mThreadRequests.end();) {
    if (!TRY(session.HasResponse(*it))) {
      ++it;
      continue;
    }
    const auto seq = *it;
    it = state.mThreadRequests.erase(it);
    TRY_VOID(data.HandleResponseThreads(session, seq));
    for (const auto &thread : data.Threads()) {
      const auto *status = data.GetThreadStatus(thread.mId);
      fmt::print("thread {}: {} ({})\n", thread.mId, thread.mName,
        Enum<ThreadState>::ToString(status ? status->mState : ThreadState::Unknown));
    }
  }

  if (state.mDisconnect && TRY(session.HasResponse(*state.mDisconnect))) {
    TRY_VOID(session.HandleDisconnectResponse(*state.mDisconnect));
    state.mDone = true;
  }
  return {};
}

static int
RunControlLoop(Session &session, SessionData &data, Milliseconds pollInterval) noexcept
{
  ControlState state{};
  while (!state.mDone) {
    if (sStopRequested != 0 && !state.mDisconnect) {
      DBGLOG(core, "stop requested, disconnecting");
      if (auto seq = session.EndSession(EndSessionMode::Disconnect); seq) {
        state.mDisconnect = *seq;
      } else {
        ReportError("disconnect", seq.error());
        return 1;
      }
    }

    if (auto queued = session.QueueMessages(pollInterval); !queued) {
      if (session.AdapterDied()) {
        DBGLOG(core, "adapter died, leaving control loop: {}", queued.error().Message());
        break;
      }
      // A transport that keeps failing ends up as a dead adapter, see Session::QueueMessages.
      ReportError("reading from adapter", queued.error());
      continue;
    }

    while (!session.PendingEvents().empty()) {
      if (auto dispatched = DispatchEvent(session, data, state); !dispatched) {
        ReportError("handling event", dispatched.error());
        return 1;
      }
    }

    if (auto dispatched = DispatchResponses(session, data, state); !dispatched) {
      ReportError("handling response", dispatched.error());
      return 1;
    }
  }
  return 0;
}

} // namespace dapc

int
main(int argc, const char **argv)
{
  using dapc::logging::Logger;

  dapc::cfg::CommandLineRegistry registry{ "dapc" };
  auto config = dapc::cfg::InitializationConfiguration::ConfigureWithParser(registry);
  registry.ParseEnvironmentVariableOptions();
  const auto parsed = registry.Parse(argc, argv);

  if (config->mHelp) {
    registry.PrintHelp();
    return 0;
  }

  if (!parsed.Ok()) {
    for (const auto &error : parsed.mErrors) {
      fmt::print(stderr, "dapc: {}", dapc::cfg::ParseErrorMessage(error.mError));
      for (const auto input : error.mInputs) {
        fmt::print(stderr, " '{}'", input);
      }
      fmt::print(stderr, "\n");
    }
    registry.PrintHelp();
    return 1;
  }

  if (config->mAdapterCommandLine.empty() || config->mDebugee.empty()) {
    fmt::print(stderr, "dapc: both --adapter and --debugee are required\n");
    registry.PrintHelp();
    return 1;
  }

  Logger::ConfigureLogging(*config);
  InstallSignalHandlers();

  const auto pollInterval = Milliseconds{ config->mPollIntervalMs };
  dapc::Session session{ std::make_unique<dapc::PipeTransport>(config->mAdapterCommandLine, config->mDebugConnection),
    pollInterval };
  dapc::SessionData data{};

  if (auto begun = dapc::BeginDebugging(session, *config); !begun) {
    ReportError("starting debug session", begun.error());
    if (session.AdapterDied() || begun.error().mCode == dapc::ErrorCode::SpawnFailed) {
      return 1;
    }
    // The adapter is up but unusable. Close its stdin, and signal it if it doesn't take the hint.
    if (auto exited = session.WaitForAdapter(dapc::kAdapterExitGrace); !exited) {
      ReportError("waiting for adapter", exited.error());
    }
    return 1;
  }

  auto exitCode = dapc::RunControlLoop(session, data, pollInterval);

  if (auto exited = session.WaitForAdapter(dapc::kAdapterExitGrace); exited) {
    DBGLOG(core, "adapter exited with {}", *exited);
  } else {
    ReportError("waiting for adapter", exited.error());
    exitCode = 1;
  }
  return exitCode;
}
