/** LICENSE TEMPLATE */
#include "capabilities.h"

// dapc
#include <common.h>

namespace dapc {

std::optional<AdapterCapability>
RequiredCapability(Command command) noexcept
{
  using enum Command;
  using Cap = AdapterCapability;
  switch (command) {
  case DataBreakpointInfo:
  case SetDataBreakpoints:
    return Cap::SupportsDataBreakpoints;
  case StepBack:
  case ReverseContinue:
    return Cap::SupportsStepBack;
  case ConfigurationDone:
    return Cap::SupportsConfigurationDoneRequest;
  case SetFunctionBreakpoints:
    return Cap::SupportsFunctionBreakpoints;
  case SetVariable:
    return Cap::SupportsSetVariable;
  case RestartFrame:
    return Cap::SupportsRestartFrame;
  case Goto:
  case GotoTargets:
    return Cap::SupportsGotoTargetsRequest;
  case StepInTargets:
    return Cap::SupportsStepInTargetsRequest;
  case Completions:
    return Cap::SupportsCompletionsRequest;
  case Modules:
    return Cap::SupportsModulesRequest;
  case Restart:
    return Cap::SupportsRestartRequest;
  case ExceptionInfo:
    return Cap::SupportsExceptionInfoRequest;
  case LoadedSources:
    return Cap::SupportsLoadedSourcesRequest;
  case TerminateThreads:
    return Cap::SupportsTerminateThreadsRequest;
  case SetExpression:
    return Cap::SupportsSetExpression;
  case Terminate:
    return Cap::SupportsTerminateRequest;
  case Cancel:
    return Cap::SupportsCancelRequest;
  case BreakpointLocations:
    return Cap::SupportsBreakpointLocationsRequest;
  case SetInstructionBreakpoints:
    return Cap::SupportsInstructionBreakpoints;
  case ReadMemory:
    return Cap::SupportsReadMemoryRequest;
  case WriteMemory:
    return Cap::SupportsWriteMemoryRequest;
  case Disassemble:
    return Cap::SupportsDisassembleRequest;
  case SetExceptionBreakpoints:
  case Attach:
  case Continue:
  case Disconnect:
  case Evaluate:
  case Initialize:
  case Launch:
  case Locations:
  case Next:
  case Pause:
  case Scopes:
  case SetBreakpoints:
  case Source:
  case StackTrace:
  case StepIn:
  case StepOut:
  case Threads:
  case Variables:
    return std::nullopt;
  case RunInTerminal:
  case StartDebugging:
    PANIC(fmt::format("{} is a reverse request, it's sent by the adapter", Enum<Command>::ToString(command)));
  }
  NEVER("Unhandled command");
}

Result<void>
CheckRequestCapability(const AdapterCapabilities &capabilities, Command command) noexcept
{
  // setExceptionBreakpoints has no flag of its own. It's meaningful only if the adapter declared filters.
  if (command == Command::SetExceptionBreakpoints) {
    const auto &filters = capabilities.mExceptionBreakpointFilters;
    if (!filters || filters->empty()) {
      return MakeError(ErrorCode::AdapterDoesNotSupportRequest, "setExceptionBreakpoints: no exception filters");
    }
    return {};
  }

  const auto required = RequiredCapability(command);
  if (!required || capabilities.mSupport.Contains(*required)) {
    return {};
  }

  switch (command) {
  case Command::ConfigurationDone:
    return MakeError(ErrorCode::AdapterDoesNotSupportConfigurationDone);
  case Command::Terminate:
    return MakeError(ErrorCode::AdapterDoesNotSupportTerminate);
  default:
    return MakeError(ErrorCode::AdapterDoesNotSupportRequest,
      fmt::format("{} requires {}", Enum<Command>::ToString(command), Enum<AdapterCapability>::ToString(*required)));
  }
}

} // namespace dapc
