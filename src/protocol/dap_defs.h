/** LICENSE TEMPLATE */
#pragma once

// dapc
#include <common/macros.h>

namespace dapc {

#define FOR_EACH_MESSAGE_TYPE(ITEM)                                                                               \
  ITEM(Request, "request")                                                                                        \
  ITEM(Response, "response")                                                                                      \
  ITEM(Event, "event")

ENUM_TYPE_METADATA(MessageType, FOR_EACH_MESSAGE_TYPE, u8)

// Requests of the debug adapter protocol. The last two are reverse requests, sent by the adapter to us.
#define FOR_EACH_COMMAND(ITEM)                                                                                    \
  ITEM(Attach, "attach")                                                                                          \
  ITEM(BreakpointLocations, "breakpointLocations")                                                                \
  ITEM(Cancel, "cancel")                                                                                          \
  ITEM(Completions, "completions")                                                                                \
  ITEM(ConfigurationDone, "configurationDone")                                                                    \
  ITEM(Continue, "continue")                                                                                      \
  ITEM(DataBreakpointInfo, "dataBreakpointInfo")                                                                  \
  ITEM(Disassemble, "disassemble")                                                                                \
  ITEM(Disconnect, "disconnect")                                                                                  \
  ITEM(Evaluate, "evaluate")                                                                                      \
  ITEM(ExceptionInfo, "exceptionInfo")                                                                            \
  ITEM(Goto, "goto")                                                                                              \
  ITEM(GotoTargets, "gotoTargets")                                                                                \
  ITEM(Initialize, "initialize")                                                                                  \
  ITEM(Launch, "launch")                                                                                          \
  ITEM(LoadedSources, "loadedSources")                                                                            \
  ITEM(Locations, "locations")                                                                                    \
  ITEM(Modules, "modules")                                                                                        \
  ITEM(Next, "next")                                                                                              \
  ITEM(Pause, "pause")                                                                                            \
  ITEM(ReadMemory, "readMemory")                                                                                  \
  ITEM(Restart, "restart")                                                                                        \
  ITEM(RestartFrame, "restartFrame")                                                                              \
  ITEM(ReverseContinue, "reverseContinue")                                                                        \
  ITEM(Scopes, "scopes")                                                                                          \
  ITEM(SetBreakpoints, "setBreakpoints")                                                                          \
  ITEM(SetDataBreakpoints, "setDataBreakpoints")                                                                  \
  ITEM(SetExceptionBreakpoints, "setExceptionBreakpoints")                                                        \
  ITEM(SetExpression, "setExpression")                                                                            \
  ITEM(SetFunctionBreakpoints, "setFunctionBreakpoints")                                                          \
  ITEM(SetInstructionBreakpoints, "setInstructionBreakpoints")                                                    \
  ITEM(SetVariable, "setVariable")                                                                                \
  ITEM(Source, "source")                                                                                          \
  ITEM(StackTrace, "stackTrace")                                                                                  \
  ITEM(StepBack, "stepBack")                                                                                      \
  ITEM(StepIn, "stepIn")                                                                                          \
  ITEM(StepInTargets, "stepInTargets")                                                                            \
  ITEM(StepOut, "stepOut")                                                                                        \
  ITEM(Terminate, "terminate")                                                                                    \
  ITEM(TerminateThreads, "terminateThreads")                                                                      \
  ITEM(Threads, "threads")                                                                                        \
  ITEM(Variables, "variables")                                                                                    \
  ITEM(WriteMemory, "writeMemory")                                                                                \
  ITEM(RunInTerminal, "runInTerminal")                                                                            \
  ITEM(StartDebugging, "startDebugging")

ENUM_TYPE_METADATA(Command, FOR_EACH_COMMAND, u8)

constexpr bool
IsReverseRequest(Command command) noexcept
{
  return command == Command::RunInTerminal || command == Command::StartDebugging;
}

#define FOR_EACH_EVENT(ITEM)                                                                                      \
  ITEM(Breakpoint, "breakpoint")                                                                                  \
  ITEM(Capabilities, "capabilities")                                                                              \
  ITEM(Continued, "continued")                                                                                    \
  ITEM(Exited, "exited")                                                                                          \
  ITEM(Initialized, "initialized")                                                                                \
  ITEM(Invalidated, "invalidated")                                                                                \
  ITEM(LoadedSource, "loadedSource")                                                                              \
  ITEM(Memory, "memory")                                                                                          \
  ITEM(Module, "module")                                                                                          \
  ITEM(Output, "output")                                                                                          \
  ITEM(Process, "process")                                                                                        \
  ITEM(ProgressEnd, "progressEnd")                                                                                \
  ITEM(ProgressStart, "progressStart")                                                                            \
  ITEM(ProgressUpdate, "progressUpdate")                                                                          \
  ITEM(Stopped, "stopped")                                                                                        \
  ITEM(Terminated, "terminated")                                                                                  \
  ITEM(Thread, "thread")

ENUM_TYPE_METADATA(EventKind, FOR_EACH_EVENT, u8)

// `Attached` is reserved: attaching to a running debuggee is not implemented.
#define FOR_EACH_SESSION_STATE(ITEM)                                                                              \
  ITEM(NotStarted, "not_started")                                                                                 \
  ITEM(Launched, "launched")                                                                                      \
  ITEM(Attached, "attached")                                                                                      \
  ITEM(Terminated, "terminated")

ENUM_TYPE_METADATA(SessionState, FOR_EACH_SESSION_STATE, u8)

#define FOR_EACH_END_SESSION_MODE(ITEM)                                                                           \
  ITEM(Terminate, "terminate")                                                                                    \
  ITEM(Disconnect, "disconnect")

ENUM_TYPE_METADATA(EndSessionMode, FOR_EACH_END_SESSION_MODE, u8)

} // namespace dapc
