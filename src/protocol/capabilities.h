/** LICENSE TEMPLATE */
#pragma once

// dapc
#include <common/macros.h>
#include <protocol/dap_defs.h>
#include <protocol/error.h>
#include <protocol/types.h>
#include <protocol/value.h>

// std
#include <bitset>
#include <optional>
#include <string_view>
#include <vector>

namespace dapc {

// Capabilities are matched by their exact field name, so the name column below is the protocol's spelling.
#define FOR_EACH_CLIENT_CAPABILITY(ITEM)                                                                          \
  ITEM(SupportsVariableType, "supportsVariableType")                                                              \
  ITEM(SupportsVariablePaging, "supportsVariablePaging")                                                          \
  ITEM(SupportsRunInTerminalRequest, "supportsRunInTerminalRequest")                                              \
  ITEM(SupportsMemoryReferences, "supportsMemoryReferences")                                                      \
  ITEM(SupportsProgressReporting, "supportsProgressReporting")                                                    \
  ITEM(SupportsInvalidatedEvent, "supportsInvalidatedEvent")                                                      \
  ITEM(SupportsMemoryEvent, "supportsMemoryEvent")                                                                \
  ITEM(SupportsArgsCanBeInterpretedByShell, "supportsArgsCanBeInterpretedByShell")                                \
  ITEM(SupportsStartDebuggingRequest, "supportsStartDebuggingRequest")                                            \
  ITEM(SupportsANSIStyling, "supportsANSIStyling")

ENUM_TYPE_METADATA(ClientCapability, FOR_EACH_CLIENT_CAPABILITY, u8)

#define FOR_EACH_ADAPTER_CAPABILITY(ITEM)                                                                         \
  ITEM(SupportsConfigurationDoneRequest, "supportsConfigurationDoneRequest")                                      \
  ITEM(SupportsFunctionBreakpoints, "supportsFunctionBreakpoints")                                                \
  ITEM(SupportsConditionalBreakpoints, "supportsConditionalBreakpoints")                                          \
  ITEM(SupportsHitConditionalBreakpoints, "supportsHitConditionalBreakpoints")                                    \
  ITEM(SupportsEvaluateForHovers, "supportsEvaluateForHovers")                                                    \
  ITEM(SupportsStepBack, "supportsStepBack")                                                                      \
  ITEM(SupportsSetVariable, "supportsSetVariable")                                                                \
  ITEM(SupportsRestartFrame, "supportsRestartFrame")                                                              \
  ITEM(SupportsGotoTargetsRequest, "supportsGotoTargetsRequest")                                                  \
  ITEM(SupportsStepInTargetsRequest, "supportsStepInTargetsRequest")                                              \
  ITEM(SupportsCompletionsRequest, "supportsCompletionsRequest")                                                  \
  ITEM(SupportsModulesRequest, "supportsModulesRequest")                                                          \
  ITEM(SupportsRestartRequest, "supportsRestartRequest")                                                          \
  ITEM(SupportsExceptionOptions, "supportsExceptionOptions")                                                      \
  ITEM(SupportsValueFormattingOptions, "supportsValueFormattingOptions")                                          \
  ITEM(SupportsExceptionInfoRequest, "supportsExceptionInfoRequest")                                              \
  ITEM(SupportTerminateDebuggee, "supportTerminateDebuggee")                                                      \
  ITEM(SupportSuspendDebuggee, "supportSuspendDebuggee")                                                          \
  ITEM(SupportsDelayedStackTraceLoading, "supportsDelayedStackTraceLoading")                                      \
  ITEM(SupportsLoadedSourcesRequest, "supportsLoadedSourcesRequest")                                              \
  ITEM(SupportsLogPoints, "supportsLogPoints")                                                                    \
  ITEM(SupportsTerminateThreadsRequest, "supportsTerminateThreadsRequest")                                        \
  ITEM(SupportsSetExpression, "supportsSetExpression")                                                            \
  ITEM(SupportsTerminateRequest, "supportsTerminateRequest")                                                      \
  ITEM(SupportsDataBreakpoints, "supportsDataBreakpoints")                                                        \
  ITEM(SupportsReadMemoryRequest, "supportsReadMemoryRequest")                                                    \
  ITEM(SupportsWriteMemoryRequest, "supportsWriteMemoryRequest")                                                  \
  ITEM(SupportsDisassembleRequest, "supportsDisassembleRequest")                                                  \
  ITEM(SupportsCancelRequest, "supportsCancelRequest")                                                            \
  ITEM(SupportsBreakpointLocationsRequest, "supportsBreakpointLocationsRequest")                                  \
  ITEM(SupportsClipboardContext, "supportsClipboardContext")                                                      \
  ITEM(SupportsSteppingGranularity, "supportsSteppingGranularity")                                                \
  ITEM(SupportsInstructionBreakpoints, "supportsInstructionBreakpoints")                                          \
  ITEM(SupportsExceptionFilterOptions, "supportsExceptionFilterOptions")                                          \
  ITEM(SupportsSingleThreadExecutionRequests, "supportsSingleThreadExecutionRequests")                            \
  ITEM(SupportsANSIStyling, "supportsANSIStyling")

ENUM_TYPE_METADATA(AdapterCapability, FOR_EACH_ADAPTER_CAPABILITY, u8)

// A fixed set of flags of a closed enumeration.
template <typename E> class EnumSet
{
  std::bitset<Enum<E>::Count()> mBits{};

public:
  constexpr EnumSet() noexcept = default;

  void
  Insert(E value) noexcept
  {
    mBits.set(std::to_underlying(value));
  }

  bool
  Contains(E value) const noexcept
  {
    return mBits.test(std::to_underlying(value));
  }

  size_t
  Count() const noexcept
  {
    return mBits.count();
  }

  bool
  Empty() const noexcept
  {
    return mBits.none();
  }

  bool operator==(const EnumSet &) const noexcept = default;

  // Every flag whose name is a `true` boolean field of `object`. Non-boolean and absent fields count as unset.
  static EnumSet
  FromObject(const Value &object) noexcept
  {
    EnumSet result{};
    for (const auto flag : Enum<E>::Variants()) {
      if (GetBool(object, Enum<E>::ToString(flag)).value_or(false)) {
        result.Insert(flag);
      }
    }
    return result;
  }
};

using ClientCapabilitySet = EnumSet<ClientCapability>;
using AdapterCapabilitySet = EnumSet<AdapterCapability>;

// What the adapter declared in its initialize response. The auxiliary arrays are deep copies whose strings are
// owned by the session's scratch storage.
struct AdapterCapabilities
{
  AdapterCapabilitySet mSupport{};
  std::optional<std::vector<std::string_view>> mCompletionTriggerCharacters;
  std::optional<std::vector<ExceptionBreakpointsFilter>> mExceptionBreakpointFilters;
  std::optional<std::vector<ColumnDescriptor>> mAdditionalModuleColumns;
  std::optional<std::vector<ChecksumAlgorithm>> mSupportedChecksumAlgorithms;
  std::optional<std::vector<BreakpointMode>> mBreakpointModes;
};

// The capability a request is gated on. Requests that every adapter must support map to nullopt.
std::optional<AdapterCapability> RequiredCapability(Command command) noexcept;

// Whether `command` may be sent to an adapter that declared `capabilities`. Fails with the error that describes
// the missing capability.
Result<void> CheckRequestCapability(const AdapterCapabilities &capabilities, Command command) noexcept;

} // namespace dapc
