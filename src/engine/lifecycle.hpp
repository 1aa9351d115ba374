#pragma once

#include <cstdint>
#include <optional>

#include "common/models.hpp"

namespace scrollkeep {

struct LooksDoneParams {
    int64_t now = 0;
    int64_t idleThresholdMs = 0;
    int scrollCount = 0;
    int responsesCaptured = 0;
    bool heightStable = false;
};

LifecycleSnapshot createInitialLifecycle(std::optional<int64_t> at = std::nullopt);

// Pure reducer over export phases. Every action is accepted in every status;
// start/exit_cooldown/resume_manual/activity refresh lastActivityAt, the
// others keep it.
LifecycleSnapshot reduceLifecycle(const LifecycleSnapshot &snapshot,
                                  const LifecycleAction &action);

inline LifecycleAction makeAction(LifecycleActionType type,
                                  std::optional<int64_t> at = std::nullopt)
{
    return LifecycleAction{type, at};
}

// All guards must pass: running, at least one response, more than ten
// scrolls, stable page extent, and idle for longer than the threshold.
bool shouldPromptLooksDone(const LifecycleSnapshot &snapshot,
                           const LooksDoneParams &params);

} // namespace scrollkeep
