#include "engine/lifecycle.hpp"

#include "common/time_utils.hpp"

namespace scrollkeep {

namespace {

int64_t actionTime(const LifecycleAction &action)
{
    return action.at.value_or(nowEpochMillis());
}

LifecycleSnapshot withStatus(const LifecycleSnapshot &snapshot, LifecycleStatus status)
{
    LifecycleSnapshot next = snapshot;
    next.status = status;
    return next;
}

} // namespace

LifecycleSnapshot createInitialLifecycle(std::optional<int64_t> at)
{
    return LifecycleSnapshot{LifecycleStatus::Idle, at.value_or(nowEpochMillis())};
}

LifecycleSnapshot reduceLifecycle(const LifecycleSnapshot &snapshot,
                                  const LifecycleAction &action)
{
    switch (action.type) {
    case LifecycleActionType::Start:
    case LifecycleActionType::ExitCooldown:
    case LifecycleActionType::ResumeManual:
        return LifecycleSnapshot{LifecycleStatus::Running, actionTime(action)};
    case LifecycleActionType::Activity:
        return LifecycleSnapshot{snapshot.status, actionTime(action)};
    case LifecycleActionType::EnterCooldown:
        return withStatus(snapshot, LifecycleStatus::Cooldown);
    case LifecycleActionType::PauseRateLimit:
        return withStatus(snapshot, LifecycleStatus::PausedRateLimit);
    case LifecycleActionType::MarkPendingDone:
        return withStatus(snapshot, LifecycleStatus::PendingDone);
    case LifecycleActionType::Cancel:
        return withStatus(snapshot, LifecycleStatus::Cancelled);
    case LifecycleActionType::Complete:
        return withStatus(snapshot, LifecycleStatus::Completed);
    }
    return snapshot;
}

bool shouldPromptLooksDone(const LifecycleSnapshot &snapshot,
                           const LooksDoneParams &params)
{
    if (snapshot.status != LifecycleStatus::Running) {
        return false;
    }
    if (params.responsesCaptured <= 0) {
        return false;
    }
    if (params.scrollCount <= 10) {
        return false;
    }
    if (!params.heightStable) {
        return false;
    }

    const int64_t idleFor = params.now - snapshot.lastActivityAt;
    return idleFor > params.idleThresholdMs;
}

} // namespace scrollkeep
