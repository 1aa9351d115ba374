#pragma once

namespace scrollkeep {

enum class LifecycleStatus {
    Idle,
    Running,
    Cooldown,
    PausedRateLimit,
    PendingDone,
    Cancelled,
    Completed
};

enum class LifecycleActionType {
    Start,
    Activity,
    EnterCooldown,
    ExitCooldown,
    PauseRateLimit,
    ResumeManual,
    MarkPendingDone,
    Cancel,
    Complete
};

enum class RateLimitMode {
    Normal,
    Cooldown,
    Paused
};

enum class TweetItemType {
    Tweet,
    Retweet
};

} // namespace scrollkeep
