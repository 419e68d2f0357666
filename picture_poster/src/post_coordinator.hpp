#pragma once
#include "bot_transport.hpp"
#include "config_store.hpp"
#include "errors.hpp"
#include "interval_scheduler.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

enum class PostTrigger {
    Manual,
    Scheduled
};

enum class PostStatus {
    Success,
    Skipped,
    Failed
};

struct PostResult {
    PostStatus status = PostStatus::Failed;
    std::optional<PosterError> error;
    std::optional<std::chrono::system_clock::time_point> posted_at;
    FailureOutcome retry = FailureOutcome::Ignored;

    bool ok() const { return status == PostStatus::Success && !error; }
};

const char* to_string(PostTrigger trigger);

class PostCoordinator {
public:
    using NowFn = std::function<std::chrono::system_clock::time_point()>;

    PostCoordinator(ConfigStore& store, IntervalScheduler& scheduler, BotTransport& transport, NowFn now = nullptr);

    PostResult post_now(PostTrigger trigger);

private:
    PostResult attempt(PostTrigger trigger);
    std::optional<PosterError> check_ready(const PostConfig& config) const;
    PostResult fail(PostTrigger trigger, PosterError error);

    ConfigStore& store_;
    IntervalScheduler& scheduler_;
    BotTransport& transport_;
    NowFn now_;
};
