#include "post_coordinator.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

const char* to_string(PostTrigger trigger) {
    return trigger == PostTrigger::Manual ? "manual" : "scheduled";
}

PostCoordinator::PostCoordinator(ConfigStore& store, IntervalScheduler& scheduler, BotTransport& transport, NowFn now)
    : store_(store),
      scheduler_(scheduler),
      transport_(transport),
      now_(now ? std::move(now) : NowFn([] { return std::chrono::system_clock::now(); })) {}

PostResult PostCoordinator::post_now(PostTrigger trigger) {
    // A scheduled fire must always end in notify_posted or notify_failed,
    // otherwise the scheduler stays in Firing and never arms again.
    try {
        return attempt(trigger);
    } catch (const std::exception& e) {
        return fail(trigger, PosterError{ErrorKind::Send, std::string("Unexpected error: ") + e.what()});
    }
}

PostResult PostCoordinator::attempt(PostTrigger trigger) {
    if (trigger == PostTrigger::Scheduled && !scheduler_.is_firing()) {
        spdlog::info("Skipping scheduled post, schedule already advanced");
        PostResult result;
        result.status = PostStatus::Skipped;
        return result;
    }

    PostConfig config = store_.current();

    if (auto error = check_ready(config)) {
        return fail(trigger, *error);
    }

    spdlog::info("Posting {} to {} ({})", config.picture_path, config.channel_name, to_string(trigger));
    SendResult sent = transport_.send_photo(config.channel_name, config.picture_path);
    if (!sent.ok) {
        return fail(trigger, PosterError{ErrorKind::Send, sent.error});
    }

    auto posted_at = std::chrono::time_point_cast<std::chrono::seconds>(now_());

    PostResult result;
    result.status = PostStatus::Success;
    result.posted_at = posted_at;

    auto updated = store_.update([posted_at](PostConfig& c) { c.last_post_time = posted_at; });
    if (!updated.ok()) {
        // The photo is out; a restart will repost it rather than skip a cycle.
        spdlog::error("Picture posted but last post time was not saved: {}", updated.error->message);
        result.error = updated.error;
    }

    scheduler_.notify_posted(posted_at);
    spdlog::info("Picture posted to {}", config.channel_name);
    return result;
}

std::optional<PosterError> PostCoordinator::check_ready(const PostConfig& config) const {
    if (config.channel_name.empty()) {
        return PosterError{ErrorKind::Validation, "No channel set. Use /setchannel @channel_name."};
    }

    if (config.picture_path.empty()) {
        return PosterError{ErrorKind::Validation, "No picture set. Reply to a photo with /setpicture."};
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config.picture_path, ec)) {
        return PosterError{ErrorKind::Validation, "Picture not found: " + config.picture_path};
    }

    std::ifstream picture(config.picture_path, std::ios::binary);
    if (!picture.is_open()) {
        return PosterError{ErrorKind::Validation, "Picture is not readable: " + config.picture_path};
    }

    return std::nullopt;
}

PostResult PostCoordinator::fail(PostTrigger trigger, PosterError error) {
    spdlog::error("Error posting picture ({}): {}", to_string(trigger), error.message);

    PostResult result;
    result.status = PostStatus::Failed;
    if (trigger == PostTrigger::Scheduled) {
        result.retry = scheduler_.notify_failed(error.message);
    }
    result.error = std::move(error);
    return result;
}
