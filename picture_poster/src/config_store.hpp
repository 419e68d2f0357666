#pragma once
#include "errors.hpp"
#include "post_config.hpp"
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>

struct UpdateResult {
    PostConfig config;
    std::optional<PosterError> error;

    bool ok() const { return !error.has_value(); }
};

// Owns the persisted configuration record. Writes go to a temporary file
// which is fsync'ed and renamed over the record, so readers only ever see
// a complete old or new document.
class ConfigStore {
public:
    using Mutator = std::function<void(PostConfig&)>;

    ConfigStore(std::filesystem::path path, PostConfig defaults);

    // Reads the record, or synthesizes and persists the defaults on first run.
    // Throws std::runtime_error when an existing record cannot be read or
    // parsed, or the defaults cannot be written.
    PostConfig load();

    // Applies the mutator to a copy of the current record. The in-memory record
    // changes only after validation and the durable write both succeed.
    UpdateResult update(const Mutator& mutator);

    PostConfig current() const;

    const std::filesystem::path& path() const { return path_; }

private:
    // Returns a NotFound error when no record exists; throws when one exists
    // but cannot be read or parsed.
    std::optional<PosterError> read_record(PostConfig& record) const;
    std::optional<PosterError> persist(const PostConfig& config);
    void sync_parent_directory() const;
    std::filesystem::path temp_path() const;

    std::filesystem::path path_;
    PostConfig defaults_;
    PostConfig current_;
    mutable std::mutex mutex_;
    std::mutex write_mutex_;
};
