#include "config_store.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

namespace {

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

std::chrono::system_clock::time_point floor_to_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::time_point_cast<std::chrono::seconds>(tp);
}

}

ConfigStore::ConfigStore(std::filesystem::path path, PostConfig defaults)
    : path_(std::move(path)), defaults_(std::move(defaults)), current_(defaults_) {}

std::filesystem::path ConfigStore::temp_path() const {
    return path_.string() + ".tmp";
}

PostConfig ConfigStore::load() {
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    std::error_code ec;
    if (std::filesystem::exists(temp_path(), ec)) {
        spdlog::warn("Removing leftover temporary config file {}", temp_path().string());
        std::filesystem::remove(temp_path(), ec);
    }

    PostConfig loaded;
    if (auto missing = read_record(loaded)) {
        spdlog::info("{} ({}), writing defaults", missing->message, to_string(missing->kind));
        auto error = persist(defaults_);
        if (error) {
            throw std::runtime_error("Failed to write default config: " + error->message);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = defaults_;
        return current_;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = loaded;
    spdlog::info("Loaded config from {}", path_.string());
    return current_;
}

std::optional<PosterError> ConfigStore::read_record(PostConfig& record) const {
    std::error_code ec;
    auto status = std::filesystem::status(path_, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return PosterError{ErrorKind::NotFound, "Config file " + path_.string() + " not found"};
    }
    if (ec) {
        throw std::runtime_error("Cannot access config file " + path_.string() + ": " + ec.message());
    }
    if (status.type() != std::filesystem::file_type::regular) {
        throw std::runtime_error("Config path " + path_.string() + " is not a regular file");
    }

    // An existing record that cannot be read must never be replaced by defaults.
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file " + path_.string() + ": " + std::strerror(errno));
    }

    try {
        auto j = nlohmann::json::parse(file);
        record = PostConfig::from_json(j);
    } catch (const std::exception& e) {
        spdlog::error("Error parsing {}: {}", path_.string(), e.what());
        throw std::runtime_error("Invalid config file " + path_.string() + ": " + e.what());
    }

    if (record.post_interval.count() <= 0) {
        throw std::runtime_error("Invalid config file " + path_.string() + ": post_interval must be positive");
    }

    return std::nullopt;
}

UpdateResult ConfigStore::update(const Mutator& mutator) {
    // Serializes writers so the file on disk always matches the last commit.
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    PostConfig previous = current();
    PostConfig candidate = previous;
    mutator(candidate);
    if (candidate.last_post_time) {
        candidate.last_post_time = floor_to_seconds(*candidate.last_post_time);
    }

    if (auto violation = candidate.validate(previous)) {
        spdlog::warn("Rejected config update: {}", *violation);
        return UpdateResult{previous, PosterError{ErrorKind::Validation, *violation}};
    }

    if (auto error = persist(candidate)) {
        return UpdateResult{previous, error};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = candidate;
    }
    return UpdateResult{candidate, std::nullopt};
}

PostConfig ConfigStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::optional<PosterError> ConfigStore::persist(const PostConfig& config) {
    const std::string data = config.to_json().dump(4) + "\n";
    const std::string tmp = temp_path().string();

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        std::string reason = std::strerror(errno);
        spdlog::error("Failed to open {}: {}", tmp, reason);
        return PosterError{ErrorKind::Persist, "Cannot write config: " + reason};
    }

    bool ok = write_all(fd, data) && ::fsync(fd) == 0;
    std::string reason = ok ? "" : std::strerror(errno);
    if (::close(fd) != 0 && ok) {
        ok = false;
        reason = std::strerror(errno);
    }

    std::error_code ec;
    if (!ok) {
        spdlog::error("Failed to write {}: {}", tmp, reason);
        std::filesystem::remove(tmp, ec);
        return PosterError{ErrorKind::Persist, "Cannot write config: " + reason};
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        reason = ec.message();
        spdlog::error("Failed to replace {}: {}", path_.string(), reason);
        std::filesystem::remove(tmp, ec);
        return PosterError{ErrorKind::Persist, "Cannot replace config: " + reason};
    }

    // The rename is durable only once the directory entry is flushed. The new
    // record is already visible, so a failure here does not undo the commit.
    sync_parent_directory();

    spdlog::info("Config saved successfully.");
    return std::nullopt;
}

void ConfigStore::sync_parent_directory() const {
    auto parent = path_.parent_path();
    const std::string dir = parent.empty() ? "." : parent.string();

    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        spdlog::warn("Failed to open directory {} for sync: {}", dir, std::strerror(errno));
        return;
    }

    if (::fsync(fd) != 0) {
        spdlog::warn("Failed to sync directory {}: {}", dir, std::strerror(errno));
    }
    ::close(fd);
}
