#pragma once
#include <cstdint>

// Single-admin authorization: only the configured Telegram user may issue
// commands.
class AdminAuth {
public:
    explicit AdminAuth(int64_t admin_id);

    bool is_authorized(int64_t tg_user_id) const;
    int64_t admin_id() const { return admin_id_; }

private:
    const int64_t admin_id_;
};
