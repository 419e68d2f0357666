#include "auth.hpp"
#include <spdlog/spdlog.h>

AdminAuth::AdminAuth(int64_t admin_id) : admin_id_(admin_id) {}

bool AdminAuth::is_authorized(int64_t tg_user_id) const {
    if (admin_id_ != 0 && tg_user_id == admin_id_) {
        return true;
    }

    spdlog::info("Authentication denied for user ID: {}", tg_user_id);
    return false;
}
