#pragma once
#include <chrono>
#include <string>
namespace keyward::identity::models {
struct DeviceToken {
    // Hex SHA-256 of the raw token. The raw token never reaches the store.
    std::string token_hash;
    std::string user_id;
    std::string device_name;
    std::string ip;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_used_at;
    std::chrono::system_clock::time_point expires_at;

    [[nodiscard]] bool IsExpiredAt(const std::chrono::system_clock::time_point now) const noexcept {
        return now >= expires_at;
    }
};

// Returned once from DeviceTrustManager::Trust.
struct IssuedDeviceToken {
    std::string raw_token;
    DeviceToken record;
};
}
