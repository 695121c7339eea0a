#pragma once
#include <chrono>
namespace keyward::identity::interfaces {
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual std::chrono::system_clock::time_point Now() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point Now() const override {
        return std::chrono::system_clock::now();
    }
};
}
