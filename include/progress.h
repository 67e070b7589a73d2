#pragma once
#include <functional>
#include <mutex>
#include <string>

// Процент < 0 означает аварийное завершение прогона.
static constexpr double PROGRESS_FAILED = -1.0;

struct ProgressStatus {
    double percentage = 0.0;
    std::string message = "Starting...";

    bool failed() const { return percentage < 0.0; }
};

using ProgressCallback = std::function<void(double percentage, const std::string &message)>;

// ProgressSlot: единственное общее состояние между рабочим потоком прогона
// и опрашивающими потоками. Запись и чтение целиком под мьютексом -> без "разрывов".
class ProgressSlot {
public:
    ProgressSlot() = default;

    void publish(double percentage, std::string message) {
        std::lock_guard<std::mutex> lk(m_);
        status_.percentage = percentage;
        status_.message = std::move(message);
    }

    ProgressStatus snapshot() const {
        std::lock_guard<std::mutex> lk(m_);
        return status_;
    }

    // Колбэк, пишущий в этот слот.
    ProgressCallback callback() {
        return [this](double percentage, const std::string &message) {
            publish(percentage, message);
        };
    }

private:
    mutable std::mutex m_;
    ProgressStatus status_;
};
