//
// Created by cv2 on 23.12.2025.
//

#pragma once
#include <string>

namespace perch {

    enum class Urgency {
        Normal,
        Critical
    };

    class Notifier {
    public:
        Notifier(const std::string& app_name, bool enabled = true);
        ~Notifier();

        Notifier(const Notifier&) = delete;
        Notifier& operator=(const Notifier&) = delete;

        // Send a desktop notification
        // Returns true if dispatched successfully, false when disabled or failed
        bool notify(const std::string& title, const std::string& body, Urgency urgency = Urgency::Normal);

        bool enabled() const { return enabled_ && initialized_; }

    private:
        std::string app_name_;
        bool enabled_ = true;
        bool initialized_ = false;
    };

} // namespace perch
