//
// Created by cv2 on 23.12.2025.
//

#ifdef __linux__

#include "notifier.hpp"
#include <libnotify/notify.h>
#include <print>

namespace perch {

    Notifier::Notifier(const std::string& app_name, bool enabled) : app_name_(app_name), enabled_(enabled) {
        if (!enabled_) return;

        if (!notify_init(app_name_.c_str())) {
            std::println(stderr, "[Notifier] Failed to init libnotify, desktop notifications disabled.");
            initialized_ = false;
        } else {
            initialized_ = true;
        }
    }

    Notifier::~Notifier() {
        if (initialized_) {
            notify_uninit();
        }
    }

    bool Notifier::notify(const std::string& title, const std::string& body, Urgency urgency) {
        if (!enabled()) return false;

        NotifyNotification* n = notify_notification_new(title.c_str(), body.c_str(), nullptr);
        if (!n) return false;

        notify_notification_set_urgency(n, urgency == Urgency::Critical ? NOTIFY_URGENCY_CRITICAL
                                                                       : NOTIFY_URGENCY_NORMAL);
        // Failures stay on screen until dismissed
        notify_notification_set_timeout(n, urgency == Urgency::Critical ? NOTIFY_EXPIRES_NEVER : 3000);

        GError* error = nullptr;
        if (!notify_notification_show(n, &error)) {
            std::println(stderr, "[Notifier] Error: {}", error ? error->message : "unknown");
            if (error) g_error_free(error);
            g_object_unref(G_OBJECT(n));
            return false;
        }

        g_object_unref(G_OBJECT(n));
        return true;
    }

} // namespace perch

#endif // __linux__
