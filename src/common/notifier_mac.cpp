#ifdef __APPLE__

#include "notifier.hpp"
#include <string>
#include <cstdlib>

namespace perch {

// Escape double quotes and backslashes for an AppleScript string literal,
// and single quotes for the surrounding shell quoting
static std::string escape_for_osascript(const std::string& input) {
    std::string output;
    output.reserve(input.size());
    for (char c : input) {
        if (c == '"' || c == '\\') {
            output.push_back('\\');
            output.push_back(c);
        } else if (c == '\'') {
            output += "'\\''";
        } else {
            output.push_back(c);
        }
    }
    return output;
}

Notifier::Notifier(const std::string& app_name, bool enabled) : app_name_(app_name), enabled_(enabled) {
    initialized_ = true;
}

Notifier::~Notifier() {}

bool Notifier::notify(const std::string& title, const std::string& body, Urgency urgency) {
    if (!enabled()) return false;

    std::string command = "osascript -e 'display notification \"" + escape_for_osascript(body) +
                          "\" with title \"" + escape_for_osascript(app_name_) +
                          "\" subtitle \"" + escape_for_osascript(title) + "\"";
    if (urgency == Urgency::Critical) command += " sound name \"Basso\"";
    command += "'";

    return std::system(command.c_str()) == 0;
}

} // namespace perch

#endif // __APPLE__
