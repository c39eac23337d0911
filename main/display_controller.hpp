#pragma once

#include <string>
#include "esp_err.h"
#include "device_link.hpp"

// Local model of the device screen. Every change is pushed as a device directive.
class DisplayController {
public:
    enum class DisplayMode {
        CLOCK,
        WEATHER,
        STATUS,
        AI_LOG,
        CUSTOM
    };

    explicit DisplayController(DeviceCommandSink& device);

    // Mode names as shown in the select entity: Clock, Weather, Status, AI Log, Custom
    static bool parseMode(const std::string& name, DisplayMode& mode);
    static const char* modeName(DisplayMode mode);
    static const char* emotionFor(DisplayMode mode);
    static bool isValidEmotion(const std::string& emotion);

    void setMode(DisplayMode mode);
    void setPower(bool on);
    void showMessage(const std::string& text);
    esp_err_t showEmotion(const std::string& emotion);
    void showAlert(const std::string& status, const std::string& message, const std::string& emotion = "surprised");

    DisplayMode getMode() const { return mode_; }
    bool isPowered() const { return powered_; }

private:
    DeviceCommandSink& device_;
    DisplayMode mode_;
    bool powered_;
};
