#pragma once

#include <map>
#include <string>
#include <vector>
#include "collaborators.hpp"
#include "http_transport.hpp"

struct cJSON;

// Home Assistant REST API exposed as named tools for the broker.
class HaTools : public ToolExecutor {
public:
    HaTools(HttpTransport& transport, const std::string& api_url, const std::string& token);

    std::vector<ToolDescriptor> describeTools() const override;
    esp_err_t execute(const std::string& name, const std::string& arguments_json,
                      std::string& result, std::string& error) override;

private:
    using Handler = esp_err_t (HaTools::*)(const cJSON* args, std::string& result, std::string& error);

    esp_err_t getStates(const cJSON* args, std::string& result, std::string& error);
    esp_err_t callService(const cJSON* args, std::string& result, std::string& error);
    esp_err_t getWeather(const cJSON* args, std::string& result, std::string& error);
    esp_err_t sendNotification(const cJSON* args, std::string& result, std::string& error);
    esp_err_t getCalendar(const cJSON* args, std::string& result, std::string& error);
    esp_err_t controlMedia(const cJSON* args, std::string& result, std::string& error);

    esp_err_t request(const char* method, const std::string& path, const std::string& body,
                      std::string& result, std::string& error);

    HttpTransport& transport_;
    std::string api_url_;
    std::string token_;
    std::map<std::string, Handler> handlers_;
};
