#pragma once

#include <map>
#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include "scheduler.hpp"
#include "device_link.hpp"
#include "message_bus.hpp"
#include "collaborators.hpp"
#include "frame_decoder.hpp"
#include "http_transport.hpp"

// Runs nothing until asked. Delayed jobs are kept with their delay so tests can
// check the scheduling as well as run the job.
class FakeScheduler : public Scheduler {
public:
    struct Pending {
        uint32_t delay_ms;
        Job job;
    };

    esp_err_t post(Job job) override {
        pending.push_back(Pending{0, job});
        return ESP_OK;
    }

    esp_err_t postWait(Job job) override {
        waited++;
        pending.push_back(Pending{0, job});
        return ESP_OK;
    }

    esp_err_t postDelayed(uint32_t delay_ms, Job job) override {
        pending.push_back(Pending{delay_ms, job});
        return ESP_OK;
    }

    // Runs the jobs queued so far, not the ones they queue.
    size_t runPending() {
        std::vector<Pending> batch;
        batch.swap(pending);
        for (auto& item : batch) {
            item.job();
        }
        return batch.size();
    }

    void runAll(int max_rounds = 50) {
        while (!pending.empty() && max_rounds-- > 0) {
            runPending();
        }
    }

    std::vector<Pending> pending;
    int waited = 0;
};

class FakeLink : public DeviceLink {
public:
    esp_err_t sendText(int fd, const std::string& text) override {
        if (fail_sends) {
            return ESP_FAIL;
        }
        sent.push_back(std::make_pair(fd, text));
        return ESP_OK;
    }

    void closeLink(int fd) override {
        closed.push_back(fd);
    }

    std::vector<std::string> textsTo(int fd) const {
        std::vector<std::string> texts;
        for (const auto& entry : sent) {
            if (entry.first == fd) {
                texts.push_back(entry.second);
            }
        }
        return texts;
    }

    bool fail_sends = false;
    std::vector<std::pair<int, std::string>> sent;
    std::vector<int> closed;
};

class FakeBus : public MessageBus {
public:
    struct Publication {
        std::string topic;
        std::string payload;
        int qos;
        bool retain;
    };

    esp_err_t publish(const std::string& topic, const std::string& payload, int qos, bool retain) override {
        if (!connected) {
            return ESP_ERR_INVALID_STATE;
        }
        published.push_back(Publication{topic, payload, qos, retain});
        return ESP_OK;
    }

    esp_err_t subscribe(const std::string& topic, int qos) override {
        subscriptions.push_back(topic);
        return ESP_OK;
    }

    void setMessageCallback(MessageCallback callback) override {
        callback_ = callback;
    }

    bool isConnected() const override { return connected; }

    void deliver(const std::string& topic, const std::string& payload) {
        if (callback_) {
            callback_(topic, payload);
        }
    }

    // Payload of the last publication on `topic`, empty when none
    std::string last(const std::string& topic) const {
        for (auto it = published.rbegin(); it != published.rend(); ++it) {
            if (it->topic == topic) {
                return it->payload;
            }
        }
        return "";
    }

    size_t countOn(const std::string& topic) const {
        size_t count = 0;
        for (const auto& publication : published) {
            if (publication.topic == topic) {
                count++;
            }
        }
        return count;
    }

    bool connected = true;
    std::vector<Publication> published;
    std::vector<std::string> subscriptions;

private:
    MessageCallback callback_;
};

class FakeVision : public VisionProvider {
public:
    esp_err_t analyze(const std::vector<uint8_t>& image, const std::string& prompt,
                      VisionResult& result) override {
        calls++;
        last_prompt = prompt;
        if (fail) {
            return ESP_FAIL;
        }
        result.description = description;
        result.confidence = confidence;
        return ESP_OK;
    }

    int calls = 0;
    bool fail = false;
    std::string description = "A person at the door";
    float confidence = 1.0f;
    std::string last_prompt;
};

class FakeSpeech : public SpeechProvider {
public:
    esp_err_t recognize(const std::vector<uint8_t>& audio, std::string& recognized) override {
        calls++;
        recognized = text;
        return ESP_OK;
    }

    esp_err_t synthesize(const std::string& input, std::vector<uint8_t>& audio) override {
        return ESP_ERR_NOT_SUPPORTED;
    }

    int calls = 0;
    std::string text = "turn on the lights";
};

// "Decodes" an image by using its first byte as the intensity of a uniform 8x8 frame.
class FakeDecoder : public FrameDecoder {
public:
    esp_err_t decodeGray(const std::vector<uint8_t>& encoded, GrayFrame& frame) override {
        if (encoded.empty()) {
            return ESP_ERR_INVALID_ARG;
        }
        frame.width = 8;
        frame.height = 8;
        frame.pixels.assign(64, encoded[0]);
        return ESP_OK;
    }
};

class FakeToolExecutor : public ToolExecutor {
public:
    std::vector<ToolDescriptor> describeTools() const override {
        return tools;
    }

    esp_err_t execute(const std::string& name, const std::string& arguments_json,
                      std::string& result, std::string& error) override {
        last_name = name;
        last_arguments = arguments_json;
        if (fail_with != ESP_OK) {
            error = error_text;
            return fail_with;
        }
        result = result_text;
        return ESP_OK;
    }

    std::vector<ToolDescriptor> tools;
    std::string result_text = "ok";
    std::string error_text;
    esp_err_t fail_with = ESP_OK;
    std::string last_name;
    std::string last_arguments;
};

// Canned responses by "METHOD url"; anything else is a 404.
class FakeHttpTransport : public HttpTransport {
public:
    esp_err_t perform(const HttpRequest& request, HttpResponse& response) override {
        requests.push_back(request);
        if (fail_with != ESP_OK) {
            return fail_with;
        }
        auto it = responses.find(request.method + " " + request.url);
        if (it == responses.end()) {
            response.status = 404;
            response.body = "{\"message\":\"Entity not found.\"}";
            return ESP_OK;
        }
        response = it->second;
        return ESP_OK;
    }

    void respond(const std::string& method, const std::string& url, int status, const std::string& body) {
        HttpResponse response;
        response.status = status;
        response.body = body;
        responses[method + " " + url] = response;
    }

    std::string header(size_t index, const std::string& name) const {
        for (const auto& entry : requests.at(index).headers) {
            if (entry.first == name) {
                return entry.second;
            }
        }
        return "";
    }

    esp_err_t fail_with = ESP_OK;
    std::map<std::string, HttpResponse> responses;
    std::vector<HttpRequest> requests;
};
