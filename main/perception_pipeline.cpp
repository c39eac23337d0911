#include "perception_pipeline.hpp"
#include "snapshot_store.hpp"
#include "esp_log.h"
#include <algorithm>
#include <cmath>

const char* PerceptionPipeline::TAG = "Perception";

PerceptionPipeline::PerceptionPipeline(const PerceptionConfig& config, FrameDecoder* decoder,
                                       VisionProvider* vision, SnapshotStore* snapshots, Clock clock)
    : config_(config)
    , decoder_(decoder)
    , vision_(vision)
    , snapshots_(snapshots)
    , clock_(clock)
    , monitoring_enabled_(false)
    , has_analyzed_(false)
    , analysis_pending_(false)
    , last_analysis_us_(0)
{
    setMotionThreshold(config.motion_threshold);
    setNoiseThreshold(config.noise_threshold);
}

bool PerceptionPipeline::detectMotion(const std::vector<uint8_t>& encoded_frame) {
    GrayFrame frame;
    if (!decoder_ || decoder_->decodeGray(encoded_frame, frame) != ESP_OK) {
        ESP_LOGW(TAG, "Motion detection skipped: frame could not be decoded");
        previous_frame_ = GrayFrame{};
        return false;
    }
    return detectMotion(frame);
}

bool PerceptionPipeline::detectMotion(const GrayFrame& frame) {
    if (!frame.valid()) {
        previous_frame_ = GrayFrame{};
        return false;
    }

    if (!previous_frame_.valid()) {
        previous_frame_ = frame;
        return false;
    }

    float ratio;
    if (previous_frame_.width != frame.width || previous_frame_.height != frame.height) {
        GrayFrame resized;
        resizeNearest(previous_frame_, frame.width, frame.height, resized);
        ratio = changedRatio(frame, resized, config_.pixel_delta);
    } else {
        ratio = changedRatio(frame, previous_frame_, config_.pixel_delta);
    }

    previous_frame_ = frame;

    bool motion = ratio > config_.motion_threshold;
    if (motion) {
        ESP_LOGD(TAG, "Motion detected: %.2f%% pixels changed", ratio * 100.0f);
    }
    return motion;
}

bool PerceptionPipeline::detectNoise(const std::vector<uint8_t>& pcm) const {
    if (pcm.size() < 2) {
        return false;
    }

    double rms = computeRms(pcm);
    bool noise = rms > config_.noise_threshold;
    if (noise) {
        ESP_LOGD(TAG, "Noise detected: RMS=%.2f", rms);
    }
    return noise;
}

bool PerceptionPipeline::beginAnalysis(bool force) {
    if (analysis_pending_) {
        ESP_LOGD(TAG, "Vision analysis already running");
        return false;
    }

    int64_t now = clock_ ? clock_() : 0;
    int64_t interval_us = static_cast<int64_t>(config_.analysis_interval_ms) * 1000;
    if (!force && has_analyzed_ && (now - last_analysis_us_) < interval_us) {
        ESP_LOGD(TAG, "Vision analysis rate limited");
        return false;
    }

    if (!vision_) {
        ESP_LOGW(TAG, "No vision provider configured");
        return false;
    }

    analysis_pending_ = true;
    return true;
}

esp_err_t PerceptionPipeline::runAnalysis(const std::vector<uint8_t>& image, const std::string& prompt,
                                          VisionResult& result) const {
    if (!vision_) {
        return ESP_ERR_INVALID_STATE;
    }
    return vision_->analyze(image, prompt, result);
}

bool PerceptionPipeline::finishAnalysis(const std::vector<uint8_t>& image, esp_err_t status) {
    analysis_pending_ = false;
    if (status != ESP_OK) {
        ESP_LOGE(TAG, "Vision analysis failed: %s", esp_err_to_name(status));
        return false;
    }

    has_analyzed_ = true;
    last_analysis_us_ = clock_ ? clock_() : 0;

    if (snapshots_) {
        esp_err_t save_ret = snapshots_->save(image);
        if (save_ret != ESP_OK) {
            ESP_LOGW(TAG, "Snapshot not saved: %s", esp_err_to_name(save_ret));
        }
    }
    return true;
}

void PerceptionPipeline::setMonitoringEnabled(bool enabled) {
    monitoring_enabled_ = enabled;
    ESP_LOGI(TAG, "Monitoring %s", enabled ? "enabled" : "disabled");
}

void PerceptionPipeline::setMotionThreshold(float threshold) {
    config_.motion_threshold = std::max(0.0f, std::min(1.0f, threshold));
    ESP_LOGI(TAG, "Motion threshold set to %.2f%%", config_.motion_threshold * 100.0f);
}

void PerceptionPipeline::setNoiseThreshold(float threshold) {
    config_.noise_threshold = std::max(0.0f, threshold);
    ESP_LOGI(TAG, "Noise threshold set to %.2f", config_.noise_threshold);
}

float PerceptionPipeline::changedRatio(const GrayFrame& current, const GrayFrame& reference, uint8_t pixel_delta) {
    size_t total = std::min(current.pixels.size(), reference.pixels.size());
    if (total == 0) {
        return 0.0f;
    }

    uint32_t changed = 0;
    for (size_t i = 0; i < total; ++i) {
        int diff = static_cast<int>(current.pixels[i]) - static_cast<int>(reference.pixels[i]);
        if (std::abs(diff) > pixel_delta) {
            changed++;
        }
    }
    return static_cast<float>(changed) / static_cast<float>(total);
}

void PerceptionPipeline::resizeNearest(const GrayFrame& input, uint32_t width, uint32_t height, GrayFrame& output) {
    output.width = width;
    output.height = height;
    output.pixels.assign(static_cast<size_t>(width) * height, 0);
    if (!input.valid()) {
        return;
    }

    for (uint32_t y = 0; y < height; ++y) {
        uint32_t src_y = static_cast<uint32_t>((static_cast<uint64_t>(y) * input.height) / height);
        for (uint32_t x = 0; x < width; ++x) {
            uint32_t src_x = static_cast<uint32_t>((static_cast<uint64_t>(x) * input.width) / width);
            output.pixels[y * width + x] = input.pixels[src_y * input.width + src_x];
        }
    }
}

double PerceptionPipeline::computeRms(const std::vector<uint8_t>& pcm) {
    size_t samples = pcm.size() / 2;
    if (samples == 0) {
        return 0.0;
    }

    double sum = 0.0;
    for (size_t i = 0; i < samples; ++i) {
        int16_t sample = static_cast<int16_t>(pcm[2 * i] | (pcm[2 * i + 1] << 8));
        sum += static_cast<double>(sample) * sample;
    }
    return std::sqrt(sum / samples);
}
