#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include "esp_err.h"
#include "frame_decoder.hpp"
#include "collaborators.hpp"

class SnapshotStore;

// Frame and audio heuristics for the device feed, plus the scene analysis throttle.
// Owned by the main scheduling context; not thread safe.
class PerceptionPipeline {
public:
    struct PerceptionConfig {
        float motion_threshold = 0.05f;         // fraction of changed pixels
        float noise_threshold = 500.0f;         // RMS of 16-bit PCM
        uint8_t pixel_delta = 25;               // per-pixel intensity change that counts
        uint32_t analysis_interval_ms = 30000;  // minimum gap between unforced analyses
    };

    // Microsecond monotonic clock
    using Clock = std::function<int64_t()>;

    PerceptionPipeline(const PerceptionConfig& config, FrameDecoder* decoder, VisionProvider* vision,
                       SnapshotStore* snapshots, Clock clock);

    bool detectMotion(const std::vector<uint8_t>& encoded_frame);
    bool detectMotion(const GrayFrame& frame);
    bool detectNoise(const std::vector<uint8_t>& pcm) const;

    // Scene analysis runs in three steps so the vision call can leave the owning context.
    // beginAnalysis is false when throttled, when no provider is set or while another
    // analysis is still out; nothing changes in that case.
    bool beginAnalysis(bool force);
    // Only calls the provider. Safe on any task.
    esp_err_t runAnalysis(const std::vector<uint8_t>& image, const std::string& prompt,
                          VisionResult& result) const;
    // Closes what beginAnalysis opened. A success starts the throttle interval and keeps
    // a snapshot; the return value says whether the result is usable.
    bool finishAnalysis(const std::vector<uint8_t>& image, esp_err_t status);

    bool isAnalysisPending() const { return analysis_pending_; }

    void setMonitoringEnabled(bool enabled);
    bool isMonitoringEnabled() const { return monitoring_enabled_; }

    void setMotionThreshold(float threshold);
    void setNoiseThreshold(float threshold);
    float getMotionThreshold() const { return config_.motion_threshold; }
    float getNoiseThreshold() const { return config_.noise_threshold; }

    bool hasReferenceFrame() const { return previous_frame_.valid(); }

    static float changedRatio(const GrayFrame& current, const GrayFrame& reference, uint8_t pixel_delta);
    static void resizeNearest(const GrayFrame& input, uint32_t width, uint32_t height, GrayFrame& output);
    static double computeRms(const std::vector<uint8_t>& pcm);

private:
    PerceptionConfig config_;
    FrameDecoder* decoder_;
    VisionProvider* vision_;
    SnapshotStore* snapshots_;
    Clock clock_;

    GrayFrame previous_frame_;
    bool monitoring_enabled_;
    bool has_analyzed_;
    bool analysis_pending_;
    int64_t last_analysis_us_;

    static const char* TAG;
};
