#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include "esp_err.h"

// Keeps analysed frames on disk as <YYYYmmdd_HHMMSS>.jpg, bounded by age and count.
class SnapshotStore {
public:
    struct RetentionConfig {
        std::string directory = "/data/snapshots";
        size_t max_files = 100;
        uint32_t max_age_days = 7;
    };

    explicit SnapshotStore(const RetentionConfig& config);

    esp_err_t save(const std::vector<uint8_t>& image, std::string* saved_path = nullptr);

    // Removes files older than max_age_days, then the oldest files above max_files.
    // Returns the number of files removed.
    size_t cleanup();
    size_t cleanup(time_t now);

    const std::string& directory() const { return config_.directory; }

private:
    struct SnapshotFile {
        std::string path;
        time_t mtime;
    };

    esp_err_t createDirectory();
    std::vector<SnapshotFile> listSnapshots() const;

    RetentionConfig config_;
    static const char* TAG;
};
