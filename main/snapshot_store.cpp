#include "snapshot_store.hpp"
#include "esp_log.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

const char* SnapshotStore::TAG = "SnapshotStore";

SnapshotStore::SnapshotStore(const RetentionConfig& config) : config_(config) {
}

esp_err_t SnapshotStore::save(const std::vector<uint8_t>& image, std::string* saved_path) {
    esp_err_t ret = createDirectory();
    if (ret != ESP_OK) {
        return ret;
    }

    time_t now = time(nullptr);
    struct tm timeinfo;
    localtime_r(&now, &timeinfo);
    char filename[32];
    strftime(filename, sizeof(filename), "%Y%m%d_%H%M%S.jpg", &timeinfo);
    std::string path = config_.directory + "/" + filename;

    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        ESP_LOGE(TAG, "Failed to open %s: %s", path.c_str(), strerror(errno));
        return ESP_FAIL;
    }
    size_t written = fwrite(image.data(), 1, image.size(), file);
    fclose(file);
    if (written != image.size()) {
        ESP_LOGE(TAG, "Short write to %s (%zu of %zu bytes)", path.c_str(), written, image.size());
        unlink(path.c_str());
        return ESP_FAIL;
    }

    ESP_LOGD(TAG, "Saved snapshot: %s", path.c_str());
    if (saved_path) {
        *saved_path = path;
    }

    cleanup(now);
    return ESP_OK;
}

size_t SnapshotStore::cleanup() {
    return cleanup(time(nullptr));
}

size_t SnapshotStore::cleanup(time_t now) {
    size_t removed = 0;
    const time_t max_age_seconds = static_cast<time_t>(config_.max_age_days) * 24 * 60 * 60;

    for (const auto& file : listSnapshots()) {
        if (now - file.mtime > max_age_seconds) {
            if (unlink(file.path.c_str()) == 0) {
                ESP_LOGD(TAG, "Deleted old snapshot: %s", file.path.c_str());
                removed++;
            } else {
                ESP_LOGW(TAG, "Failed to delete %s: %s", file.path.c_str(), strerror(errno));
            }
        }
    }

    std::vector<SnapshotFile> remaining = listSnapshots();
    if (remaining.size() > config_.max_files) {
        std::sort(remaining.begin(), remaining.end(),
                  [](const SnapshotFile& a, const SnapshotFile& b) { return a.mtime < b.mtime; });

        size_t excess = remaining.size() - config_.max_files;
        for (size_t i = 0; i < excess; ++i) {
            if (unlink(remaining[i].path.c_str()) == 0) {
                ESP_LOGD(TAG, "Deleted excess snapshot: %s", remaining[i].path.c_str());
                removed++;
            } else {
                ESP_LOGW(TAG, "Failed to delete %s: %s", remaining[i].path.c_str(), strerror(errno));
            }
        }
    }

    if (removed > 0) {
        ESP_LOGI(TAG, "Snapshot cleanup removed %zu files", removed);
    }
    return removed;
}

esp_err_t SnapshotStore::createDirectory() {
    struct stat st;
    if (stat(config_.directory.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return ESP_OK;
        }
        ESP_LOGE(TAG, "Snapshot path exists but is not a directory: %s", config_.directory.c_str());
        return ESP_ERR_INVALID_STATE;
    }

    if (mkdir(config_.directory.c_str(), 0755) == 0) {
        ESP_LOGI(TAG, "Created snapshot directory: %s", config_.directory.c_str());
        return ESP_OK;
    }

    ESP_LOGE(TAG, "Failed to create snapshot directory %s: %s", config_.directory.c_str(), strerror(errno));
    return ESP_FAIL;
}

std::vector<SnapshotStore::SnapshotFile> SnapshotStore::listSnapshots() const {
    std::vector<SnapshotFile> files;

    DIR* dir = opendir(config_.directory.c_str());
    if (!dir) {
        return files;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name.size() < 5 || name.compare(name.size() - 4, 4, ".jpg") != 0) {
            continue;
        }
        std::string path = config_.directory + "/" + name;
        struct stat st;
        if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            continue;
        }
        files.push_back(SnapshotFile{path, st.st_mtime});
    }
    closedir(dir);
    return files;
}
