#pragma once

#include <vector>
#include <cstdint>
#include "esp_err.h"

// 8-bit greyscale image, row major.
struct GrayFrame {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    bool valid() const { return width > 0 && height > 0 && pixels.size() == width * height; }
};

class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    virtual esp_err_t decodeGray(const std::vector<uint8_t>& encoded, GrayFrame& frame) = 0;
};

// JPEG decoder from esp32-camera. Decodes at 1/2 scale, which is plenty for frame diffing.
class JpegFrameDecoder : public FrameDecoder {
public:
    esp_err_t decodeGray(const std::vector<uint8_t>& encoded, GrayFrame& frame) override;

private:
    static size_t readCallback(void* arg, size_t index, uint8_t* buf, size_t len);
    static bool writeCallback(void* arg, uint16_t x, uint16_t y, uint16_t w, uint16_t h, uint8_t* data);

    static const char* TAG;
};
