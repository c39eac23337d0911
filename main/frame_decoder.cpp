#include "frame_decoder.hpp"
#include "esp_log.h"
#include "esp_jpg_decode.h"
#include <cstring>
#include <inttypes.h>

const char* JpegFrameDecoder::TAG = "FrameDecoder";

struct DecodeContext {
    const std::vector<uint8_t>* source;
    GrayFrame* frame;
    bool overflow;
};

esp_err_t JpegFrameDecoder::decodeGray(const std::vector<uint8_t>& encoded, GrayFrame& frame) {
    if (encoded.size() < 4 || encoded[0] != 0xFF || encoded[1] != 0xD8) {
        ESP_LOGD(TAG, "Not a JPEG image (%zu bytes)", encoded.size());
        return ESP_ERR_INVALID_ARG;
    }

    frame = GrayFrame{};
    DecodeContext ctx{&encoded, &frame, false};

    esp_err_t ret = esp_jpg_decode(encoded.size(), JPG_SCALE_2X, readCallback, writeCallback, &ctx);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "JPEG decode failed: %s", esp_err_to_name(ret));
        return ret;
    }
    if (!frame.valid()) {
        ESP_LOGW(TAG, "JPEG decode produced no image");
        return ESP_FAIL;
    }
    if (ctx.overflow) {
        ESP_LOGD(TAG, "Clipped decoder blocks outside %" PRIu32 "x%" PRIu32, frame.width, frame.height);
    }
    return ESP_OK;
}

size_t JpegFrameDecoder::readCallback(void* arg, size_t index, uint8_t* buf, size_t len) {
    DecodeContext* ctx = static_cast<DecodeContext*>(arg);
    const std::vector<uint8_t>& source = *ctx->source;

    if (index >= source.size()) {
        return 0;
    }
    if (len > source.size() - index) {
        len = source.size() - index;
    }
    // A null buffer asks the decoder to skip ahead
    if (buf) {
        memcpy(buf, source.data() + index, len);
    }
    return len;
}

bool JpegFrameDecoder::writeCallback(void* arg, uint16_t x, uint16_t y, uint16_t w, uint16_t h, uint8_t* data) {
    DecodeContext* ctx = static_cast<DecodeContext*>(arg);
    GrayFrame& frame = *ctx->frame;

    if (!data) {
        // Start of image reports the output size, end of image reports nothing
        if (x == 0 && y == 0 && frame.pixels.empty()) {
            frame.width = w;
            frame.height = h;
            frame.pixels.assign(static_cast<size_t>(w) * h, 0);
        }
        return true;
    }

    for (uint16_t row = 0; row < h; ++row) {
        uint32_t dst_y = y + row;
        for (uint16_t col = 0; col < w; ++col) {
            uint32_t dst_x = x + col;
            if (dst_x >= frame.width || dst_y >= frame.height) {
                ctx->overflow = true;
                continue;
            }
            const uint8_t* rgb = data + (row * w + col) * 3;
            // ITU-R BT.601 luma, integer form
            frame.pixels[dst_y * frame.width + dst_x] =
                static_cast<uint8_t>((rgb[0] * 77 + rgb[1] * 150 + rgb[2] * 29) >> 8);
        }
    }
    return true;
}
