#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace fk::preview {

// A rendered JPEG plus the dimensions it was rendered at.
struct Rendered {
    std::vector<uint8_t> jpeg;
    unsigned int width = 0, height = 0;
    unsigned int page_count = 0;
};

}

namespace fk::preview::image {

void compress_to_jpeg(const uint8_t* rgb_data, int width, int height, std::vector<uint8_t>& out_buf, int quality = 85);

// Fits the image inside max_dim x max_dim, preserving aspect ratio. Never upscales.
Rendered resize_and_compress_buffer(const uint8_t* data, size_t size, unsigned int max_dim);

}
