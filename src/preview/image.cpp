#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "preview/image.hpp"

#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>
#include <turbojpeg.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace fk::preview::image {

void compress_to_jpeg(const uint8_t* rgb_data, const int width, const int height, std::vector<uint8_t>& out_buf,
                      const int quality) {
    tjhandle tj = tjInitCompress();
    if (!tj) throw std::runtime_error("Failed to initialize TurboJPEG compressor");

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;

    if (tjCompress2(tj, rgb_data, width, 0, height, TJPF_RGB, &jpeg_buf, &jpeg_size, TJSAMP_420, quality, 0) != 0) {
        const std::string err = tjGetErrorStr2(tj);
        tjFree(jpeg_buf);
        tjDestroy(tj);
        throw std::runtime_error("JPEG compression failed: " + err);
    }

    out_buf.assign(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(tj);
}

Rendered resize_and_compress_buffer(const uint8_t* data, const size_t size, const unsigned int max_dim) {
    if (size < 4) throw std::runtime_error("Buffer too small to be a valid image");
    if (max_dim == 0) throw std::invalid_argument("Target size must be > 0");

    int width = 0, height = 0, channels = 0;
    unsigned char* decoded = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, 3);
    if (!decoded) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error(
            std::string("Failed to decode image from memory: ") + (reason ? reason : "unknown error"));
    }

    const float ratio = std::min({1.0f,
                                  static_cast<float>(max_dim) / static_cast<float>(width),
                                  static_cast<float>(max_dim) / static_cast<float>(height)});
    const int new_w = std::max(1, static_cast<int>(static_cast<float>(width) * ratio));
    const int new_h = std::max(1, static_cast<int>(static_cast<float>(height) * ratio));

    std::vector<uint8_t> resized(static_cast<size_t>(new_w) * new_h * 3);
    const int ok = stbir_resize_uint8(decoded, width, height, 0, resized.data(), new_w, new_h, 0, 3);
    stbi_image_free(decoded);
    if (!ok) throw std::runtime_error("Image resize failed");

    Rendered out;
    compress_to_jpeg(resized.data(), new_w, new_h, out.jpeg);
    out.width = static_cast<unsigned int>(new_w);
    out.height = static_cast<unsigned int>(new_h);
    out.page_count = 1;
    return out;
}

}
