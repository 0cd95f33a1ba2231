#pragma once

#include "preview/image.hpp"

namespace fk::preview::pdf {

// Process-wide pdfium lifetime. Call once at startup and once at exit.
void initLibrary();
void destroyLibrary();

// Renders the first page to a JPEG that fits inside max_dim x max_dim.
Rendered resize_and_compress_buffer(const uint8_t* data, size_t size, unsigned int max_dim);

}
