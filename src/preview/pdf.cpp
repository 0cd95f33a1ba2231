#include "preview/pdf.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <pdfium/fpdfview.h>

namespace fk::preview::pdf {

namespace {

struct DocCloser {
    void operator()(fpdf_document_t__* d) const { FPDF_CloseDocument(d); }
};

struct PageCloser {
    void operator()(fpdf_page_t__* p) const { FPDF_ClosePage(p); }
};

struct BitmapDestroyer {
    void operator()(fpdf_bitmap_t__* b) const { FPDFBitmap_Destroy(b); }
};

// pdfium is not thread-safe; every call into it goes through this lock.
std::mutex pdfiumMutex;

}

void initLibrary() {
    std::scoped_lock lock(pdfiumMutex);
    FPDF_LIBRARY_CONFIG config{};
    config.version = 3;
    config.m_pUserFontPaths = nullptr;
    config.m_pIsolate = nullptr;
    config.m_v8EmbedderSlot = 0;
    FPDF_InitLibraryWithConfig(&config);
}

void destroyLibrary() {
    std::scoped_lock lock(pdfiumMutex);
    FPDF_DestroyLibrary();
}

Rendered resize_and_compress_buffer(const uint8_t* data, const size_t size, const unsigned int max_dim) {
    if (max_dim == 0) throw std::invalid_argument("Target size must be > 0");

    int pages = 0, new_w = 0, new_h = 0;
    std::vector<uint8_t> rgb;
    {
        std::scoped_lock lock(pdfiumMutex);

        const std::unique_ptr<fpdf_document_t__, DocCloser> doc(
            FPDF_LoadMemDocument(data, static_cast<int>(size), nullptr));
        if (!doc) throw std::runtime_error("Failed to load PDF from memory (error " + std::to_string(FPDF_GetLastError()) + ")");

        pages = FPDF_GetPageCount(doc.get());
        const std::unique_ptr<fpdf_page_t__, PageCloser> page(FPDF_LoadPage(doc.get(), 0));
        if (!page) throw std::runtime_error("Failed to load first page");

        const double width = FPDF_GetPageWidth(page.get());
        const double height = FPDF_GetPageHeight(page.get());
        if (width <= 0 || height <= 0) throw std::runtime_error("PDF page has no extent");

        const double ratio = std::min(static_cast<double>(max_dim) / width, static_cast<double>(max_dim) / height);
        new_w = std::max(1, static_cast<int>(width * ratio));
        new_h = std::max(1, static_cast<int>(height * ratio));

        const std::unique_ptr<fpdf_bitmap_t__, BitmapDestroyer> bitmap(FPDFBitmap_Create(new_w, new_h, 0)); // BGRx
        if (!bitmap) throw std::runtime_error("Failed to allocate PDF bitmap");
        FPDFBitmap_FillRect(bitmap.get(), 0, 0, new_w, new_h, 0xFFFFFFFF);
        FPDF_RenderPageBitmap(bitmap.get(), page.get(), 0, 0, new_w, new_h, 0, 0);

        const auto* raw = static_cast<const uint8_t*>(FPDFBitmap_GetBuffer(bitmap.get()));
        const int stride = FPDFBitmap_GetStride(bitmap.get());
        rgb.resize(static_cast<size_t>(new_w) * new_h * 3);

        for (int y = 0; y < new_h; ++y) {
            const uint8_t* row = raw + static_cast<ptrdiff_t>(y) * stride;
            for (int x = 0; x < new_w; ++x) {
                const size_t idx = static_cast<size_t>(y) * new_w + x;
                rgb[idx * 3 + 0] = row[x * 4 + 2]; // R
                rgb[idx * 3 + 1] = row[x * 4 + 1]; // G
                rgb[idx * 3 + 2] = row[x * 4 + 0]; // B
            }
        }
    }

    Rendered out;
    image::compress_to_jpeg(rgb.data(), new_w, new_h, out.jpeg);
    out.width = static_cast<unsigned int>(new_w);
    out.height = static_cast<unsigned int>(new_h);
    out.page_count = pages > 0 ? static_cast<unsigned int>(pages) : 1;
    return out;
}

}
