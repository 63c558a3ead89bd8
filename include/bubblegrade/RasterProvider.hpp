#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

namespace bubblegrade {

struct RasterPage {
    int pageNumber = 0;  // 1-based
    cv::Mat image;       // BGR(A) or grayscale; 8-bit, 16-bit or float
};

// Turns an uploaded scan document into page images.
class RasterProvider {
public:
    virtual ~RasterProvider() = default;

    // Throws RasterError when the document cannot be read.
    virtual std::vector<RasterPage> rasterize(const std::vector<uint8_t>& bytes) const = 0;
    virtual int countPages(const std::vector<uint8_t>& bytes) const = 0;
};

// Multi-page TIFF or any single image format imgcodecs can decode.
class ImageRasterProvider : public RasterProvider {
public:
    std::vector<RasterPage> rasterize(const std::vector<uint8_t>& bytes) const override;
    int countPages(const std::vector<uint8_t>& bytes) const override;
};

}
