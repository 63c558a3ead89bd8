#include "bubblegrade/RasterProvider.hpp"
#include "bubblegrade/Errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

using namespace cv;

namespace bubblegrade {

std::vector<RasterPage> ImageRasterProvider::rasterize(const std::vector<uint8_t>& bytes) const {
    if (bytes.empty()) {
        throw RasterError("scan document is empty");
    }

    std::vector<Mat> mats;
    bool multi = false;
    try {
        multi = imdecodemulti(bytes, IMREAD_COLOR, mats);
    } catch (const cv::Exception& e) {
        spdlog::debug("imdecodemulti rejected the document: {}", e.what());
        mats.clear();
    }

    if (!multi || mats.empty()) {
        Mat single = imdecode(bytes, IMREAD_COLOR);
        if (single.empty()) {
            throw RasterError("no decodable page in " + std::to_string(bytes.size()) + " bytes");
        }
        mats.assign(1, single);
    }

    std::vector<RasterPage> pages;
    pages.reserve(mats.size());
    for (size_t i = 0; i < mats.size(); ++i) {
        pages.push_back({static_cast<int>(i) + 1, mats[i]});
    }
    spdlog::debug("rasterized {} page(s)", pages.size());
    return pages;
}

int ImageRasterProvider::countPages(const std::vector<uint8_t>& bytes) const {
    return static_cast<int>(rasterize(bytes).size());
}

}
