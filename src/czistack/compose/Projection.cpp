#include "czistack/compose/Projection.hpp"

#include <opencv2/core.hpp>
#include <stdexcept>

namespace czistack {

std::string reductionTag(Reduction r) {
    switch (r) {
        case Reduction::Max:  return "mip";
        case Reduction::Mean: return "aip";
    }
    return "unknown";
}

/* Ensure every plane is a non-empty CV_8UC1 of the same size. */
static void checkPlanes(const std::vector<cv::Mat>& planes) {
    if (planes.empty()) {
        throw std::invalid_argument("project: empty depth stack");
    }
    const cv::Size sz = planes.front().size();
    for (const auto& p : planes) {
        CV_Assert(!p.empty());
        CV_Assert(p.type() == CV_8UC1);
        CV_Assert(p.size() == sz);
    }
}

/*
  Max: start from a copy of the first plane and fold cv::max over the rest.
  Mean: accumulate in double, then divide every pixel by the depth.
  The division is done per pixel (not a multiply by 1/depth) so that a
  constant stack of value v yields exactly v.
*/
cv::Mat project(const std::vector<cv::Mat>& planes, Reduction r) {
    checkPlanes(planes);

    if (r == Reduction::Max) {
        cv::Mat acc = planes.front().clone();
        for (std::size_t z = 1; z < planes.size(); ++z) {
            cv::max(acc, planes[z], acc);
        }
        return acc;
    }

    const cv::Size sz = planes.front().size();
    cv::Mat sum = cv::Mat::zeros(sz, CV_64F);
    for (const auto& p : planes) {
        for (int y = 0; y < sz.height; ++y) {
            const std::uint8_t* src = p.ptr<std::uint8_t>(y);
            double* dst = sum.ptr<double>(y);
            for (int x = 0; x < sz.width; ++x) dst[x] += src[x];
        }
    }

    const double depth = static_cast<double>(planes.size());
    for (int y = 0; y < sz.height; ++y) {
        double* row = sum.ptr<double>(y);
        for (int x = 0; x < sz.width; ++x) row[x] = row[x] / depth;
    }
    return sum;
}

cv::Mat projectChannel(const ImageStack& stack, int c, Reduction r) {
    return project(stack.channelPlanes(c), r);
}

} // namespace czistack
