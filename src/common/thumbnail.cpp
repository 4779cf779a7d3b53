//
// Created by cv2 on 06.10.2026.
//

#include "thumbnail.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace perch {

std::optional<Thumbnail> make_thumbnail(const std::filesystem::path& path, int max_edge) {
    if (max_edge <= 0) return std::nullopt;

    cv::Mat image;
    try {
        image = cv::imread(path.string(), cv::IMREAD_COLOR);
    } catch (const cv::Exception&) {
        return std::nullopt;
    }
    if (image.empty()) return std::nullopt;

    const int longest = std::max(image.cols, image.rows);
    cv::Mat scaled;
    if (longest > max_edge) {
        const double ratio = static_cast<double>(max_edge) / longest;
        const int w = std::max(1, static_cast<int>(std::lround(image.cols * ratio)));
        const int h = std::max(1, static_cast<int>(std::lround(image.rows * ratio)));
        cv::resize(image, scaled, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    } else {
        scaled = image;
    }

    Thumbnail thumb;
    thumb.width = scaled.cols;
    thumb.height = scaled.rows;
    try {
        if (!cv::imencode(".png", scaled, thumb.png)) return std::nullopt;
    } catch (const cv::Exception&) {
        return std::nullopt;
    }
    return thumb;
}

} // namespace perch
