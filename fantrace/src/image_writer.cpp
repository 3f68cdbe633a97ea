#include "image_writer.h"
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>

int ToneMap::channel(double c) const {
    const double v = std::max(0.0, c * exposure);
    return toByte(std::pow(v, 1.0 / gamma));
}

Canvas::Canvas(int width, int height, const std::array<int, 3>& background) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("canvas size must be positive");
    }
    // OpenCV stores BGR
    img_ = cv::Mat(height, width, CV_8UC3,
                   cv::Scalar(background[2], background[1], background[0]));
}

void Canvas::blit(const Viewport& vp, const std::vector<Color>& framebuffer, const ToneMap& tone) {
    if (vp.x < 0 || vp.y < 0 || vp.width <= 0 || vp.height <= 0 ||
        vp.x > img_.cols - vp.width || vp.y > img_.rows - vp.height) {
        throw std::out_of_range("viewport lies outside the canvas");
    }
    if (framebuffer.size() != static_cast<std::size_t>(vp.width) * vp.height) {
        throw std::invalid_argument("framebuffer size does not match viewport");
    }

    for (int y = 0; y < vp.height; ++y) {
        const std::size_t row = static_cast<std::size_t>(y) * vp.width;
        auto* p = img_.ptr<cv::Vec3b>(vp.y + y) + vp.x;
        for (int x = 0; x < vp.width; ++x) {
            const Color& c = framebuffer[row + x];
            p[x] = cv::Vec3b{ (unsigned char)tone.channel(c.b),
                              (unsigned char)tone.channel(c.g),
                              (unsigned char)tone.channel(c.r) };
        }
    }
}

std::array<int, 3> Canvas::pixel(int x, int y) const {
    const cv::Vec3b& p = img_.at<cv::Vec3b>(y, x);
    return { p[2], p[1], p[0] };
}

void Canvas::save(const std::string& path) const {
    bool ok = false;
    try {
        ok = cv::imwrite(path, img_);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("Failed to write image " + path + ": " + e.what());
    }
    if (!ok) throw std::runtime_error("Failed to write image: " + path);
}
