#pragma once
#include <array>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core.h"

/// Rectangle of the output image that one view renders into.
struct Viewport {
    int x{0};
    int y{0};
    int width{1};
    int height{1};
};

/**
 * @brief Maps unbounded linear colors to 8-bit channels.
 * byte = toByte(max(0, c*exposure)^(1/gamma)).
 */
struct ToneMap {
    /// Linear multiplier applied before the curve.
    double exposure{1.0};
    /// Display gamma (> 0); 1 keeps the mapping linear.
    double gamma{1.0};

    /// Map one channel to [0,255].
    int channel(double c) const;
};

/**
 * @brief 8-bit output image that several rendered views are tiled onto.
 * Pixels no view covers keep the background color.
 */
class Canvas {
public:
    /**
     * @param width Image width in pixels (> 0).
     * @param height Image height in pixels (> 0).
     * @param background RGB bytes for uncovered pixels.
     */
    Canvas(int width, int height, const std::array<int, 3>& background = {0, 0, 0});

    /**
     * @brief Copy a rendered view into its viewport.
     * @param vp Target rectangle; must lie inside the canvas.
     * @param framebuffer Row-major linear colors of size vp.width*vp.height.
     * @param tone Mapping to 8-bit.
     * @throws std::out_of_range if vp leaves the canvas.
     * @throws std::invalid_argument on a buffer size mismatch.
     */
    void blit(const Viewport& vp, const std::vector<Color>& framebuffer, const ToneMap& tone);

    /// RGB bytes at (x,y).
    std::array<int, 3> pixel(int x, int y) const;

    /**
     * @brief Encode and write the image; format follows the file extension.
     * @throws std::runtime_error if OpenCV cannot write the file.
     */
    void save(const std::string& path) const;

    int width() const { return img_.cols; }
    int height() const { return img_.rows; }

private:
    cv::Mat img_;
};
