#ifndef BRAGGSIM_COMMON_H
#define BRAGGSIM_COMMON_H

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

template <typename T1, typename... TS>
auto with_formatting(const std::string &code, const T1 &first, TS... args)
  -> std::string {
    return code + fmt::format(fmt::runtime(fmt::format("{}", first)), args...)
           + "\033[0m";
}

template <typename... T>
auto bold(T... args) -> std::string {
    return with_formatting("\033[1m", args...);
}
template <typename... T>
auto red(T... args) -> std::string {
    return with_formatting("\033[31m", args...);
}
template <typename... T>
auto yellow(T... args) -> std::string {
    return with_formatting("\033[33m", args...);
}

/// Print a window of a row-major image to the terminal, shaded on a
/// grayscale ramp relative to the brightest pixel in the window.
/// fast, slow, width, height - the window to draw
/// data_width, data_height - the full image size
inline void draw_image_data(const double *data,
                            size_t fast,
                            size_t slow,
                            size_t width,
                            size_t height,
                            size_t data_width,
                            size_t data_height) {
    size_t fast_end = std::min(fast + width, data_width);
    size_t slow_end = std::min(slow + height, data_height);

    double brightest = 0;
    std::vector<size_t> col_widths;
    for (size_t col = fast; col < fast_end; ++col) {
        size_t maxw = fmt::formatted_size("{:3}", col);
        for (size_t row = slow; row < slow_end; ++row) {
            double value = data[col + data_width * row];
            maxw = std::max(maxw, fmt::formatted_size("{:.1f}", value));
            brightest = std::max(brightest, value);
        }
        col_widths.push_back(maxw);
    }

    fmt::print("x =       ");
    for (size_t col = fast; col < fast_end; ++col) {
        fmt::print("{:{}} ", col, col_widths[col - fast]);
    }
    fmt::print("\n");
    for (size_t row = slow; row < slow_end; ++row) {
        fmt::print("{} {:4d} │", row == slow ? "y =" : "   ", row);
        for (size_t col = fast; col < fast_end; ++col) {
            double value = data[col + data_width * row];
            // 232 is black and 255 white on the 256 colour palette
            int color = 255;
            if (brightest > 0) {
                color = 255 - static_cast<int>(std::lround(23 * value / brightest));
            }
            if (value < 0 || !std::isfinite(value)) color = 9;
            if (value == brightest && brightest > 0) {
                fmt::print("\033[0m\033[1m");
            } else {
                fmt::print("\033[38;5;{}m", color);
            }
            fmt::print("{:{}.1f} \033[0m", value, col_widths[col - fast]);
        }
        fmt::print("│\n");
    }
}

/// Relative difference between two values, measured against the larger magnitude.
/// Values that are both below `floor` in magnitude compare as identical.
template <typename T>
auto relative_difference(T left, T right, T floor = T{0}) -> T {
    T scale = std::max(std::abs(left), std::abs(right));
    if (scale <= floor) return T{0};
    return std::abs(left - right) / scale;
}
#endif
