/*
 * File:        preview_renderer.cpp
 * Module:      seti-core
 * Purpose:     Synthetic preview plot rendering and PNG export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "preview_renderer.h"
#include "logging.h"

#include <fftw3.h>
#include <png.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <mutex>

namespace seti {

namespace {

constexpr double kPi = 3.14159265358979323846;

// FFTW planner calls are not thread safe
std::mutex g_fftw_planner_mutex;

struct ColorStop {
    double position;
    uint8_t r, g, b;
};

// Dark blue through cyan and yellow to white
constexpr ColorStop kColorStops[] = {
    {0.00,   0,   0,  16},
    {0.25,  20,  40, 150},
    {0.50,   0, 180, 200},
    {0.75, 240, 220,  40},
    {1.00, 255, 255, 255},
};

} // anonymous namespace

void PreviewImage::set_pixel(uint32_t x, uint32_t y, uint8_t r, uint8_t g, uint8_t b) {
    if (x >= width || y >= height) {
        return;
    }
    size_t offset = (static_cast<size_t>(y) * width + x) * 3;
    rgb_data[offset] = r;
    rgb_data[offset + 1] = g;
    rgb_data[offset + 2] = b;
}

PreviewRenderer::PreviewRenderer(uint32_t seed)
    : rng_(seed) {
}

void PreviewRenderer::colormap(double value, uint8_t& r, uint8_t& g, uint8_t& b) {
    value = std::clamp(value, 0.0, 1.0);
    constexpr size_t stop_count = sizeof(kColorStops) / sizeof(kColorStops[0]);
    for (size_t i = 1; i < stop_count; ++i) {
        const ColorStop& hi = kColorStops[i];
        if (value <= hi.position) {
            const ColorStop& lo = kColorStops[i - 1];
            double t = (value - lo.position) / (hi.position - lo.position);
            r = static_cast<uint8_t>(lo.r + t * (hi.r - lo.r));
            g = static_cast<uint8_t>(lo.g + t * (hi.g - lo.g));
            b = static_cast<uint8_t>(lo.b + t * (hi.b - lo.b));
            return;
        }
    }
    const ColorStop& last = kColorStops[stop_count - 1];
    r = last.r;
    g = last.g;
    b = last.b;
}

void PreviewRenderer::draw_line(PreviewImage& image, int x0, int y0, int x1, int y1,
                                uint8_t r, uint8_t g, uint8_t b) {
    // Bresenham
    int dx = std::abs(x1 - x0);
    int sx = x0 < x1 ? 1 : -1;
    int dy = -std::abs(y1 - y0);
    int sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;

    while (true) {
        if (x0 >= 0 && y0 >= 0) {
            image.set_pixel(static_cast<uint32_t>(x0), static_cast<uint32_t>(y0), r, g, b);
        }
        if (x0 == x1 && y0 == y1) {
            break;
        }
        int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

std::vector<double> PreviewRenderer::synthesize_signal(size_t sample_count,
                                                       const std::vector<InjectedTone>& tones,
                                                       double noise_level) {
    std::normal_distribution<double> noise(0.0, noise_level);
    std::vector<double> samples(sample_count);
    for (size_t n = 0; n < sample_count; ++n) {
        double value = noise(rng_);
        for (const auto& tone : tones) {
            value += tone.amplitude * std::sin(2.0 * kPi * tone.frequency * static_cast<double>(n));
        }
        samples[n] = value;
    }
    return samples;
}

std::vector<double> PreviewRenderer::power_spectrum_db(const std::vector<double>& samples) {
    const int n = static_cast<int>(samples.size());
    if (n < 2) {
        return {};
    }
    const int bins = n / 2 + 1;

    double* in = fftw_alloc_real(static_cast<size_t>(n));
    fftw_complex* out = fftw_alloc_complex(static_cast<size_t>(bins));

    fftw_plan plan;
    {
        std::lock_guard<std::mutex> lock(g_fftw_planner_mutex);
        plan = fftw_plan_dft_r2c_1d(n, in, out, FFTW_ESTIMATE);
    }

    for (int i = 0; i < n; ++i) {
        double window = 0.5 - 0.5 * std::cos(2.0 * kPi * i / (n - 1));
        in[i] = samples[static_cast<size_t>(i)] * window;
    }

    fftw_execute(plan);

    std::vector<double> spectrum(static_cast<size_t>(bins));
    for (int k = 0; k < bins; ++k) {
        double power = out[k][0] * out[k][0] + out[k][1] * out[k][1];
        spectrum[static_cast<size_t>(k)] = 10.0 * std::log10(power + 1e-12);
    }

    {
        std::lock_guard<std::mutex> lock(g_fftw_planner_mutex);
        fftw_destroy_plan(plan);
    }
    fftw_free(in);
    fftw_free(out);

    return spectrum;
}

PreviewImage PreviewRenderer::render_waterfall(uint32_t width, uint32_t height) {
    PreviewImage image(width, height);
    if (!image.is_valid()) {
        return image;
    }

    const size_t fft_size = static_cast<size_t>(width) * 2;
    std::vector<std::vector<double>> rows;
    rows.reserve(height);

    double min_db = 1e9;
    double max_db = -1e9;
    for (uint32_t row = 0; row < height; ++row) {
        double drift = static_cast<double>(row) / height;
        std::vector<InjectedTone> tones = {
            {0.08 + 0.25 * drift, 1.0},
            {0.37, 0.4},
        };
        auto spectrum = power_spectrum_db(synthesize_signal(fft_size, tones, 1.5));
        spectrum.resize(width);
        for (double v : spectrum) {
            min_db = std::min(min_db, v);
            max_db = std::max(max_db, v);
        }
        rows.push_back(std::move(spectrum));
    }

    const double range = std::max(max_db - min_db, 1e-6);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            uint8_t r, g, b;
            colormap((rows[y][x] - min_db) / range, r, g, b);
            image.set_pixel(x, y, r, g, b);
        }
    }

    return image;
}

PreviewImage PreviewRenderer::render_activity_map(uint32_t width, uint32_t height) {
    PreviewImage image(width, height);
    if (!image.is_valid()) {
        return image;
    }

    std::uniform_real_distribution<double> unit(0.0, 1.0);

    struct HotSpot {
        double x, y, radius, strength;
    };
    std::vector<HotSpot> spots;
    for (int i = 0; i < 6; ++i) {
        spots.push_back({unit(rng_) * width, unit(rng_) * height,
                         (0.05 + 0.1 * unit(rng_)) * std::min(width, height),
                         0.4 + 0.6 * unit(rng_)});
    }

    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            double value = 0.25 * unit(rng_);
            for (const auto& spot : spots) {
                double dx = x - spot.x;
                double dy = y - spot.y;
                value += spot.strength * std::exp(-(dx * dx + dy * dy) / (2.0 * spot.radius * spot.radius));
            }
            uint8_t r, g, b;
            colormap(value, r, g, b);
            image.set_pixel(x, y, r, g, b);
        }
    }

    return image;
}

PreviewImage PreviewRenderer::render_cluster_scatter(uint32_t width, uint32_t height,
                                                     uint32_t cluster_count,
                                                     uint32_t points_per_cluster) {
    PreviewImage image(width, height);
    if (!image.is_valid()) {
        return image;
    }

    std::fill(image.rgb_data.begin(), image.rgb_data.end(), static_cast<uint8_t>(16));

    // Axes
    draw_line(image, 10, static_cast<int>(height) - 10, static_cast<int>(width) - 10,
              static_cast<int>(height) - 10, 128, 128, 128);
    draw_line(image, 10, 10, 10, static_cast<int>(height) - 10, 128, 128, 128);

    static constexpr uint8_t palette[][3] = {
        {230,  80,  60}, { 60, 200,  90}, { 80, 140, 240},
        {240, 200,  50}, {200,  90, 220}, { 60, 210, 210},
    };
    constexpr size_t palette_size = sizeof(palette) / sizeof(palette[0]);

    std::uniform_real_distribution<double> centre(0.2, 0.8);
    std::normal_distribution<double> spread(0.0, 0.05);

    for (uint32_t c = 0; c < cluster_count; ++c) {
        double cx = centre(rng_);
        double cy = centre(rng_);
        const uint8_t* colour = palette[c % palette_size];
        for (uint32_t p = 0; p < points_per_cluster; ++p) {
            int px = static_cast<int>((cx + spread(rng_)) * width);
            int py = static_cast<int>((cy + spread(rng_)) * height);
            for (int oy = -1; oy <= 1; ++oy) {
                for (int ox = -1; ox <= 1; ++ox) {
                    int x = px + ox;
                    int y = py + oy;
                    if (x >= 0 && y >= 0) {
                        image.set_pixel(static_cast<uint32_t>(x), static_cast<uint32_t>(y),
                                        colour[0], colour[1], colour[2]);
                    }
                }
            }
        }
    }

    return image;
}

PreviewImage PreviewRenderer::render_spectrum(uint32_t width, uint32_t height,
                                              const std::vector<InjectedTone>& tones) {
    PreviewImage image(width, height);
    if (!image.is_valid()) {
        return image;
    }

    auto spectrum = power_spectrum_db(synthesize_signal(4096, tones, 1.0));
    if (spectrum.empty()) {
        return image;
    }

    // Peak-hold the spectrum into one value per column
    std::vector<double> columns(width, -1e9);
    for (size_t k = 0; k < spectrum.size(); ++k) {
        size_t column = std::min<size_t>(k * width / spectrum.size(), width - 1);
        columns[column] = std::max(columns[column], spectrum[k]);
    }
    for (uint32_t x = 1; x < width; ++x) {
        if (columns[x] <= -1e9) {
            columns[x] = columns[x - 1];
        }
    }

    auto [min_it, max_it] = std::minmax_element(columns.begin(), columns.end());
    const double min_db = *min_it;
    const double range = std::max(*max_it - min_db, 1e-6);

    // Grid
    for (uint32_t gy = 0; gy < height; gy += std::max<uint32_t>(height / 8, 1)) {
        draw_line(image, 0, static_cast<int>(gy), static_cast<int>(width) - 1, static_cast<int>(gy), 40, 40, 40);
    }

    int prev_x = 0;
    int prev_y = static_cast<int>((1.0 - (columns[0] - min_db) / range) * (height - 1));
    for (uint32_t x = 1; x < width; ++x) {
        int y = static_cast<int>((1.0 - (columns[x] - min_db) / range) * (height - 1));
        draw_line(image, prev_x, prev_y, static_cast<int>(x), y, 80, 230, 120);
        prev_x = static_cast<int>(x);
        prev_y = y;
    }

    return image;
}

bool PreviewRenderer::save_png(const PreviewImage& image, const std::string& filename) {
    if (!image.is_valid()) {
        SETI_LOG_ERROR("Invalid image for PNG export");
        return false;
    }

    FILE* fp = fopen(filename.c_str(), "wb");
    if (!fp) {
        SETI_LOG_ERROR("Failed to open file for writing: {}", filename);
        return false;
    }

    // Create PNG structures
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        SETI_LOG_ERROR("Failed to create PNG write structure");
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        fclose(fp);
        SETI_LOG_ERROR("Failed to create PNG info structure");
        return false;
    }

    // Error handling
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        SETI_LOG_ERROR("PNG write error: {}", filename);
        return false;
    }

    png_init_io(png, fp);

    png_set_IHDR(
        png,
        info,
        image.width,
        image.height,
        8,                      // 8 bits per channel
        PNG_COLOR_TYPE_RGB,
        PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_DEFAULT,
        PNG_FILTER_TYPE_DEFAULT
    );

    png_write_info(png, info);

    for (uint32_t y = 0; y < image.height; ++y) {
        png_bytep row = const_cast<png_bytep>(&image.rgb_data[static_cast<size_t>(y) * image.width * 3]);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);

    png_destroy_write_struct(&png, &info);
    fclose(fp);

    SETI_LOG_DEBUG("Saved PNG: {} ({}x{})", filename, image.width, image.height);
    return true;
}

} // namespace seti
