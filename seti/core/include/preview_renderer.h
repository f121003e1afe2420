/*
 * File:        preview_renderer.h
 * Module:      seti-core
 * Purpose:     Synthetic preview plot rendering and PNG export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace seti {

/**
 * @brief Rendered preview image data
 *
 * Simple RGB888 image format, written to disk as PNG and loaded by the GUI.
 */
struct PreviewImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgb_data;  ///< RGB888 format (width * height * 3 bytes)

    PreviewImage() = default;
    PreviewImage(uint32_t w, uint32_t h)
        : width(w), height(h), rgb_data(static_cast<size_t>(w) * h * 3, 0) {}

    bool is_valid() const {
        return width > 0 && height > 0 &&
               rgb_data.size() == static_cast<size_t>(width) * height * 3;
    }

    void set_pixel(uint32_t x, uint32_t y, uint8_t r, uint8_t g, uint8_t b);
};

/**
 * @brief A sinusoid injected into a synthetic signal
 */
struct InjectedTone {
    double frequency;   ///< Normalized frequency (cycles per sample, 0..0.5)
    double amplitude;
};

/**
 * @brief Renders the synthetic plots shown as analysis previews
 *
 * All randomness comes from a seeded generator, so a renderer constructed
 * with the same seed produces identical images.
 */
class PreviewRenderer {
public:
    explicit PreviewRenderer(uint32_t seed = 1420);

    /**
     * @brief Waterfall of a noisy signal with a slowly drifting carrier
     *
     * Each row is the power spectrum of one block of samples.
     */
    PreviewImage render_waterfall(uint32_t width, uint32_t height);

    /**
     * @brief Random activity heatmap
     */
    PreviewImage render_activity_map(uint32_t width, uint32_t height);

    /**
     * @brief Scatter plot of Gaussian point clusters
     */
    PreviewImage render_cluster_scatter(uint32_t width, uint32_t height,
                                        uint32_t cluster_count, uint32_t points_per_cluster);

    /**
     * @brief Line plot of the power spectrum of noise plus injected tones
     */
    PreviewImage render_spectrum(uint32_t width, uint32_t height,
                                 const std::vector<InjectedTone>& tones);

    /**
     * @brief Generate a noisy real signal containing the given tones
     */
    std::vector<double> synthesize_signal(size_t sample_count,
                                          const std::vector<InjectedTone>& tones,
                                          double noise_level);

    /**
     * @brief Power spectrum in dB of a real signal (sample_count/2 + 1 bins)
     *
     * A Hann window is applied before the transform.
     */
    static std::vector<double> power_spectrum_db(const std::vector<double>& samples);

    /**
     * @brief Save a PreviewImage directly to PNG file
     *
     * @param image The rendered image to save
     * @param filename Path to PNG file to create
     * @return true if successful, false on error
     */
    static bool save_png(const PreviewImage& image, const std::string& filename);

private:
    static void colormap(double value, uint8_t& r, uint8_t& g, uint8_t& b);
    static void draw_line(PreviewImage& image, int x0, int y0, int x1, int y1,
                          uint8_t r, uint8_t g, uint8_t b);

    std::mt19937 rng_;
};

} // namespace seti
