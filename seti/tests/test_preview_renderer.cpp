/******************************************************************************
 * test_preview_renderer.cpp
 *
 * Unit tests for the synthetic preview renderer and PNG export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "preview_renderer.h"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

using namespace seti;

namespace {

std::filesystem::path make_temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("seti-test-" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

bool has_png_signature(const std::filesystem::path& path) {
    static const unsigned char signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    std::ifstream file(path, std::ios::binary);
    char header[8] = {};
    if (!file.read(header, sizeof(header))) {
        return false;
    }
    return std::equal(std::begin(signature), std::end(signature),
                      reinterpret_cast<const unsigned char*>(header));
}

} // anonymous namespace

void test_power_spectrum_peak() {
    PreviewRenderer renderer(7);

    // 0.125 cycles/sample over 4096 samples lands exactly on bin 512
    auto samples = renderer.synthesize_signal(4096, {{0.125, 5.0}}, 0.1);
    auto spectrum = PreviewRenderer::power_spectrum_db(samples);
    assert(spectrum.size() == 4096 / 2 + 1);

    auto peak = std::max_element(spectrum.begin(), spectrum.end());
    assert(std::distance(spectrum.begin(), peak) == 512);

    std::cout << "test_power_spectrum_peak: PASSED\n";
}

void test_power_spectrum_strongest_tone_wins() {
    PreviewRenderer renderer(11);

    auto samples = renderer.synthesize_signal(2048, {{0.0625, 1.0}, {0.25, 4.0}}, 0.05);
    auto spectrum = PreviewRenderer::power_spectrum_db(samples);

    auto peak = std::max_element(spectrum.begin(), spectrum.end());
    assert(std::distance(spectrum.begin(), peak) == 512);

    // The weaker tone still stands out from its neighbourhood
    assert(spectrum[128] > spectrum[160] + 20.0);

    std::cout << "test_power_spectrum_strongest_tone_wins: PASSED\n";
}

void test_power_spectrum_too_short() {
    assert(PreviewRenderer::power_spectrum_db({}).empty());
    assert(PreviewRenderer::power_spectrum_db({1.0}).empty());

    std::cout << "test_power_spectrum_too_short: PASSED\n";
}

void test_render_dimensions() {
    PreviewRenderer renderer;

    PreviewImage waterfall = renderer.render_waterfall(64, 32);
    assert(waterfall.is_valid());
    assert(waterfall.width == 64 && waterfall.height == 32);

    PreviewImage activity = renderer.render_activity_map(50, 20);
    assert(activity.is_valid());

    PreviewImage scatter = renderer.render_cluster_scatter(80, 60, 3, 40);
    assert(scatter.is_valid());

    PreviewImage spectrum = renderer.render_spectrum(100, 40, {{0.2, 2.0}});
    assert(spectrum.is_valid());

    PreviewImage empty = renderer.render_waterfall(0, 10);
    assert(!empty.is_valid());

    std::cout << "test_render_dimensions: PASSED\n";
}

void test_render_is_deterministic() {
    PreviewRenderer first(1420);
    PreviewRenderer second(1420);

    assert(first.render_activity_map(40, 30).rgb_data == second.render_activity_map(40, 30).rgb_data);
    assert(first.render_waterfall(40, 30).rgb_data == second.render_waterfall(40, 30).rgb_data);

    std::cout << "test_render_is_deterministic: PASSED\n";
}

void test_save_png() {
    auto dir = make_temp_dir("png");
    PreviewRenderer renderer;

    auto filename = dir / "waterfall.png";
    assert(PreviewRenderer::save_png(renderer.render_waterfall(32, 16), filename.string()));
    assert(std::filesystem::exists(filename));
    assert(has_png_signature(filename));

    std::filesystem::remove_all(dir);
    std::cout << "test_save_png: PASSED\n";
}

void test_save_png_failures() {
    auto dir = make_temp_dir("png-fail");

    // Invalid image
    assert(!PreviewRenderer::save_png(PreviewImage(), (dir / "empty.png").string()));
    assert(!std::filesystem::exists(dir / "empty.png"));

    // Unwritable location
    PreviewImage image(4, 4);
    assert(!PreviewRenderer::save_png(image, (dir / "missing" / "image.png").string()));

    std::filesystem::remove_all(dir);
    std::cout << "test_save_png_failures: PASSED\n";
}

int main() {
    std::cout << "Running preview renderer tests...\n\n";

    test_power_spectrum_peak();
    test_power_spectrum_strongest_tone_wins();
    test_power_spectrum_too_short();
    test_render_dimensions();
    test_render_is_deterministic();
    test_save_png();
    test_save_png_failures();

    std::cout << "\nAll preview renderer tests passed!\n";
    return 0;
}
