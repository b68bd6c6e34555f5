// Color Mapping Tests
// 256-color quantization ranges and shade ramp monotonicity
//
// Build: cmake --build build --target test_palette
// Run:   ./build/test_palette

#include <cstdio>
#include <cmath>
#include <cstring>
#include <string>

#include "julia.h"

int tests_passed = 0;
int tests_failed = 0;

void check(bool condition, const char* name) {
    if (condition) {
        printf("  [PASS] %s\n", name);
        tests_passed++;
    } else {
        printf("  [FAIL] %s\n", name);
        tests_failed++;
    }
}

// Test 1: color cube and gray ramp ranges
void test_color_ranges() {
    printf("\nTest: Color Ranges\n");

    bool cube_ok = true;
    for (int i = 0; i < 3600; i++) {
        double h = i * 0.1;
        int idx = hsv_to_256(h, 0.9, 1.0);
        if (idx < 16 || idx > 231) {
            printf("  hue %.1f -> %d\n", h, idx);
            cube_ok = false;
        }
    }
    check(cube_ok, "Hue sweep at s=0.9 stays in [16, 231]");

    bool gray_ok = true;
    for (int i = 0; i <= 1000; i++) {
        double v = i / 1000.0;
        int idx = hsv_to_256(123.0, 0.0, v);
        if (idx < 232 || idx > 255) gray_ok = false;
    }
    check(gray_ok, "Value sweep at s=0 stays in [232, 255]");
    check(hsv_to_256(0.0, 0.0, 0.0) == 232, "Black maps to 232");
    check(hsv_to_256(0.0, 0.0, 1.0) == 255, "White maps to 255");

    bool norm_ok = true;
    for (int iters = 0; iters < 120; iters++) {
        int idx = color_index((double)iters / 120);
        if (idx < 16 || idx > 231) norm_ok = false;
    }
    check(norm_ok, "color_index over all escape counts in cube");
}

// Test 2: known primaries and hue wrap
void test_known_colors() {
    printf("\nTest: Known Colors\n");

    printf("  red=%d green=%d blue=%d\n",
           hsv_to_256(0.0, 0.9, 1.0), hsv_to_256(120.0, 0.9, 1.0), hsv_to_256(240.0, 0.9, 1.0));
    check(hsv_to_256(0.0, 0.9, 1.0) == 196, "Hue 0 -> 196 (red)");
    check(hsv_to_256(120.0, 0.9, 1.0) == 46, "Hue 120 -> 46 (green)");
    check(hsv_to_256(240.0, 0.9, 1.0) == 21, "Hue 240 -> 21 (blue)");

    check(hsv_to_256(390.0, 0.9, 1.0) == hsv_to_256(30.0, 0.9, 1.0), "Hue 390 wraps to 30");
    check(hsv_to_256(-30.0, 0.9, 1.0) == hsv_to_256(330.0, 0.9, 1.0), "Hue -30 wraps to 330");
    check(hsv_to_256(360.0, 0.9, 1.0) == hsv_to_256(0.0, 0.9, 1.0), "Hue 360 equals 0");

    int below = hsv_to_256(200.0, 0.079, 1.0);
    int at = hsv_to_256(200.0, 0.08, 1.0);
    check(below >= 232, "s < 0.08 uses gray ramp");
    check(at >= 16 && at <= 231, "s = 0.08 uses color cube");
}

// Test 3: shade ramp is non-decreasing
void test_shade_monotonic() {
    printf("\nTest: Shade Monotonicity\n");

    bool dense_ok = true;
    int last = shade_index(0.0);
    const int steps = 200000;
    for (int i = 1; i < steps; i++) {
        int idx = shade_index((double)i / steps);
        if (idx < last) dense_ok = false;
        last = idx;
    }
    check(dense_ok, "Dense sweep of [0, 1) never decreases");

    bool iter_ok = true;
    for (int max_iter = 1; max_iter <= 512 && iter_ok; max_iter++) {
        int prev = -1;
        for (int it = 0; it < max_iter; it++) {
            int idx = shade_index((double)it / max_iter);
            if (idx < prev) {
                printf("  max_iter %d: index drops at %d\n", max_iter, it);
                iter_ok = false;
                break;
            }
            prev = idx;
        }
    }
    check(iter_ok, "iters/max_iter sequences never decrease");

    // Adjacent doubles
    bool ulp_ok = true;
    for (int k = 1; k < 10; k++) {
        double x = k / 10.0;
        double lo = std::nextafter(x, 0.0);
        double hi = std::nextafter(x, 1.0);
        if (shade_index(lo) > shade_index(x) || shade_index(x) > shade_index(hi)) ulp_ok = false;
    }
    check(ulp_ok, "Neighbouring doubles keep order");
}

// Test 4: ramp endpoints and clamping
void test_shade_bounds() {
    printf("\nTest: Shade Bounds\n");

    check(NUM_SHADES == 11, "Ramp has 11 glyphs");
    check(strcmp(SHADES[0], " ") == 0, "Ramp starts blank");
    check(strcmp(SHADES[NUM_SHADES - 1], "\xe2\x96\x88") == 0, "Ramp ends with full block");

    check(shade_index(0.0) == 0, "norm 0 -> blank");
    check(shade_index(0.5) == 6, "norm 0.5 -> index 6 (gamma 0.85, rounded)");
    check(shade_index(0.999) == NUM_SHADES - 1, "norm near 1 -> densest");
    check(shade_index(-0.5) == 0, "Negative norm clamps to 0");
    check(shade_index(7.0) == NUM_SHADES - 1, "norm > 1 clamps to top");
    check(shade_index(std::nan("")) == 0, "NaN norm clamps to 0");
    check(std::string(shade_glyph(0.999)) == SHADES[NUM_SHADES - 1], "shade_glyph matches shade_index");
}

int main() {
    printf("═══════════════════════════════════════════════════════════════\n");
    printf("       COLOR MAPPING TEST SUITE\n");
    printf("═══════════════════════════════════════════════════════════════\n");

    test_color_ranges();
    test_known_colors();
    test_shade_monotonic();
    test_shade_bounds();

    printf("\n═══════════════════════════════════════════════════════════════\n");
    printf("Results: %d passed, %d failed\n", tests_passed, tests_failed);
    printf("═══════════════════════════════════════════════════════════════\n");

    return tests_failed > 0 ? 1 : 0;
}
