/*
 * JULIA CORE
 * See julia.h for the per-frame pipeline.
 */

#include "julia.h"

#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <cerrno>
#include <cctype>
#include <algorithm>
#include <thread>
#include <unistd.h>

#ifdef __AVX2__
#include <immintrin.h>
#define USE_AVX2 1
#else
#define USE_AVX2 0
#endif

// ═══════════════════════════════════════════════════════════════════════════
// PARAMETER ANIMATION
// ═══════════════════════════════════════════════════════════════════════════

AnimationState init_animation(uint64_t seed) {
    AnimationState state;
    // xorshift never leaves the all-zero state
    state.rng = seed ? seed : DEFAULT_SEED;
    return state;
}

double rng_next_signed(uint64_t& state) {
    uint64_t x = state;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    state = x;
    uint64_t v = x * RNG_MULTIPLIER;
    // Top 53 bits -> [0,1) -> [-1,1)
    return (double)(v >> 11) * (1.0 / (double)(1ULL << 53)) * 2.0 - 1.0;
}

AnimationStep advance_animation(const AnimationState& state, const AnimatorConfig& config, double dt) {
    AnimationStep step;
    AnimationState& s = step.state;
    s = state;

    if (!(dt > 0.0)) dt = 0.0;  // Negative or NaN
    dt = std::min(dt, MAX_ANIM_DT);

    double ax = rng_next_signed(s.rng) * config.accel_strength;
    double ay = rng_next_signed(s.rng) * config.accel_strength;
    Complex accel(ax, ay);

    // Damped velocity + random acceleration
    s.velocity = s.velocity * (1.0 - config.damping * dt) + accel * dt;
    s.offset += s.velocity * dt;

    // Soft boundary: spring back toward the radius, and bleed off the
    // velocity component along the offset
    double len = std::abs(s.offset);
    if (len > config.radius) {
        double pull = (len - config.radius) / len;
        s.offset -= s.offset * pull * 0.6;
        double along = s.velocity.real() * s.offset.real() + s.velocity.imag() * s.offset.imag();
        s.velocity -= s.offset * (along / (std::norm(s.offset) + 1e-12)) * 0.5;
    }

    double vmax = config.radius * 2.0;
    double speed = std::abs(s.velocity);
    if (speed > vmax) {
        s.velocity *= 0.5;
        speed *= 0.5;
        // Only reachable with an oversized accel_strength
        if (speed > vmax) s.velocity *= vmax / speed;
    }

    step.parameter = config.base + s.offset;
    return step;
}

// ═══════════════════════════════════════════════════════════════════════════
// JULIA COMPUTATION
// ═══════════════════════════════════════════════════════════════════════════

#if USE_AVX2
// AVX2 path - 4 cells per pass
static void compute_rows_avx2(Complex c, int width, int height, int max_iter,
                              std::vector<int>& iters, int start_row, int end_row) {
    __m256d four = _mm256_set1_pd(ESCAPE_RADIUS_SQ);
    __m256d one = _mm256_set1_pd(1.0);
    __m256d cr = _mm256_set1_pd(c.real());
    __m256d ci = _mm256_set1_pd(c.imag());

    for (int y = start_row; y < end_row; y++) {
        for (int x = 0; x < width; x += 4) {
            Complex p0 = viewport_point(x, y, width, height);
            Complex p1 = viewport_point(x + 1, y, width, height);
            Complex p2 = viewport_point(x + 2, y, width, height);
            Complex p3 = viewport_point(x + 3, y, width, height);

            __m256d zr = _mm256_set_pd(p3.real(), p2.real(), p1.real(), p0.real());
            __m256d zi = _mm256_set_pd(p3.imag(), p2.imag(), p1.imag(), p0.imag());
            __m256d iter = _mm256_setzero_pd();

            for (int i = 0; i < max_iter; i++) {
                __m256d zr2 = _mm256_mul_pd(zr, zr);
                __m256d zi2 = _mm256_mul_pd(zi, zi);
                __m256d mag2 = _mm256_add_pd(zr2, zi2);

                __m256d active = _mm256_cmp_pd(mag2, four, _CMP_LE_OQ);
                if (_mm256_testz_pd(active, active)) break;

                __m256d zri = _mm256_mul_pd(zr, zi);
                __m256d new_zr = _mm256_add_pd(_mm256_sub_pd(zr2, zi2), cr);
                __m256d new_zi = _mm256_add_pd(_mm256_add_pd(zri, zri), ci);

                // Escaped lanes keep their last z
                zr = _mm256_blendv_pd(zr, new_zr, active);
                zi = _mm256_blendv_pd(zi, new_zi, active);

                iter = _mm256_add_pd(iter, _mm256_and_pd(active, one));
            }

            double iter_arr[4];
            _mm256_storeu_pd(iter_arr, iter);
            for (int i = 0; i < 4 && x + i < width; i++) {
                iters[y * width + x + i] = (int)iter_arr[i];
            }
        }
    }
}
#endif

#if !USE_AVX2
// Scalar fallback
static void compute_rows_scalar(Complex c, int width, int height, int max_iter,
                                std::vector<int>& iters, int start_row, int end_row) {
    for (int y = start_row; y < end_row; y++) {
        int* row = &iters[y * width];
        for (int x = 0; x < width; x++) {
            row[x] = escape_count(c, viewport_point(x, y, width, height), max_iter);
        }
    }
}
#endif

static void compute_rows(Complex c, int width, int height, int max_iter,
                         std::vector<int>& iters, int start_row, int end_row) {
#if USE_AVX2
    compute_rows_avx2(c, width, height, max_iter, iters, start_row, end_row);
#else
    compute_rows_scalar(c, width, height, max_iter, iters, start_row, end_row);
#endif
}

void compute_escape_grid(Complex c, int width, int height, int max_iter,
                         std::vector<int>& iters, int threads) {
    if (width <= 0 || height <= 0) {
        iters.clear();
        return;
    }
    iters.resize((size_t)width * height);

    int num_threads = threads > 0 ? threads : (int)std::thread::hardware_concurrency();
    if (num_threads <= 0) num_threads = 4;
    num_threads = std::min(num_threads, height);

    if (num_threads == 1) {
        compute_rows(c, width, height, max_iter, iters, 0, height);
        return;
    }

    // Rows are independent; each thread owns a contiguous band
    std::vector<std::thread> workers;
    int rows_per_thread = height / num_threads;

    for (int t = 0; t < num_threads; t++) {
        int start = t * rows_per_thread;
        int end = (t == num_threads - 1) ? height : start + rows_per_thread;

        workers.emplace_back([&iters, c, width, height, max_iter, start, end]() {
            compute_rows(c, width, height, max_iter, iters, start, end);
        });
    }

    for (auto& w : workers) w.join();
}

// ═══════════════════════════════════════════════════════════════════════════
// COLOR MAPPING
// ═══════════════════════════════════════════════════════════════════════════

// Sparse to dense
const char* const SHADES[NUM_SHADES] = {
    " ", ".", ":", "-", "=", "+", "*", "o", "O", "#", "█"
};

uint8_t hsv_to_256(double hue_deg, double s, double v) {
    s = std::isnan(s) ? 0.0 : std::clamp(s, 0.0, 1.0);
    v = std::isnan(v) ? 0.0 : std::clamp(v, 0.0, 1.0);

    if (s < GRAY_THRESHOLD) {
        int gray = (int)std::round(v * 23.0);
        return (uint8_t)(232 + std::min(gray, 23));
    }

    if (!std::isfinite(hue_deg)) hue_deg = 0.0;
    double h = fmod(fmod(hue_deg, 360.0) + 360.0, 360.0) / 60.0;
    double c = v * s;
    double x = c * (1 - fabs(fmod(h, 2.0) - 1));
    double m = v - c;

    double r, g, b;
    switch ((int)h) {
        case 0:  r = c; g = x; b = 0; break;
        case 1:  r = x; g = c; b = 0; break;
        case 2:  r = 0; g = c; b = x; break;
        case 3:  r = 0; g = x; b = c; break;
        case 4:  r = x; g = 0; b = c; break;
        default: r = c; g = 0; b = x; break;
    }

    // 6x6x6 cube
    int ri = (int)std::round(std::clamp((r + m) * 5.0, 0.0, 5.0));
    int gi = (int)std::round(std::clamp((g + m) * 5.0, 0.0, 5.0));
    int bi = (int)std::round(std::clamp((b + m) * 5.0, 0.0, 5.0));
    return (uint8_t)(16 + 36 * ri + 6 * gi + bi);
}

int shade_index(double norm) {
    if (!(norm > 0.0)) norm = 0.0;  // Also catches NaN
    if (norm > 1.0) norm = 1.0;
    // Gamma < 1 lifts low counts into denser glyphs sooner
    double scaled = std::pow(norm, SHADE_GAMMA) * (NUM_SHADES - 1);
    return std::clamp((int)std::lround(scaled), 0, NUM_SHADES - 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// RENDERING
// ═══════════════════════════════════════════════════════════════════════════

int encode_frame(const std::vector<int>& iters, int width, int height, int max_iter,
                 std::string& out) {
    if (width <= 0 || height <= 0) return 0;

    int directives = 0;
    char buf[24];

    for (int y = 0; y < height; y++) {
        int active = -1;  // No color set
        const int* row = &iters[(size_t)y * width];

        for (int x = 0; x < width; x++) {
            int iter = row[x];
            if (iter >= max_iter) {
                // Interior: blank on the default background
                if (active >= 0) {
                    out += RESET;
                    directives++;
                    active = -1;
                }
                out += ' ';
                continue;
            }

            double norm = (double)iter / max_iter;
            int color = color_index(norm);
            if (color != active) {
                snprintf(buf, sizeof(buf), CSI "38;5;%dm", color);
                out += buf;
                directives++;
                active = color;
            }
            out += shade_glyph(norm);
        }

        if (active >= 0) {
            out += RESET;
            directives++;
        }
        out += '\n';
    }
    return directives;
}

int render_frame(Complex c, int width, int height, int max_iter, std::string& out,
                 int threads) {
    static thread_local std::vector<int> iters;
    compute_escape_grid(c, width, height, max_iter, iters, threads);
    out.reserve(out.size() + (size_t)std::max(0, width) * std::max(0, height) * 4);
    return encode_frame(iters, width, height, max_iter, out);
}

bool write_frame(int fd, const std::string& buf) {
    const char* p = buf.data();
    size_t left = buf.size();
    while (left > 0) {
        ssize_t n = write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= (size_t)n;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// FRAME PACING
// ═══════════════════════════════════════════════════════════════════════════

FramePacer::FramePacer(double target_fps)
    : target_fps_(target_fps > 0 ? target_fps : 60.0),
      fps_smooth_(target_fps_),
      last_tick_(std::chrono::steady_clock::now()) {}

double FramePacer::tick() {
    auto now = std::chrono::steady_clock::now();
    double dt = std::chrono::duration<double>(now - last_tick_).count();
    last_tick_ = now;
    return dt;
}

double FramePacer::elapsed() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - last_tick_).count();
}

double FramePacer::pace(double frame_cost, double target_interval) {
    // Overrun: no catch-up, the next dt simply comes out larger
    if (!(frame_cost < target_interval)) return 0.0;
    double remaining = target_interval - std::max(frame_cost, 0.0);
    std::this_thread::sleep_for(std::chrono::duration<double>(remaining));
    return remaining;
}

double FramePacer::record_frame(double frame_cost) {
    frames_++;
    double fps_inst = frame_cost > 0 ? 1.0 / frame_cost : target_fps_;
    fps_smooth_ = fps_smooth_ * FPS_SMOOTHING + fps_inst * (1.0 - FPS_SMOOTHING);
    return fps_smooth_;
}

// ═══════════════════════════════════════════════════════════════════════════
// CLI PARSING
// ═══════════════════════════════════════════════════════════════════════════

static bool is_imag_unit(char c) { return c == 'i' || c == 'I'; }

bool parse_complex(const char* str, double& re, double& im) {
    re = 0;
    im = 0;

    while (*str == ' ' || *str == '\t') str++;
    if (*str == '\0') return false;

    char* end;
    double first = strtod(str, &end);
    const char* p = end;

    if (p == str) {
        // Bare unit: "i", "+i", "-i"
        double sign = 1.0;
        if (*p == '+' || *p == '-') sign = (*p++ == '-') ? -1.0 : 1.0;
        if (!is_imag_unit(*p)) return false;
        im = sign;
        p++;
    } else if (is_imag_unit(*p)) {
        // Pure imaginary: "0.5i"
        im = first;
        p++;
    } else {
        re = first;
        if (*p == '+' || *p == '-') {
            double sign = (*p == '-') ? -1.0 : 1.0;
            const char* imag_start = p + 1;
            if (is_imag_unit(*imag_start)) {
                im = sign;
                p = imag_start + 1;
            } else {
                double mag = strtod(imag_start, &end);
                if (end == imag_start || !is_imag_unit(*end)) return false;
                im = sign * mag;
                p = end + 1;
            }
        }
    }

    while (*p == ' ' || *p == '\t') p++;
    return *p == '\0' && std::isfinite(re) && std::isfinite(im);
}

bool parse_count(const char* str, uint64_t& value) {
    int base = 10;
    const char* digits = str;
    if (str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        base = 16;
        digits = str + 2;
    }
    // strtoull would take a sign or whitespace; only digits are allowed
    if (!isxdigit((unsigned char)*digits)) return false;

    char* end;
    errno = 0;
    unsigned long long v = strtoull(digits, &end, base);
    if (*end != '\0' || errno == ERANGE) return false;
    value = v;
    return true;
}
