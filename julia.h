/*
 * JULIA CORE
 * Animated Julia set evaluation and ANSI 256-color frame encoding.
 *
 * Pipeline per frame:
 *   advance_animation  - damped random walk of the Julia parameter
 *   compute_escape_grid - escape counts for every cell (row-parallel)
 *   encode_frame       - glyphs + color directives with run-length compression
 *   FramePacer         - fixed-rate pacing and smoothed FPS
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <complex>
#include <string>
#include <vector>

typedef std::complex<double> Complex;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI ESCAPE CODES
// ═══════════════════════════════════════════════════════════════════════════

#define ESC "\x1b"
#define CSI ESC "["

#define CLEAR_SCREEN    CSI "2J"
#define CLEAR_LINE      CSI "2K"
#define CURSOR_HOME     CSI "H"
#define CURSOR_HIDE     CSI "?25l"
#define CURSOR_SHOW     CSI "?25h"
#define ALT_BUFFER_ON   CSI "?1049h"
#define ALT_BUFFER_OFF  CSI "?1049l"
#define RESET           CSI "0m"

// ═══════════════════════════════════════════════════════════════════════════
// PARAMETER ANIMATION
// ═══════════════════════════════════════════════════════════════════════════

const uint64_t DEFAULT_SEED = 0x9e3779b97f4a7c15ULL;
const uint64_t RNG_MULTIPLIER = 0x2545F4914F6CDD1DULL;
const double MAX_ANIM_DT = 0.1;   // Longer pauses are clamped to this

struct AnimatorConfig {
    Complex base{-0.8, 0.156};    // Julia parameter the walk wanders around
    double radius = 0.40;         // Soft bound for |offset|
    double accel_strength = 1.2;  // Random acceleration magnitude
    double damping = 0.85;        // Velocity damping per unit time
};

struct AnimationState {
    Complex offset{0.0, 0.0};
    Complex velocity{0.0, 0.0};
    uint64_t rng = DEFAULT_SEED;
};

struct AnimationStep {
    AnimationState state;
    Complex parameter;            // base + offset
};

AnimationState init_animation(uint64_t seed);

// xorshift64* draw mapped to [-1, 1). Advances `state`.
double rng_next_signed(uint64_t& state);

AnimationStep advance_animation(const AnimationState& state, const AnimatorConfig& config, double dt);

// ═══════════════════════════════════════════════════════════════════════════
// JULIA COMPUTATION
// ═══════════════════════════════════════════════════════════════════════════

const double VIEW_RE_SPAN = 3.0;
const double VIEW_IM_SPAN = 2.0;
const double ESCAPE_RADIUS_SQ = 4.0;

// Maps a grid cell to the fixed viewport [-1.5, 1.5] x [-1, 1].
// Character cells are not square, so the image is stretched vertically.
inline Complex viewport_point(int x, int y, int width, int height) {
    double re = (double)x / width * VIEW_RE_SPAN - VIEW_RE_SPAN / 2.0;
    double im = (double)y / height * VIEW_IM_SPAN - VIEW_IM_SPAN / 2.0;
    return {re, im};
}

// Iterations of z <- z^2 + c starting at z0 until |z|^2 > 4.
// Returns max_iter for points that never escape.
inline int escape_count(Complex c, Complex z0, int max_iter) {
    double zr = z0.real(), zi = z0.imag();
    const double cr = c.real(), ci = c.imag();
    int iter = 0;
    while (zr * zr + zi * zi <= ESCAPE_RADIUS_SQ && iter < max_iter) {
        double zri = zr * zi;
        double tmp = zr * zr - zi * zi + cr;
        zi = zri + zri + ci;   // Same op order as the AVX2 kernel
        zr = tmp;
        iter++;
    }
    return iter;
}

// Fills `iters` (resized to width*height, row-major) with escape counts.
// threads <= 0 picks hardware_concurrency().
void compute_escape_grid(Complex c, int width, int height, int max_iter,
                         std::vector<int>& iters, int threads = 0);

// ═══════════════════════════════════════════════════════════════════════════
// COLOR MAPPING
// ═══════════════════════════════════════════════════════════════════════════

const double PALETTE_SATURATION = 0.9;
const double PALETTE_VALUE = 1.0;
const double GRAY_THRESHOLD = 0.08;   // Below this saturation use the gray ramp
const double SHADE_GAMMA = 0.85;
const int NUM_SHADES = 11;

extern const char* const SHADES[NUM_SHADES];

// HSV -> xterm 256-color index. Cube [16, 231], or gray ramp [232, 255]
// when saturation is below GRAY_THRESHOLD.
uint8_t hsv_to_256(double hue_deg, double s, double v);

// norm = iters / max_iter in [0, 1)
inline uint8_t color_index(double norm) {
    return hsv_to_256(norm * 360.0, PALETTE_SATURATION, PALETTE_VALUE);
}

// Index into SHADES; non-decreasing in norm.
int shade_index(double norm);

inline const char* shade_glyph(double norm) {
    return SHADES[shade_index(norm)];
}

// ═══════════════════════════════════════════════════════════════════════════
// RENDERING
// ═══════════════════════════════════════════════════════════════════════════

// Appends one frame (height rows, each ending in '\n') to `out`.
// A color directive is emitted only when the color changes; interior cells
// and row ends reset attributes. Returns the number of directives emitted.
int encode_frame(const std::vector<int>& iters, int width, int height, int max_iter,
                 std::string& out);

int render_frame(Complex c, int width, int height, int max_iter, std::string& out,
                 int threads = 0);

// Writes the whole buffer, retrying short writes and EINTR.
// Returns false with errno set on failure.
bool write_frame(int fd, const std::string& buf);

// ═══════════════════════════════════════════════════════════════════════════
// FRAME PACING
// ═══════════════════════════════════════════════════════════════════════════

const double FPS_SMOOTHING = 0.85;

class FramePacer {
public:
    explicit FramePacer(double target_fps = 60.0);

    double target_fps() const { return target_fps_; }
    double target_interval() const { return 1.0 / target_fps_; }

    // Seconds since the previous tick (or since construction).
    double tick();

    // Seconds since the last tick; the cost of the frame in progress.
    double elapsed() const;

    // Sleeps max(0, target_interval - frame_cost). Returns seconds slept.
    double pace(double frame_cost, double target_interval);

    // Folds one frame cost into the smoothed rate. Display only.
    double record_frame(double frame_cost);

    uint64_t frames() const { return frames_; }
    double smoothed_fps() const { return fps_smooth_; }

private:
    double target_fps_;
    double fps_smooth_;
    uint64_t frames_ = 0;
    std::chrono::steady_clock::time_point last_tick_;
};

// ═══════════════════════════════════════════════════════════════════════════
// CLI PARSING
// ═══════════════════════════════════════════════════════════════════════════

// Accepts "re", "re+imi", "re-imi", "imi", "i", "-i".
bool parse_complex(const char* str, double& re, double& im);

// Unsigned decimal, or hex with a 0x/0X prefix. A leading 0 is still decimal.
bool parse_count(const char* str, uint64_t& value);
