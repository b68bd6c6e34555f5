/*
 * JULIATERM
 * Animated Julia set in the terminal, 256-color shaded text.
 *
 * The Julia parameter c drifts around a base value by a damped random walk,
 * so the set slowly morphs while the frame is redrawn at a fixed rate.
 *
 * Controls:
 *   Q/ESC/Ctrl+C        - Quit
 *
 * CLI Arguments:
 *   --base <re+imi>     - Base Julia parameter (default -0.8+0.156i)
 *   --radius <r>        - Soft bound on the wander distance
 *   --accel <a>         - Random acceleration strength
 *   --damping <d>       - Velocity damping
 *   --fps <n>           - Target frame rate
 *   --iters <n>         - Max iterations per cell
 *   --seed <n>          - Random walk seed
 *   --frames <n>        - Exit after n frames
 *   --threads <n>       - Worker threads (0 = all cores)
 */

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <cerrno>
#include <cmath>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <unistd.h>
#include <getopt.h>

#include "julia.h"
#include "terminal.h"

// ═══════════════════════════════════════════════════════════════════════════
// CLI ARGUMENT PARSING
// ═══════════════════════════════════════════════════════════════════════════

struct Options {
    AnimatorConfig anim;
    double fps = 60.0;
    int max_iter = 120;
    uint64_t seed = DEFAULT_SEED;
    uint64_t frame_limit = 0;   // 0 = run until cancelled
    int threads = 0;
};

// Whole-string strtod; rejects trailing garbage and non-finite values
static bool parse_number(const char* str, double& value) {
    char* end;
    errno = 0;
    value = strtod(str, &end);
    return end != str && *end == '\0' && errno != ERANGE && std::isfinite(value);
}

void print_usage(const char* prog) {
    printf("Usage: %s [options]\n", prog);
    printf("\nOptions:\n");
    printf("  --base <re+imi>    Base Julia parameter (default -0.8+0.156i)\n");
    printf("  --radius <r>       Soft bound for the parameter offset (default 0.40)\n");
    printf("  --accel <a>        Random acceleration strength (default 1.2)\n");
    printf("  --damping <d>      Velocity damping per second (default 0.85)\n");
    printf("  --fps <n>          Target frame rate (default 60)\n");
    printf("  --iters <n>        Max iterations per cell (default 120)\n");
    printf("  --seed <n>         Random walk seed, decimal or 0x hex\n");
    printf("  --frames <n>       Exit after n frames (default: run until quit)\n");
    printf("  --threads <n>      Evaluator threads, 0 = all cores (default 0)\n");
    printf("  --help             Show this help message\n");
    printf("\nExamples:\n");
    printf("  %s --base -0.4+0.6i --radius 0.2\n", prog);
    printf("      Wander around a Douady rabbit-like parameter\n");
    printf("  %s --seed 42 --frames 600\n", prog);
    printf("      Reproducible 10 second run\n");
    printf("\nControls:\n");
    printf("  Q/ESC/Ctrl+C        - Quit\n");
}

// Returns -1 to continue, otherwise the process exit code
static int parse_options(int argc, char* argv[], Options& opts) {
    static struct option long_options[] = {
        {"base",    required_argument, 0, 'b'},
        {"radius",  required_argument, 0, 'r'},
        {"accel",   required_argument, 0, 'a'},
        {"damping", required_argument, 0, 'd'},
        {"fps",     required_argument, 0, 'f'},
        {"iters",   required_argument, 0, 'i'},
        {"seed",    required_argument, 0, 's'},
        {"frames",  required_argument, 0, 'n'},
        {"threads", required_argument, 0, 't'},
        {"help",    no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    double value;
    uint64_t count;
    while ((opt = getopt_long(argc, argv, "b:r:a:d:f:i:s:n:t:h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'b': {
                double re, im;
                if (!parse_complex(optarg, re, im)) {
                    fprintf(stderr, "Error: Invalid base parameter '%s'\n", optarg);
                    fprintf(stderr, "Expected format: re+imi (e.g., -0.8+0.156i)\n");
                    return 1;
                }
                opts.anim.base = Complex(re, im);
                break;
            }
            case 'r':
                if (!parse_number(optarg, value) || value <= 0) {
                    fprintf(stderr, "Error: Invalid radius '%s'\n", optarg);
                    return 1;
                }
                opts.anim.radius = value;
                break;
            case 'a':
                if (!parse_number(optarg, value) || value < 0) {
                    fprintf(stderr, "Error: Invalid acceleration '%s'\n", optarg);
                    return 1;
                }
                opts.anim.accel_strength = value;
                break;
            case 'd':
                if (!parse_number(optarg, value) || value < 0) {
                    fprintf(stderr, "Error: Invalid damping '%s'\n", optarg);
                    return 1;
                }
                opts.anim.damping = value;
                break;
            case 'f':
                if (!parse_number(optarg, value) || value <= 0) {
                    fprintf(stderr, "Error: Invalid frame rate '%s'\n", optarg);
                    return 1;
                }
                opts.fps = value;
                break;
            case 'i':
                if (!parse_count(optarg, count) || count < 1 || count > 1000000) {
                    fprintf(stderr, "Error: Invalid iteration count '%s'\n", optarg);
                    return 1;
                }
                opts.max_iter = (int)count;
                break;
            case 's':
                if (!parse_count(optarg, count)) {
                    fprintf(stderr, "Error: Invalid seed '%s'\n", optarg);
                    return 1;
                }
                opts.seed = count;
                break;
            case 'n':
                if (!parse_count(optarg, count)) {
                    fprintf(stderr, "Error: Invalid frame count '%s'\n", optarg);
                    return 1;
                }
                opts.frame_limit = count;
                break;
            case 't':
                if (!parse_count(optarg, count) || count > 1024) {
                    fprintf(stderr, "Error: Invalid thread count '%s'\n", optarg);
                    return 1;
                }
                opts.threads = (int)count;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (optind < argc) {
        fprintf(stderr, "Error: Unexpected argument '%s'\n", argv[optind]);
        print_usage(argv[0]);
        return 1;
    }
    return -1;
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    Options opts;
    int rc = parse_options(argc, argv, opts);
    if (rc >= 0) return rc;

    std::atomic<bool> cancel{false};
    install_signal_handlers(cancel);

    AnimationState anim = init_animation(opts.seed);
    std::string out;
    int cols, rows;
    terminal_size(cols, rows);

    bool write_failed = false;
    int write_errno = 0;
    uint64_t frames = 0;
    auto start = std::chrono::steady_clock::now();

    {
        TerminalGuard term;
        FramePacer pacer(opts.fps);
        bool clear_pending = false;

        while (!cancel.load()) {
            double dt = pacer.tick();

            if (term.interactive()) {
                Key key;
                while ((key = read_key()) != KEY_NONE) {
                    if (key == KEY_QUIT) cancel.store(true);
                }
                if (cancel.load()) break;
            }

            if (resize_requested()) {
                terminal_size(cols, rows);
                clear_pending = true;
            }

            AnimationStep step = advance_animation(anim, opts.anim, dt);
            anim = step.state;
            Complex c = step.parameter;

            // Last row is reserved for the status line
            int width = cols;
            int height = std::max(0, rows - 1);

            out.clear();
            if (clear_pending) {
                out += CLEAR_SCREEN;
                clear_pending = false;
            }
            out += CURSOR_HOME;
            render_frame(c, width, height, opts.max_iter, out, opts.threads);

            pacer.record_frame(pacer.elapsed());

            char status[192];
            int len = snprintf(status, sizeof(status),
                "Julia anim | c=(%+.3f,%+.3f) | Frame %llu | FPS %.1f (q/Ctrl+C to quit)",
                c.real(), c.imag(), (unsigned long long)pacer.frames(), pacer.smoothed_fps());
            len = std::min(std::max(len, 0), std::min((int)sizeof(status) - 1, cols));
            char move[32];
            snprintf(move, sizeof(move), CSI "%d;1H" CLEAR_LINE, rows);
            out += move;
            out.append(status, len);

            if (!write_frame(STDOUT_FILENO, out)) {
                write_errno = errno;
                write_failed = true;
                break;
            }
            frames = pacer.frames();

            if (opts.frame_limit && frames >= opts.frame_limit) break;

            pacer.pace(pacer.elapsed(), pacer.target_interval());
        }
    }

    if (write_failed) {
        fprintf(stderr, "Error: Frame write failed: %s\n", strerror(write_errno));
        return 1;
    }

    double total = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    double avg = total > 0 ? frames / total : 0.0;
    printf("Exited. Frames: %llu Time: %.2fs Avg FPS: %.2f\n",
           (unsigned long long)frames, total, avg);
    return 0;
}
