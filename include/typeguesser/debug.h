/**
 * @file debug.h
 * @brief Diagnostic tracing for the type guessing engine.
 */

#ifndef TYPEGUESSER_DEBUG_H
#define TYPEGUESSER_DEBUG_H

#include <cstdarg>
#include <cstdio>

namespace typeguesser {

struct DebugConfig {
    bool verbose = false;
    FILE* output = nullptr;

    DebugConfig() = default;

    static DebugConfig all() {
        DebugConfig config;
        config.verbose = true;
        return config;
    }

    bool enabled() const {
        return verbose;
    }
};

/**
 * @class DebugTrace
 * @brief printf-style logging of guessing decisions.
 *
 * Nothing is written unless DebugConfig::verbose is set. Output goes to
 * DebugConfig::output, or stdout when that is null.
 *
 * @note Thread Safety: DebugTrace holds no mutable state, but lines written
 *       by guessers on different threads to the same FILE* may interleave.
 */
class DebugTrace {
public:
    explicit DebugTrace(const DebugConfig& config = DebugConfig())
        : config_(config) {}

    bool enabled() const { return config_.enabled(); }
    bool verbose() const { return config_.verbose; }

    // Note: The format attribute uses index 2 for fmt because 'this' is implicit parameter 1
    #if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
    #endif
    void log(const char* fmt, ...) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[typeguesser] ");
        va_list args;
        va_start(args, fmt);
        vfprintf(out, fmt, args);
        va_end(args);
        fprintf(out, "\n");
        fflush(out);
    }

    // Logs without format string interpretation; use for caller-supplied text.
    void log_str(const char* msg) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[typeguesser] %s\n", msg);
        fflush(out);
    }

    void log_decision(const char* decision, const char* reason) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[typeguesser] DECISION: %s | Reason: %s\n", decision, reason);
        fflush(out);
    }

    void log_transition(const char* from_type, const char* to_type, const char* why) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[typeguesser] TYPE: %s -> %s (%s)\n", from_type, to_type, why);
        fflush(out);
    }

    void log_size(const char* type, unsigned integer_digits, unsigned fractional_digits,
                  unsigned string_length) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[typeguesser] SIZE %s: digits=%u scale=%u length=%u\n", type,
                integer_digits, fractional_digits, string_length);
        fflush(out);
    }

    const DebugConfig& config() const { return config_; }

private:
    DebugConfig config_;

    FILE* stream() const { return config_.output ? config_.output : stdout; }
};

}  // namespace typeguesser

#endif  // TYPEGUESSER_DEBUG_H
