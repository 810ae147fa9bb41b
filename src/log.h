// log.h
#pragma once
#include <cstdio>

namespace fsched {

// Global verbosity switch (VERBOSE in the config, --quiet on the CLI).
void set_log_verbose(bool on);
bool log_verbose();

}  // namespace fsched

// Debug trace, printed only when verbose.
#define FSLOG(...)                        \
    do                                    \
    {                                     \
        if (::fsched::log_verbose())      \
        {                                 \
            fprintf(stderr, __VA_ARGS__); \
            fflush(stderr);               \
        }                                 \
    } while (0)

// Degradations and failures of collaborators; always printed.
#define FSWARN(...)                   \
    do                                \
    {                                 \
        fprintf(stderr, __VA_ARGS__); \
        fflush(stderr);               \
    } while (0)
