#include "tty.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef YAMLVIEW_PLATFORM_POSIX
#include <sys/fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

using namespace yamlview;

void
yamlview::tty_get_term_size(int* rows, int* cols) {
    *cols = 80;
    *rows = 50;

#ifdef YAMLVIEW_PLATFORM_POSIX
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        *rows = w.ws_row;
        *cols = w.ws_col;
        return;
    }

    auto term_fd = open(ctermid(nullptr), O_RDONLY);
    if (term_fd >= 0) {
        bool ok = ioctl(term_fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0;
        close(term_fd);
        if (ok) {
            *rows = w.ws_row;
            *cols = w.ws_col;
            return;
        }
    }
#endif

    const char* env_cols = getenv("COLUMNS");
    const char* env_rows = getenv("LINES");
    if (env_cols && env_rows) {
        int c = std::atoi(env_cols);
        int r = std::atoi(env_rows);
        if (c > 0 && r > 0) {
            *cols = c;
            *rows = r;
        }
    }
}

ColorProfile
yamlview::tty_detect_color_profile() {
#ifdef YAMLVIEW_PLATFORM_POSIX
    // If we're not outputting to a terminal, we don't output any colors.
    // NOTE: This will prevent colored output when piping to less or when
    //       redirecting to files.
    if (isatty(STDOUT_FILENO) == 0) {
        return ColorProfile::None;
    }

    const char* no_color = getenv("NO_COLOR");
    if (no_color != nullptr && no_color[0] != '\0') {
        return ColorProfile::None;
    }

    // The COLORTERM variable is usually available to indicate 24bit color support.
    const char* colorterm_var = getenv("COLORTERM");
    if (colorterm_var != nullptr) {
        const std::string colorterm(colorterm_var);
        if (colorterm == "24bit" || colorterm == "truecolor") {
            return ColorProfile::TrueColor;
        }
    }

    // And if that's not supported, fall back to checking terminfo with tput.
    FILE* pipe = popen("tput colors 2>&1", "r");  // stderr isn't captured, so redirect it to stdout.
    if (pipe) {
        char buffer[16];
        bool buffer_valid = fgets(buffer, 16, pipe) != nullptr;
        pclose(pipe);
        if (buffer_valid) {
            // NOTE: atoi returns 0 on failure
            int colors = std::atoi(buffer);
            if (colors >= 256) {
                return ColorProfile::Ansi256;
            }
            if (colors >= 8) {
                return ColorProfile::Ansi16;
            }
        }
    }
#endif
    return ColorProfile::None;
}
