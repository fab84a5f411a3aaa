#include "minifin_log.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

bool log_entry_enabled()
{
    static int cached = -1;
    if (cached < 0) {
        const char *value = getenv("MINIFIN_DEBUG");
        cached = (value && value[0] && strcmp(value, "0") != 0) ? 1 : 0;
    }
    return cached == 1;
}

void log_function_entry(const char *func, const char *fmt, ...)
{
    if (!func || !fmt) return;
    if (!log_entry_enabled()) return;
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "[minifin] %s(): ", func);
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    va_end(args);
}
