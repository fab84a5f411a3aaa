#ifndef MINIFIN_LOG_H
#define MINIFIN_LOG_H

// True when MINIFIN_DEBUG is set to something other than "" or "0".
bool log_entry_enabled();

void log_function_entry(const char *func, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

#define LOG_ENTER(fmt, ...) log_function_entry(__func__, fmt, ##__VA_ARGS__)

#endif // MINIFIN_LOG_H
