/*
 * err.cc
 *
 * flexible error reporting, using a printf-style interface and
 * syslog-style severity levels
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#include <stdarg.h>
#include <stdio.h>
#include <atomic>
#include "err.h"

namespace grove {

static std::atomic<int> stderr_log_level{log_warning};

static int printf_err_func(log_level level, const char *format, va_list args) {

    if (level > stderr_log_level.load(std::memory_order_relaxed)) {
        return 0;
    }

    // output error level message
    //
    const char *msg = "";
    switch(level) {
    case log_emerg:   msg = "emergency: ";     break;
    case log_alert:   msg = "alert: ";         break;
    case log_crit:    msg = "critical: ";      break;
    case log_err:     msg = "error: ";         break;
    case log_warning: msg = "warning: ";       break;
    case log_notice:  msg = "notice: ";        break;
    case log_info:    msg = "informational: "; break;
    case log_debug:   msg = "debug: ";         break;
    case log_none:  break;  // leave msg empty
    }
    int retval = fprintf(stderr, "grove %s", msg);

    // output formatted argument list
    //
    retval += vfprintf(stderr, format, args);

    return retval;
}

static int silent_err_func(log_level, const char *, va_list) {
    return 0;
}

static std::atomic<printf_err_ptr> printf_err_static{printf_err_func};

int printf_err(log_level level, const char *format, ...) {
    va_list args;
    va_start(args, format);
    int retval = printf_err_static.load()(level, format, args);
    va_end(args);
    return retval;
}

void register_printf_err_callback(printf_err_ptr callback) {

    if (callback == nullptr) {
        printf_err_static = silent_err_func;
    } else {
        printf_err_static = callback;
    }
}

void set_log_level(log_level level) {
    stderr_log_level = level;
}

}  // namespace grove
