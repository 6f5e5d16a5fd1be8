#pragma once

#ifdef _WIN32
#include <winsock2.h>
#include <winsock.h>
#include <winbase.h>
#endif

#include <cerrno>
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <string>

#ifdef _WIN32
#define LOG_LEVEL_ERROR "ERROR"
#define LOG_LEVEL_WARN  "WARNING"
#define LOG_LEVEL_INFO  "INFO"
#else
#define LOG_LEVEL_ERROR "\x1b[31mERROR\x1b[0m"
#define LOG_LEVEL_WARN  "\x1b[33mWARNING\x1b[0m"
#define LOG_LEVEL_INFO  "\x1b[34mINFO\x1b[0m"
#endif
#define LOG_LEVEL_DEBUG "DEBUG"

static inline void nalstream_debug(const char *level, const char *function, const char *s, ...)
{
    va_list args;
    va_start(args, s);
    char fmt[256] = {0};
    snprintf(fmt, sizeof(fmt), "[nalstream][%s][%s] %s\n", level, function, s);
    vfprintf(stderr, fmt, args);
    va_end(args);
}

#ifndef NDEBUG
#define NLS_LOG_DEBUG(...) nalstream_debug(LOG_LEVEL_DEBUG, __func__, __VA_ARGS__)
#else
#define NLS_LOG_DEBUG(...) ;
#endif

#ifdef __NALSTREAM_SILENT__
#define NLS_LOG_ERROR(...) ;
#define NLS_LOG_WARN(...) ;
#define NLS_LOG_INFO(...) ;
#undef NLS_LOG_DEBUG
#define NLS_LOG_DEBUG(...) ;
#else
#define NLS_LOG_ERROR(...) nalstream_debug(LOG_LEVEL_ERROR, __func__, __VA_ARGS__)
#define NLS_LOG_WARN(...)  nalstream_debug(LOG_LEVEL_WARN,  __func__, __VA_ARGS__)
#define NLS_LOG_INFO(...)  nalstream_debug(LOG_LEVEL_INFO,  __func__, __VA_ARGS__)
#endif

static inline void log_platform_error(const char *aux)
{
#ifndef _WIN32
    if (aux) {
        NLS_LOG_ERROR("%s: %s %d", aux, strerror(errno), errno);
    } else {
        NLS_LOG_ERROR("%s %d", strerror(errno), errno);
    }
#else
    wchar_t *s = NULL;
    FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        NULL, WSAGetLastError(),
        MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        (LPWSTR)&s, 0, NULL
    );

    if (aux) {
        NLS_LOG_ERROR("%s: %ls %d", aux, s, WSAGetLastError());
    } else {
        NLS_LOG_ERROR("%ls %d", s, WSAGetLastError());
    }
    LocalFree(s);
#endif
}
