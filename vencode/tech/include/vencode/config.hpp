#pragma once

#if defined(__clang__) && defined(__clang_minor__)
#define VENCODE_CLANG (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) && defined(__GNUC_MINOR__) && defined(__GNUC_PATCHLEVEL__)
#define VENCODE_GCC (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#endif

#if defined(__GNUC__)
#define VENCODE_LIKELY(x) (__builtin_expect(!!(x), 1))
#define VENCODE_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define VENCODE_LIKELY(x) (!!(x))
#define VENCODE_UNLIKELY(x) (!!(x))
#endif
