// sys.cpp created on 2018-08-17 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "sys.h"

#include <system_error>
#include <cerrno>

#include <unistd.h>
#if defined(__linux__)
    #include <sys/syscall.h>
#elif defined(__APPLE__)
    #include <pthread.h>
#endif

namespace termtext::core {


std::tm local_time(std::time_t t)
{
    std::tm res {};
    if (localtime_r(&t, &res) == nullptr)
        return {};
    return res;
}


uint64_t thread_id()
{
#if defined(__linux__)
    return uint64_t(::syscall(SYS_gettid));
#elif defined(__APPLE__)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#else
    #error "thread_id: unsupported OS"
#endif
}


std::string error_str()
{
    return error_str(errno);
}


std::string error_str(int err)
{
    return std::generic_category().message(err);
}


bool write_all(int fd, std::string_view data)
{
    while (!data.empty()) {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n > 0) {
            data.remove_prefix(size_t(n));
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        return false;
    }
    return true;
}


} // namespace termtext::core
