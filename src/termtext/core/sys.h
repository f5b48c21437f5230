// sys.h created on 2018-08-17 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CORE_SYS_H
#define TERMTEXT_CORE_SYS_H

#include <string>
#include <string_view>
#include <cstdint>
#include <ctime>

namespace termtext::core {


/// Broken-down local time, thread-safe
std::tm local_time(std::time_t t);

/// OS thread ID of the calling thread, as shown by `top -H` or `ps -L`
uint64_t thread_id();

/// Message for errno value (default: current errno)
std::string error_str();
std::string error_str(int err);

/// Write all of `data` to file descriptor `fd`, resuming interrupted writes.
/// \returns false if not all data was written, errno tells why
bool write_all(int fd, std::string_view data);


} // namespace termtext::core

#endif // TERMTEXT_CORE_SYS_H
