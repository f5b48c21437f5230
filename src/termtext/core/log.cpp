// log.cpp created on 2018-03-01 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "log.h"

namespace termtext::core {


Logger& Logger::default_instance(Level initial_level)
{
    static Logger instance(initial_level);
    return instance;
}


void Logger::log(Level level, std::string_view message)
{
    if (enabled(level))
        m_handler(level, message);
}


} // namespace termtext::core
