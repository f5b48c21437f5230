// error.h created on 2018-09-23 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CORE_ERROR_H
#define TERMTEXT_CORE_ERROR_H

#include <stdexcept>
#include <string>

namespace termtext::core {


/// Base of recoverable termtext errors
class Error: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};


/// Input rejected by a widget, the widget state was not modified.
class ValidationError: public Error {
public:
    using Error::Error;
};


/// Canvas refused to set a cell (position out of area, rune doesn't fit).
class CanvasError: public Error {
public:
    using Error::Error;
};


/// Internal assumption about a collaborator was broken.
/// Not derived from Error - handlers of recoverable errors must not catch it.
class InvariantError: public std::logic_error {
public:
    using std::logic_error::logic_error;
};


} // namespace termtext::core

#endif // TERMTEXT_CORE_ERROR_H
