/*

config.hpp
----------

Global build configuration for smtpchan.

Define SMTPCHAN_NO_EXCEPTIONS to disable the exception-based helpers in
throwing.hpp. Define SMTPCHAN_USE_STANDALONE_ASIO to build against standalone
Asio instead of Boost.Asio.

*/

#pragma once

#if defined(SMTPCHAN_NO_EXCEPTIONS)
#define SMTPCHAN_THROWING_ENABLED 0
#else
#define SMTPCHAN_THROWING_ENABLED 1
#endif
