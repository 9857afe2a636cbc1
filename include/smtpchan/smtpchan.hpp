#pragma once

#include <smtpchan/config.hpp>

#include <smtpchan/detail/log.hpp>
#include <smtpchan/detail/result.hpp>
#include <smtpchan/detail/timeout_config.hpp>

#include <smtpchan/net/line_splitter.hpp>
#include <smtpchan/net/tls_options.hpp>
#include <smtpchan/net/transport.hpp>
#include <smtpchan/net/upgradable_stream.hpp>

#include <smtpchan/smtp/types.hpp>
#include <smtpchan/smtp/stream_adapter.hpp>
#include <smtpchan/smtp/command_correlator.hpp>
#include <smtpchan/smtp/channel.hpp>

#if SMTPCHAN_THROWING_ENABLED
#include <smtpchan/throwing.hpp>
#endif
