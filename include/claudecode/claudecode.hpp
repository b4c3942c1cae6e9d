// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file claudecode.hpp
/// @brief Master include for the claudecode SDK
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <claudecode/callback_registry.hpp>
#include <claudecode/client.hpp>
#include <claudecode/control.hpp>
#include <claudecode/dispatcher.hpp>
#include <claudecode/errors.hpp>
#include <claudecode/log.hpp>
#include <claudecode/session.hpp>
#include <claudecode/sink.hpp>
#include <claudecode/transport.hpp>
#include <claudecode/transport_pipe.hpp>
#include <claudecode/types.hpp>

namespace claudecode
{

/// SDK version string
inline constexpr const char* kSdkVersion = "0.1.0";

} // namespace claudecode
