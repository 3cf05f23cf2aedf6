/// @file coedit.hpp
/// @brief Umbrella header for the coedit-cpp library.
///
/// Include this single header for access to all public types:
/// CollaborationEngine, Session, User, Edit, SessionEvent, OperationLog,
/// transform(), Dispatcher, Transport, IdGenerator, EngineOptions, and Error.
/// JSON interop lives in coedit-cpp/json.hpp and is not included here.

#pragma once

#include <coedit-cpp/dispatcher.hpp>
#include <coedit-cpp/edit.hpp>
#include <coedit-cpp/engine.hpp>
#include <coedit-cpp/error.hpp>
#include <coedit-cpp/event.hpp>
#include <coedit-cpp/operation_log.hpp>
#include <coedit-cpp/options.hpp>
#include <coedit-cpp/palette.hpp>
#include <coedit-cpp/protocol.hpp>
#include <coedit-cpp/transform.hpp>
#include <coedit-cpp/transport.hpp>
#include <coedit-cpp/types.hpp>
