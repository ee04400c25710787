/// @file eventsource.hpp
/// @brief Umbrella header for the eventsource-cpp library.
///
/// Include this single header for access to all public types:
/// Document, DocumentEvent, EventInstruction, ReplayConfig, ValueNode,
/// RootContainer, the path resolver, the JSON parser/serializer, the wire
/// codec and Error.

#pragma once

#include <eventsource-cpp/applier.hpp>
#include <eventsource-cpp/config.hpp>
#include <eventsource-cpp/document.hpp>
#include <eventsource-cpp/error.hpp>
#include <eventsource-cpp/event.hpp>
#include <eventsource-cpp/json.hpp>
#include <eventsource-cpp/logging.hpp>
#include <eventsource-cpp/path.hpp>
#include <eventsource-cpp/replay.hpp>
#include <eventsource-cpp/value.hpp>
#include <eventsource-cpp/wire.hpp>
