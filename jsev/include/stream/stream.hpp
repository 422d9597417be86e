//! # jsev Streaming API
//!
//! Convenience header pulling in the whole streaming parser.
//!
//! | Header | Contents |
//! |--------|----------|
//! | `stream/byte_source.hpp` | `ByteSource`, `StringSource`, `IstreamSource`, `FileSource` |
//! | `stream/cursor.hpp` | `Cursor` |
//! | `stream/lexer.hpp` | escape decoding, number lexing |
//! | `stream/event.hpp` | `Event`, `EventType`, `Number` |
//! | `stream/parse_error.hpp` | `ParseError`, `ParseErrorKind` |
//! | `stream/channel.hpp` | `Channel<T>` |
//! | `stream/event_sink.hpp` | `EventSink`, `ChannelSink`, `CallbackSink` |
//! | `stream/parser.hpp` | `StreamParser`, `ParserOptions`, `parse_events()` |
//! | `stream/event_stream.hpp` | `EventStream` |
//! | `stream/event_writer.hpp` | `EventWriter`, `events_to_json()` |

#pragma once

#include "stream/byte_source.hpp"
#include "stream/channel.hpp"
#include "stream/cursor.hpp"
#include "stream/event.hpp"
#include "stream/event_sink.hpp"
#include "stream/event_stream.hpp"
#include "stream/event_writer.hpp"
#include "stream/lexer.hpp"
#include "stream/parse_error.hpp"
#include "stream/parser.hpp"
