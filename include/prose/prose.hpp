//! # prose
//!
//! A scannerless parsing core. Grammars are ordinary value types that parse
//! themselves from a `ParseStream`, keep `Span`s into the shared `Source`,
//! and turn back into their exact text with `unparse`.
//!
//! ```cpp
//! #include "prose/prose.hpp"
//!
//! using namespace prose;
//! using namespace prose::parsable;
//!
//! auto number = prose::parse<U32>("1234");
//! if (is_err(number)) {
//!     std::cerr << unwrap_err(number);
//!     return 1;
//! }
//! ```

#ifndef PROSE_PROSE_HPP
#define PROSE_PROSE_HPP

#include "prose/common.hpp"
#include "prose/diag/diagnostic.hpp"
#include "prose/diag/emitter.hpp"
#include "prose/log/log.hpp"
#include "prose/parsable/everything.hpp"
#include "prose/parsable/exact.hpp"
#include "prose/parsable/numbers.hpp"
#include "prose/parsable/optional.hpp"
#include "prose/parsable/whitespace.hpp"
#include "prose/parse/error.hpp"
#include "prose/parse/parsable.hpp"
#include "prose/parse/pattern.hpp"
#include "prose/parse/stream.hpp"
#include "prose/text/indexed_string.hpp"
#include "prose/text/source.hpp"
#include "prose/text/span.hpp"

#endif // PROSE_PROSE_HPP
