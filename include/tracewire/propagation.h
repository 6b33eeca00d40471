#pragma once

// This component provides functions for injecting a context into a carrier and
// for extracting a context from a carrier.
//
// There are two carrier formats, `CarrierFormat::TEXT_MAP` and
// `CarrierFormat::HTTP_HEADERS`. Both use the same keys and values. The
// difference is that HTTP header names are case-insensitive, so extraction
// from `HTTP_HEADERS` lower-cases every key before looking at it.
//
// `SimpleContext` uses these keys:
//
// - "ot-tracer-traceid": trace ID in decimal (required),
// - "ot-tracer-spanid": span ID in decimal (required),
// - "ot-tracer-sampled": "1" if sampled, "0" if not (required, any decimal
//   other than 1 means not sampled),
// - "ot-baggage-<key>": one per baggage item.
//
// `B3Context` uses these keys:
//
// - "x-b3-traceid": trace ID in hexadecimal, 16 or 32 characters (required),
// - "x-b3-spanid": span ID in hexadecimal, 16 characters (required),
// - "x-b3-parentspanid": parent span ID in hexadecimal, 16 characters
//   (optional, ignored if malformed),
// - "x-b3-sampled": "true" if sampled, anything else if not,
// - "x-b3-flags": "1" if debug, anything else if not,
// - "ot-baggage-<key>": one per baggage item.
//
// Injection cannot fail. Extraction either produces a complete context or
// returns an `Error` with code `Error::MALFORMED_CARRIER` that describes every
// required field that was missing or malformed.

#include <string_view>

#include "b3_context.h"
#include "dict_reader.h"
#include "dict_writer.h"
#include "expected.h"
#include "simple_context.h"

namespace tracewire {
namespace tracing {

enum class CarrierFormat { TEXT_MAP, HTTP_HEADERS };

std::string_view to_string_view(CarrierFormat);

void inject(const SimpleContext& context, CarrierFormat format,
            DictWriter& writer);
void inject(const B3Context& context, CarrierFormat format, DictWriter& writer);

Expected<SimpleContext> extract_simple(CarrierFormat format,
                                       const DictReader& reader);
Expected<B3Context> extract_b3(CarrierFormat format, const DictReader& reader);

}  // namespace tracing
}  // namespace tracewire
