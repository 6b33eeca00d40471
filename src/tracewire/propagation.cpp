#include <tracewire/propagation.h>

#include <cassert>
#include <string>
#include <unordered_map>

#include "carrier_fields.h"
#include "hex.h"
#include "parse_util.h"

namespace tracewire {
namespace tracing {
namespace {

// `LowerCaseKeysReader` is a `DictReader` over a copy of the entries of
// another `DictReader`, with every key converted to lower case. If two keys
// differ only in case, then the one visited last wins.
class LowerCaseKeysReader : public DictReader {
  std::unordered_map<std::string, std::string> entries_;

 public:
  explicit LowerCaseKeysReader(const DictReader& headers) {
    headers.visit([&](std::string_view key, std::string_view value) {
      std::string lower{key};
      to_lower(lower);
      entries_.insert_or_assign(std::move(lower), std::string(value));
    });
  }

  std::optional<std::string_view> lookup(std::string_view key) const override {
    const auto found = entries_.find(std::string(key));
    if (found == entries_.end()) {
      return std::nullopt;
    }
    return found->second;
  }

  void visit(const std::function<void(std::string_view key,
                                      std::string_view value)>& visitor)
      const override {
    for (const auto& [key, value] : entries_) {
      visitor(key, value);
    }
  }
};

void inject_baggage(const Baggage& baggage, DictWriter& writer) {
  std::string key;
  baggage.visit([&](std::string_view item_key, std::string_view value) {
    key.assign(Baggage::key_prefix.data(), Baggage::key_prefix.size());
    append(key, item_key);
    writer.set(key, value);
  });
}

// Any value is valid baggage, so this cannot fail.
Baggage extract_baggage(const DictReader& carrier) {
  Baggage baggage;
  carrier.visit([&](std::string_view key, std::string_view value) {
    if (starts_with(key, Baggage::key_prefix)) {
      key.remove_prefix(Baggage::key_prefix.size());
      baggage.set(std::string(key), std::string(value));
    }
  });
  return baggage;
}

Expected<std::uint64_t> parse_decimal(std::string_view input) {
  return parse_uint64(input, 10);
}

Expected<Sampled> parse_sampled_digit(std::string_view input) {
  auto result = parse_uint64(input, 10);
  if (auto* error = result.if_error()) {
    return std::move(*error);
  }
  return *result == 1 ? Sampled::SAMPLED : Sampled::NOT_SAMPLED;
}

// The B3 flag headers are permissive: any value other than the one that sets
// the flag leaves it unset.
Expected<bool> parse_b3_sampled(std::string_view input) {
  return input == "true";
}

Expected<bool> parse_b3_debug(std::string_view input) { return input == "1"; }

std::string extraction_name(std::string_view style, CarrierFormat format) {
  std::string name;
  append(name, style);
  name += ' ';
  append(name, to_string_view(format));
  return name;
}

void inject_ot(const SimpleContext& context, DictWriter& writer) {
  writer.set(ot::trace_id.key, context.trace_id().low_dec());
  writer.set(ot::span_id.key, std::to_string(context.span_id()));
  writer.set(ot::sampled.key, context.sampled() ? "1" : "0");
  inject_baggage(context.baggage(), writer);
}

Expected<SimpleContext> extract_ot(const DictReader& carrier,
                                   CarrierFormat format) {
  FieldErrors errors;
  const auto trace_id =
      read_field(carrier, ot::trace_id, &parse_decimal, errors);
  const auto span_id = read_field(carrier, ot::span_id, &parse_decimal, errors);
  const auto sampled =
      read_field(carrier, ot::sampled, &parse_sampled_digit, errors);
  if (!errors.empty()) {
    return errors.combined(extraction_name("ot-tracer", format));
  }

  assert(trace_id && span_id && sampled);
  return SimpleContext(*trace_id, *span_id, *sampled,
                       extract_baggage(carrier));
}

void inject_b3(const B3Context& context, DictWriter& writer) {
  writer.set(b3::trace_id.key, context.trace_id().hex_padded());
  writer.set(b3::span_id.key, hex_padded(context.span_id()));
  if (const auto& parent = context.parent_span_id()) {
    writer.set(b3::parent_span_id.key, hex_padded(*parent));
  }
  writer.set(b3::sampled.key, context.sampled() ? "true" : "false");
  writer.set(b3::flags.key, context.debug() ? "1" : "0");
  inject_baggage(context.baggage(), writer);
}

Expected<B3Context> extract_b3_fields(const DictReader& carrier,
                                      CarrierFormat format) {
  FieldErrors errors;
  const auto trace_id =
      read_field(carrier, b3::trace_id, &TraceID::parse_hex, errors);
  const auto span_id =
      read_field(carrier, b3::span_id, &parse_padded_hex_uint64, errors);
  const auto parent_span_id = read_field(carrier, b3::parent_span_id,
                                         &parse_padded_hex_uint64, errors);
  const auto sampled =
      read_field(carrier, b3::sampled, &parse_b3_sampled, errors);
  const auto debug = read_field(carrier, b3::flags, &parse_b3_debug, errors);
  if (!errors.empty()) {
    return errors.combined(extraction_name("B3", format));
  }

  assert(trace_id && span_id);
  B3Flags flags;
  if (sampled.value_or(false)) {
    flags.insert(B3Flag::SAMPLED);
  }
  if (debug.value_or(false)) {
    flags.insert(B3Flag::DEBUG);
  }

  return B3Context(*trace_id, *span_id, parent_span_id, flags,
                   extract_baggage(carrier));
}

}  // namespace

std::string_view to_string_view(CarrierFormat format) {
  switch (format) {
    case CarrierFormat::TEXT_MAP:
      return "text_map";
    case CarrierFormat::HTTP_HEADERS:
      return "http_headers";
  }
  return "unknown";
}

// Every reserved key is lower-case, so a context is written the same way to
// both carrier formats; the formats differ only when reading.

void inject(const SimpleContext& context, CarrierFormat, DictWriter& writer) {
  inject_ot(context, writer);
}

void inject(const B3Context& context, CarrierFormat, DictWriter& writer) {
  inject_b3(context, writer);
}

Expected<SimpleContext> extract_simple(CarrierFormat format,
                                       const DictReader& reader) {
  if (format == CarrierFormat::HTTP_HEADERS) {
    const LowerCaseKeysReader headers{reader};
    return extract_ot(headers, format);
  }
  return extract_ot(reader, format);
}

Expected<B3Context> extract_b3(CarrierFormat format, const DictReader& reader) {
  if (format == CarrierFormat::HTTP_HEADERS) {
    const LowerCaseKeysReader headers{reader};
    return extract_b3_fields(headers, format);
  }
  return extract_b3_fields(reader, format);
}

}  // namespace tracing
}  // namespace tracewire
