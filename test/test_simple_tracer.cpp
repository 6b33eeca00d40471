// These are tests for `SimpleTracer`, which creates `SimpleContext` values for
// new spans.

#include <tracewire/propagation.h>
#include <tracewire/sampler.h>
#include <tracewire/simple_tracer.h>
#include <tracewire/tracer_config.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "mocks/dict_readers.h"
#include "mocks/id_generators.h"
#include "mocks/loggers.h"
#include "mocks/samplers.h"
#include "test.h"

using namespace tracewire::tracing;

#define TEST_SIMPLE_TRACER(x) TEST_CASE("simple_tracer: " x, "[simple_tracer]")

namespace {

FinalizedTracerConfig quiet_config(const std::shared_ptr<Sampler>& sampler) {
  TracerConfig config;
  config.sampler = sampler;
  config.logger = std::make_shared<NullLogger>();
  config.log_on_startup = false;
  auto finalized = finalize_config(config);
  REQUIRE(finalized);
  return *finalized;
}

}  // namespace

TEST_SIMPLE_TRACER("fresh context consults the sampler once") {
  const bool decision = GENERATE(true, false);
  CAPTURE(decision);

  const auto sampler = std::make_shared<MockSampler>(decision);
  const SimpleTracer tracer{quiet_config(sampler),
                            std::make_shared<SequentialIDGenerator>()};

  SpanOptions<SimpleContext> options;
  options.operation_name = "get-user";
  const SimpleContext context = tracer.start(options);

  REQUIRE(sampler->calls.size() == 1);
  REQUIRE(sampler->calls[0].trace_id == context.trace_id());
  REQUIRE(sampler->calls[0].operation_name == "get-user");
  REQUIRE(context.sampled() == decision);
  REQUIRE(context.sampled_state() ==
          (decision ? Sampled::SAMPLED : Sampled::NOT_SAMPLED));
  REQUIRE(context.baggage().empty());
  // The generator counts up from one: trace ID first, then span ID.
  REQUIRE(context.trace_id() == TraceID(1));
  REQUIRE(context.span_id() == 2);
}

TEST_SIMPLE_TRACER("explicit sampling decision overrides the sampler") {
  const auto sampler = std::make_shared<MockSampler>(true);
  const SimpleTracer tracer{quiet_config(sampler)};

  SpanOptions<SimpleContext> options;
  options.operation_name = "get-user";

  SECTION("not sampled") {
    options.sampled = Sampled::NOT_SAMPLED;
    REQUIRE_FALSE(tracer.start(options).sampled());
  }

  SECTION("sampled") {
    sampler->decision = false;
    options.sampled = Sampled::SAMPLED;
    REQUIRE(tracer.start(options).sampled());
  }

  REQUIRE(sampler->calls.empty());
}

TEST_SIMPLE_TRACER("trace IDs are 64 bits regardless of configuration") {
  TracerConfig config;
  config.sampler = std::make_shared<ConstSampler>(true);
  config.logger = std::make_shared<NullLogger>();
  config.log_on_startup = false;
  config.trace_id_128_bit = true;
  auto finalized = finalize_config(config);
  REQUIRE(finalized);
  const SimpleTracer tracer{*finalized};

  for (int i = 0; i < 10; ++i) {
    const auto context = tracer.fresh_context("op", std::nullopt);
    REQUIRE_FALSE(context.trace_id().high);
  }
}

TEST_SIMPLE_TRACER("child context inherits trace ID and sampling decision") {
  const auto sampler = std::make_shared<MockSampler>(true);
  const SimpleTracer tracer{quiet_config(sampler)};

  const bool parent_sampled = GENERATE(true, false);
  CAPTURE(parent_sampled);

  SimpleContext parent = tracer.fresh_context(
      "parent", parent_sampled ? Sampled::SAMPLED : Sampled::NOT_SAMPLED);
  parent.set_baggage_item("user", "alice");

  // The sampler would say "keep," but a child never asks.
  const SimpleContext child = tracer.child_context(parent);

  REQUIRE(child.trace_id() == parent.trace_id());
  REQUIRE(child.span_id() != parent.span_id());
  REQUIRE(child.sampled() == parent_sampled);
  REQUIRE(child.baggage().empty());
  REQUIRE(sampler->calls.empty());

  // The parent is unchanged.
  REQUIRE(parent.baggage_item("user") == std::optional<std::string_view>("alice"));
}

TEST_SIMPLE_TRACER("start uses the first reference whatever its kind") {
  const auto sampler = std::make_shared<MockSampler>(true);
  const SimpleTracer tracer{quiet_config(sampler),
                            std::make_shared<SequentialIDGenerator>()};

  const SimpleContext first(100, 101, Sampled::NOT_SAMPLED);
  const SimpleContext second(200, 201, Sampled::SAMPLED);

  SpanOptions<SimpleContext> options;
  options.operation_name = "handle";

  SECTION("follows_from first") {
    options.references = {Reference<SimpleContext>::follows_from(first),
                          Reference<SimpleContext>::child_of(second)};
  }

  SECTION("child_of first") {
    options.references = {Reference<SimpleContext>::child_of(first),
                          Reference<SimpleContext>::follows_from(second)};
  }

  // An explicit override does not apply to a child.
  options.sampled = Sampled::SAMPLED;

  const SimpleContext context = tracer.start(options);
  REQUIRE(context.trace_id() == first.trace_id());
  REQUIRE_FALSE(context.sampled());
  REQUIRE(context.span_id() != first.span_id());
  REQUIRE(sampler->calls.empty());
}

TEST_SIMPLE_TRACER("a tree of contexts shares one trace ID") {
  const SimpleTracer tracer{
      quiet_config(std::make_shared<ConstSampler>(true))};

  const SimpleContext root = tracer.fresh_context("root", std::nullopt);
  std::vector<SimpleContext> generation{root};
  std::unordered_set<std::uint64_t> span_ids{root.span_id()};
  for (int depth = 0; depth < 4; ++depth) {
    std::vector<SimpleContext> next;
    for (const auto& parent : generation) {
      next.push_back(tracer.child_context(parent));
      next.push_back(tracer.child_context(parent));
    }
    for (const auto& context : next) {
      REQUIRE(context.trace_id() == root.trace_id());
      REQUIRE(context.sampled());
      span_ids.insert(context.span_id());
    }
    generation = std::move(next);
  }
  // 1 + 2 + 4 + 8 + 16
  REQUIRE(span_ids.size() == 31);
}

TEST_SIMPLE_TRACER("logs its configuration on startup") {
  TracerConfig config;
  config.sampler = std::make_shared<ConstSampler>(true);
  const auto logger = std::make_shared<MockLogger>();
  config.logger = logger;

  SECTION("when enabled") {
    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    const SimpleTracer tracer{*finalized};
    REQUIRE(logger->startup_count() == 1);
    REQUIRE(logger->error_count() == 0);
    const auto& message = std::get<std::string>(logger->entries[0].payload);
    REQUIRE(message.find(tracer.config()) != std::string::npos);
  }

  SECTION("but not when disabled") {
    config.log_on_startup = false;
    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    const SimpleTracer tracer{*finalized};
    REQUIRE(logger->entries.empty());
  }
}

TEST_SIMPLE_TRACER("config describes the carrier keys") {
  const SimpleTracer tracer{
      quiet_config(std::make_shared<ConstSampler>(true))};
  const auto config = nlohmann::json::parse(tracer.config());
  REQUIRE(config["context"] == "simple");
  REQUIRE(config["trace_id_128_bit"] == false);
  const auto keys = config["carrier_keys"].get<std::vector<std::string>>();
  REQUIRE(keys == std::vector<std::string>{"ot-tracer-traceid",
                                           "ot-tracer-spanid",
                                           "ot-tracer-sampled",
                                           "ot-baggage-*"});
}

TEST_SIMPLE_TRACER("context JSON") {
  SimpleContext context(12, 34, Sampled::SAMPLED);
  context.set_baggage_item("user", "alice");

  const auto json = nlohmann::json::parse(context.to_json());
  REQUIRE(json["trace_id"] == 12);
  REQUIRE(json["span_id"] == 34);
  REQUIRE(json["sampled"] == true);
  REQUIRE(json["baggage"] == nlohmann::json{{"user", "alice"}});
}

TEST_SIMPLE_TRACER("context JSON with baggage that is not UTF-8") {
  const std::unordered_map<std::string, std::string> carrier{
      {"ot-tracer-traceid", "12"},
      {"ot-tracer-spanid", "34"},
      {"ot-tracer-sampled", "1"},
      {"ot-baggage-user", "\xff\xfe"}};
  const MockDictReader reader{carrier};
  const auto context = extract_simple(CarrierFormat::TEXT_MAP, reader);
  REQUIRE(context);

  std::string dumped;
  REQUIRE_NOTHROW(dumped = context->to_json());
  const auto json = nlohmann::json::parse(dumped);
  REQUIRE(json["trace_id"] == 12);
  REQUIRE(json["baggage"]["user"].is_string());
  REQUIRE(json["baggage"]["user"] != "\xff\xfe");
}
