#include <iostream>
#include <string>

#include "resflow/core/conversion_engine.h"
#include "resflow/core/node_directory.h"
#include "resflow/core/time_source.h"
#include "test.h"

#define RF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

using resflow_test::make_converter;
using resflow_test::make_recipe;

int test_engine_lifecycle() {
  // poll() only ticks once initialized and once per interval.
  {
    resflow::InMemoryNodeDirectory dir;
    auto c1 = make_converter("C1", {"R1"});
    c1.resources["A"] = 10;
    dir.register_node(c1);

    resflow::ManualTimeSource clock(0);
    resflow::EngineConfig cfg;
    cfg.processing_interval_ms = 500;
    resflow::ConversionEngine engine(cfg, &dir, nullptr, &clock);
    engine.register_conversion_recipe(make_recipe("R1", {{"A", 10}}, {{"B", 5}}, 1000));
    const auto pid = engine.start_conversion_process("C1", "R1").process_id;

    clock.advance_ms(2000);
    RF_ASSERT(!engine.is_initialized());
    RF_ASSERT(!engine.poll());
    RF_ASSERT(engine.process(pid)->active);

    engine.initialize();
    RF_ASSERT(engine.is_initialized());
    RF_ASSERT(!engine.poll());

    clock.advance_ms(499);
    RF_ASSERT(!engine.poll());
    clock.advance_ms(1);
    RF_ASSERT(engine.poll());
    RF_ASSERT(!engine.process(pid)->active);
    RF_ASSERT(dir.resource_amount("C1", "B") == 5.0);
    RF_ASSERT(!engine.poll());

    // Initializing twice does not re-arm the interval.
    engine.initialize();
    clock.advance_ms(500);
    RF_ASSERT(engine.poll());
  }

  // dispose() drops definitions, processes and chains; nodes keep their state.
  {
    resflow::InMemoryNodeDirectory dir;
    auto c1 = make_converter("C1", {"R1"});
    c1.resources["A"] = 10;
    dir.register_node(c1);

    resflow::ManualTimeSource clock(0);
    resflow::ConversionEngine engine({}, &dir, nullptr, &clock);
    engine.initialize();
    engine.register_conversion_recipe(make_recipe("R1", {{"A", 10}}, {{"B", 5}}, 1000));
    engine.register_conversion_chain({"CH", "Chain", {"R1"}});
    resflow::ChainExecutionId exec = resflow::kInvalidId;
    RF_ASSERT(engine.start_conversion_chain("CH", &exec));

    engine.dispose();
    RF_ASSERT(!engine.is_initialized());
    RF_ASSERT(engine.find_recipe("R1") == nullptr);
    RF_ASSERT(engine.active_process_ids().empty());
    RF_ASSERT(!engine.chain_execution(exec).has_value());
    RF_ASSERT(dir.get_node("C1")->active_process_ids.size() == 1);
    RF_ASSERT(dir.resource_amount("C1", "A") == 0.0);

    clock.advance_ms(5000);
    RF_ASSERT(!engine.poll());
    engine.tick();
    RF_ASSERT(dir.resource_amount("C1", "B") == 0.0);

    // The engine is usable again after re-registration.
    engine.initialize();
    engine.register_conversion_recipe(make_recipe("R0", {}, {{"B", 1}}, 0));
    auto c2 = make_converter("C2", {"R0"});
    dir.register_node(c2);
    const auto r = engine.start_conversion_process("C2", "R0");
    RF_ASSERT(r.success);
    engine.tick();
    RF_ASSERT(dir.resource_amount("C2", "B") == 1.0);
  }

  // A directory and sink attached after construction are used from then on.
  {
    resflow::ManualTimeSource clock(0);
    resflow::ConversionEngine engine({}, nullptr, nullptr, &clock);
    engine.register_conversion_recipe(make_recipe("R1", {{"A", 10}}, {{"B", 5}}, 1000));
    engine.register_conversion_chain({"CH", "Chain", {"R1"}});

    const auto early = engine.start_conversion_process("C1", "R1");
    RF_ASSERT(!early.success);
    RF_ASSERT(early.error_kind == resflow::FlowErrorKind::DirectoryUnavailable);

    resflow::ChainExecutionId orphan = resflow::kInvalidId;
    RF_ASSERT(engine.start_conversion_chain("CH", &orphan));
    RF_ASSERT(engine.chain_execution(orphan)->failed);
    RF_ASSERT(engine.chain_execution(orphan)->error_message == "Converter node directory unavailable");

    resflow::InMemoryNodeDirectory dir;
    auto c1 = make_converter("C1", {"R1"});
    c1.resources["A"] = 10;
    dir.register_node(c1);
    resflow::RecordingEventSink sink;
    engine.set_node_directory(&dir);
    engine.set_event_sink(&sink);
    RF_ASSERT(engine.node_directory() == &dir);

    resflow::ChainExecutionId exec = resflow::kInvalidId;
    RF_ASSERT(engine.start_conversion_chain("CH", &exec));
    RF_ASSERT(engine.chain_execution(exec)->running());
    RF_ASSERT(sink.count<resflow::ChainStepStarted>() == 1);
    RF_ASSERT(dir.resource_amount("C1", "A") == 0.0);

    // Clearing the sink drops later events; the run itself continues.
    engine.set_event_sink(nullptr);
    clock.advance_ms(1000);
    engine.tick();
    RF_ASSERT(engine.chain_execution(exec)->completed);
    RF_ASSERT(sink.count<resflow::ChainCompleted>() == 0);
    RF_ASSERT(dir.resource_amount("C1", "B") == 5.0);
  }

  // Re-registering a recipe mid-run leaves the running process's captured
  // efficiency and its credited outputs untouched.
  {
    resflow::InMemoryNodeDirectory dir;
    auto c1 = make_converter("C1", {"R1"});
    c1.resources["A"] = 10;
    dir.register_node(c1);
    resflow::ManualTimeSource clock(0);
    resflow::ConversionEngine engine({}, &dir, nullptr, &clock);
    engine.register_conversion_recipe(make_recipe("R1", {{"A", 10}}, {{"B", 5}}, 1000));

    const auto started = engine.start_conversion_process("C1", "R1");
    RF_ASSERT(started.success);
    RF_ASSERT(resflow_test::near(*engine.process(started.process_id)->applied_efficiency, 1.0));

    RF_ASSERT(engine.register_conversion_recipe(make_recipe("R1", {{"A", 10}}, {{"B", 5}}, 1000, 0.1)));
    RF_ASSERT(resflow_test::near(engine.find_recipe("R1")->base_efficiency, 0.1));

    clock.advance_ms(1000);
    engine.tick();
    const auto done = engine.process(started.process_id);
    RF_ASSERT(done.has_value());
    RF_ASSERT(!done->active);
    RF_ASSERT(resflow_test::near(*done->applied_efficiency, 1.0));
    RF_ASSERT(dir.resource_amount("C1", "B") == 5.0);
  }

  // Ids are unique and increasing.
  {
    resflow::InMemoryNodeDirectory dir;
    dir.register_node(make_converter("C1", {"R0"}, 3));
    resflow::ManualTimeSource clock(0);
    resflow::ConversionEngine engine({}, &dir, nullptr, &clock);
    engine.register_conversion_recipe(make_recipe("R0", {}, {{"B", 1}}, 1000));
    const auto a = engine.start_conversion_process("C1", "R0").process_id;
    const auto b = engine.start_conversion_process("C1", "R0").process_id;
    const auto c = engine.start_conversion_process("C1", "R0").process_id;
    RF_ASSERT(a < b && b < c);
    const auto ids = engine.active_process_ids();
    RF_ASSERT(ids.size() == 3);
    RF_ASSERT(ids[0] == a);
  }

  // Completed history is bounded.
  {
    resflow::InMemoryNodeDirectory dir;
    dir.register_node(make_converter("C1", {"R0"}));
    resflow::ManualTimeSource clock(0);
    resflow::EngineConfig cfg;
    cfg.max_process_history = 2;
    resflow::ConversionEngine engine(cfg, &dir, nullptr, &clock);
    engine.register_conversion_recipe(make_recipe("R0", {}, {{"B", 1}}, 0));

    resflow::ProcessId first = resflow::kInvalidId;
    for (int i = 0; i < 4; ++i) {
      const auto r = engine.start_conversion_process("C1", "R0");
      RF_ASSERT(r.success);
      if (i == 0) first = r.process_id;
      engine.tick();
    }
    RF_ASSERT(engine.completed_processes().size() == 2);
    RF_ASSERT(!engine.process(first).has_value());
    RF_ASSERT(dir.resource_amount("C1", "B") == 4.0);
  }

  return 0;
}
