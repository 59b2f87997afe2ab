#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "resflow/core/conversion_engine.h"
#include "resflow/core/node_directory.h"
#include "resflow/core/state_validation.h"
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

namespace {

bool has_error_containing(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

} // namespace

int test_state_validation() {
  // A full run stays consistent at every tick.
  {
    resflow::InMemoryNodeDirectory dir;
    auto c1 = make_converter("C1", {"R1"}, 2);
    c1.resources["A"] = 30;
    dir.register_node(c1);
    dir.register_node(make_converter("C2", {"R2"}));

    resflow::ManualTimeSource clock(0);
    resflow::ConversionEngine engine({}, &dir, nullptr, &clock);
    engine.register_conversion_recipe(make_recipe("R1", {{"A", 10}}, {{"B", 5}}, 1000));
    engine.register_conversion_recipe(make_recipe("R2", {{"B", 5}}, {{"C", 1}}, 1500));
    engine.register_conversion_chain({"CH", "Chain", {"R1", "R2"}});

    RF_ASSERT(engine.start_conversion_chain("CH"));
    RF_ASSERT(engine.start_conversion_chain("CH"));
    RF_ASSERT(engine.start_conversion_chain("CH"));

    for (int i = 0; i < 8; ++i) {
      const auto errors = resflow::validate_engine_state(engine, &dir);
      if (!errors.empty()) {
        for (const auto& e : errors) std::cerr << "  " << e << "\n";
      }
      RF_ASSERT(errors.empty());
      clock.advance_ms(500);
      engine.tick();
    }
    RF_ASSERT(resflow::validate_engine_state(engine, &dir).empty());
    RF_ASSERT(resflow::validate_engine_state(engine).empty());
  }

  // A converter listing a process the engine is not running is reported.
  {
    resflow::InMemoryNodeDirectory dir;
    auto c1 = make_converter("C1", {"R1"}, 2);
    c1.active_process_ids = {42};
    dir.register_node(c1);

    resflow::ConversionEngine engine({}, &dir);
    const auto errors = resflow::validate_engine_state(engine, &dir);
    RF_ASSERT(errors.size() == 1);
    RF_ASSERT(has_error_containing(errors, "Converter 'C1' lists process 42 which is not active"));
  }

  // A process missing from its converter's list is reported.
  {
    resflow::InMemoryNodeDirectory dir;
    auto c1 = make_converter("C1", {"R1"});
    c1.resources["A"] = 10;
    dir.register_node(c1);
    resflow::ManualTimeSource clock(0);
    resflow::ConversionEngine engine({}, &dir, nullptr, &clock);
    engine.register_conversion_recipe(make_recipe("R1", {{"A", 10}}, {{"B", 5}}, 1000));
    const auto r = engine.start_conversion_process("C1", "R1");
    RF_ASSERT(r.success);

    resflow::ConverterNodePatch patch;
    patch.active_process_ids = std::vector<resflow::ProcessId>{};
    RF_ASSERT(dir.update_node_data("C1", patch).ok);

    const auto errors = resflow::validate_engine_state(engine, &dir);
    RF_ASSERT(has_error_containing(errors, "is not listed on converter 'C1'"));
  }

  return 0;
}
