#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "resflow/core/content_validation.h"
#include "resflow/core/conversion_content.h"
#include "resflow/core/conversion_engine.h"
#include "resflow/core/node_directory.h"
#include "resflow/core/state_validation.h"
#include "resflow/core/time_source.h"
#include "resflow/util/event_export.h"
#include "resflow/util/file_io.h"
#include "resflow/util/log.h"
#include "resflow/util/strings.h"

namespace {

#ifndef RESFLOW_VERSION
#define RESFLOW_VERSION "unknown"
#endif

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

// Every value given for a repeatable key ("--chain a --chain b").
std::vector<std::string> get_str_args(int argc, char** argv, const std::string& key) {
  std::vector<std::string> out;
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) out.push_back(argv[i + 1]);
  }
  return out;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

bool is_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool parse_count_arg(int argc, char** argv, const std::string& key, long long def, long long& out) {
  const std::string raw = get_str_arg(argc, argv, key, "");
  if (raw.empty()) {
    out = def;
    return true;
  }
  if (!is_digits(raw) || raw.size() > 12) {
    std::cerr << key << " expects a non-negative integer, got '" << raw << "'\n\n";
    return false;
  }
  out = std::stoll(raw);
  return true;
}

void print_usage(const char* exe) {
  std::cout << "resflow CLI v" << RESFLOW_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "resflow_cli") << " --content PATH [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --content PATH        Recipes, chains and converter nodes JSON (default: data/content/example_economy.json)\n";
  std::cout << "  --chain ID            Start this chain (repeatable; default: every chain, sorted by id)\n";
  std::cout << "  --ticks N             Run N scheduler ticks (default: 10)\n";
  std::cout << "  --interval-ms N       Tick interval on the simulated clock (default: 1000)\n";
  std::cout << "  --events-jsonl PATH   Write every published event as JSON Lines\n";
  std::cout << "  --validate-content    Validate the content file and exit\n";
  std::cout << "  --quiet               Only print errors\n";
  std::cout << "  --log-level L         debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --version             Print version and exit\n";
  std::cout << "  -h, --help            Show this help\n";
}

void print_chain(const resflow::ChainExecutionStatus& c) {
  const char* state = c.completed ? "completed" : (c.failed ? "failed" : (c.paused ? "paused" : "running"));
  std::cout << "  " << c.chain_id << " #" << c.execution_id << ": " << state << " ("
            << c.current_step_index << "/" << c.recipe_ids.size() << " steps, progress "
            << resflow::format_fixed(c.progress * 100.0, 0) << "%)\n";
  if (!c.error_message.empty()) std::cout << "    error: " << c.error_message << "\n";
  for (std::size_t i = 0; i < c.step_status.size(); ++i) {
    const auto& s = c.step_status[i];
    std::cout << "    [" << i << "] " << s.recipe_id << " " << resflow::process_status_to_string(s.status);
    if (!s.converter_id.empty()) std::cout << " @ " << s.converter_id;
    std::cout << "\n";
  }
  if (c.completed) {
    std::cout << "    final outputs:";
    for (const auto& o : c.final_outputs) std::cout << " " << o.type << "=" << resflow::format_fixed(o.amount);
    std::cout << "\n";
  }
}

void print_nodes(const resflow::ConverterNodeDirectory& directory) {
  for (const auto& n : directory.get_nodes()) {
    std::vector<std::string> types;
    for (const auto& [type, _] : n.resources) types.push_back(type);
    std::sort(types.begin(), types.end());

    std::cout << "  " << n.id << " (" << resflow::node_type_to_string(n.type) << ", "
              << n.active_process_ids.size() << "/" << n.configuration.max_concurrent_processes << " busy):";
    if (types.empty()) std::cout << " (empty)";
    for (const auto& t : types) std::cout << " " << t << "=" << resflow::format_fixed(n.resources.at(t));
    std::cout << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << RESFLOW_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string content_path = get_str_arg(argc, argv, "--content", "data/content/example_economy.json");
    const std::string events_path = get_str_arg(argc, argv, "--events-jsonl", "");
    const bool quiet = has_flag(argc, argv, "--quiet");

    const std::string level_raw = get_str_arg(argc, argv, "--log-level", "warn");
    resflow::log::Level level = resflow::log::Level::Warn;
    if (!resflow::log::parse_level(level_raw, level)) {
      std::cerr << "Unknown --log-level: '" << level_raw << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    resflow::log::set_level(level);

    long long ticks = 0;
    long long interval_ms = 0;
    if (!parse_count_arg(argc, argv, "--ticks", 10, ticks) ||
        !parse_count_arg(argc, argv, "--interval-ms", 1000, interval_ms)) {
      print_usage(argv[0]);
      return 2;
    }
    if (interval_ms <= 0) {
      std::cerr << "--interval-ms must be positive\n\n";
      print_usage(argv[0]);
      return 2;
    }

    const auto content = resflow::load_conversion_content_from_file(content_path);

    if (has_flag(argc, argv, "--validate-content")) {
      const auto issues = resflow::validate_conversion_content_detailed(content);
      int errors = 0;
      for (const auto& is : issues) {
        const bool is_error = is.severity == resflow::ContentIssueSeverity::Error;
        if (is_error) ++errors;
        if (is_error || !quiet) {
          std::cerr << (is_error ? "  error: " : "  warning: ") << is.message << " [" << is.code << "]\n";
        }
      }
      if (errors > 0) {
        std::cerr << "Content validation failed (" << errors << " error(s))\n";
        return 1;
      }
      if (!quiet) std::cout << "Content OK\n";
      return 0;
    }

    resflow::InMemoryNodeDirectory directory;
    for (const auto& n : content.nodes) {
      std::string err;
      if (!directory.register_node(n, &err)) {
        std::cerr << "Invalid converter node: " << err << "\n";
        return 1;
      }
    }

    resflow::EngineConfig cfg;
    cfg.processing_interval_ms = interval_ms;

    resflow::ManualTimeSource clock(0);
    resflow::RecordingEventSink events;
    resflow::ConversionEngine engine(cfg, &directory, &events, &clock);

    std::vector<std::string> recipe_ids;
    for (const auto& [id, _] : content.recipes) recipe_ids.push_back(id);
    std::sort(recipe_ids.begin(), recipe_ids.end());
    for (const auto& id : recipe_ids) engine.register_conversion_recipe(content.recipes.at(id));
    for (const auto& [_, c] : content.chains) engine.register_conversion_chain(c);

    engine.initialize();

    std::vector<std::string> chain_ids = get_str_args(argc, argv, "--chain");
    if (chain_ids.empty()) chain_ids = engine.registry().chain_ids();

    std::vector<resflow::ChainExecutionId> started;
    for (const auto& id : chain_ids) {
      resflow::ChainExecutionId exec = resflow::kInvalidId;
      if (!engine.start_conversion_chain(id, &exec)) {
        std::cerr << "Unknown chain: '" << id << "'\n";
        return 2;
      }
      started.push_back(exec);
    }

    for (long long i = 0; i < ticks; ++i) {
      clock.advance_ms(interval_ms);
      engine.poll();
    }

    if (!events_path.empty()) {
      resflow::write_text_file(events_path, resflow::flow_events_to_jsonl(events.events()));
      if (!quiet) std::cout << "Events written to " << events_path << "\n";
    }

    if (!quiet) {
      std::cout << "After " << ticks << " tick(s) (" << clock.now_ms() << " ms):\n";
      std::cout << "Chains:\n";
      for (auto exec : started) {
        if (const auto c = engine.chain_execution(exec)) print_chain(*c);
      }
      std::cout << "Nodes:\n";
      print_nodes(directory);
      std::cout << "Events: " << events.events().size() << ", completed processes: "
                << engine.completed_processes().size() << ", active processes: "
                << engine.active_process_ids().size() << "\n";
    }

    const auto state_errors = resflow::validate_engine_state(engine, &directory);
    if (!state_errors.empty()) {
      std::cerr << "State validation failed:\n";
      for (const auto& e : state_errors) std::cerr << "  - " << e << "\n";
      return 1;
    }

    engine.dispose();
    return 0;
  } catch (const std::exception& e) {
    resflow::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
