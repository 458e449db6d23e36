#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <sentinel/audit/journal.hpp>
#include <sentinel/common/error.hpp>
#include <sentinel/execution/engine.hpp>
#include <sentinel/policy/loader.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/taint/flow.hpp>
#include <sentinel/taint/tree.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

// Process exit codes; decisions map onto 0-2 so scripts can branch on them.
inline constexpr auto kExitAllow = 0;
inline constexpr auto kExitWarn = 1;
inline constexpr auto kExitBlock = 2;
inline constexpr auto kExitPolicyError = 3;
inline constexpr auto kExitEvaluationError = 4;
inline constexpr auto kExitUsage = 64;

inline constexpr auto kCliOrigin = std::string_view{"cli_input"};

void setup_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  // stdout carries command output; diagnostics go to stderr.
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  sentinel lint --policy FILE [--strict-roots]\n"
            << "  sentinel check --policy FILE (--sink ID | --function NAME)\n"
            << "                 (--value STR... | --json FILE)\n"
            << "                 [--taint TAG...] [--audit-db PATH] [--trace]\n"
            << "  sentinel audit --audit-db PATH\n\n"
            << "Exit codes: 0 allow, 1 warn, 2 block, 3 policy error, "
               "4 evaluation error\n\n";
  std::cout << options << '\n';
}

std::string fingerprint_hex(const sentinel::schema::policy_t& policy) {
  return sentinel::schema::to_hex(sentinel::schema::bytes_view_t{
      policy.fingerprint().data(), policy.fingerprint().size()});
}

int run_lint(const po::variables_map& vm,
             const sentinel::policy::builder_options_t& options) {
  auto policy = sentinel::policy::load_policy_file(
      vm["policy"].as<std::string>(), options);
  auto summary = sentinel::schema::object_t{};
  summary.emplace_back("fingerprint", fingerprint_hex(*policy));
  summary.emplace_back("default_mode",
                       std::string{to_string(policy->default_mode())});
  summary.emplace_back("validators",
                       static_cast<int64_t>(policy->validators().size()));
  summary.emplace_back("sinks", static_cast<int64_t>(policy->sinks().size()));
  std::cout << sentinel::schema::to_json(summary) << '\n';
  return kExitAllow;
}

int run_check(const po::variables_map& vm,
              const sentinel::policy::builder_options_t& options) {
  auto policy = sentinel::policy::load_policy_file(
      vm["policy"].as<std::string>(), options);

  auto sink_id = std::string{};
  if (vm.contains("sink")) {
    sink_id = vm["sink"].as<std::string>();
  } else {
    const auto function = vm["function"].as<std::string>();
    const auto* sink = policy->find_sink_for_function(function);
    if (sink == nullptr) {
      throw sentinel::common::unknown_sink_error{function};
    }
    sink_id = sink->id;
  }
  auto decider = sentinel::execution::decider{policy, sink_id};

  auto arguments = std::vector<sentinel::schema::value_t>{};
  if (vm.contains("json")) {
    arguments.push_back(
        sentinel::policy::load_document(vm["json"].as<std::string>()));
  }
  if (vm.contains("value")) {
    for (const auto& value : vm["value"].as<std::vector<std::string>>()) {
      arguments.emplace_back(value);
    }
  }

  auto context = sentinel::audit::event_context_t{};
  if (vm.contains("taint")) {
    const auto& names = vm["taint"].as<std::vector<std::string>>();
    const auto tags = sentinel::taint::tag_set_t{std::begin(names),
                                                 std::end(names)};
    auto trail = sentinel::taint::flow_trail{kCliOrigin};
    for (auto& argument : arguments) {
      auto tree = sentinel::taint::tag(argument, tags);
      auto collected = sentinel::taint::collect_tags(tree);
      context.taint_tags.insert(std::begin(collected), std::end(collected));
      argument = sentinel::taint::strip(tree);
    }
    trail.record(sink_id);
    context.taint_flow = trail.points();
  }

  auto evaluation = decider.evaluate(arguments);

  if (vm.contains("trace")) {
    for (const auto& step : evaluation.steps) {
      spdlog::info("{}[{}]: {} {}", step.validator_id, step.argument_index,
                   to_string(step.outcome), step.detail);
    }
  }

  std::optional<sentinel::storage::storage<
      sentinel::storage::rocksdb_storage_tag>>
      store;
  if (vm.contains("audit-db")) {
    store = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(
        vm["audit-db"].as<std::string>());
  }
  auto journal = sentinel::audit::journal{
      sentinel::audit::journal::make_stderr_logger(),
      store ? &*store : nullptr};
  journal.record(evaluation, *policy, context);

  std::cout << sentinel::schema::to_json(evaluation.decision) << '\n';
  switch (sentinel::schema::kind_of(evaluation.decision)) {
    case sentinel::schema::decision_kind_t::allow:
      return kExitAllow;
    case sentinel::schema::decision_kind_t::warn:
      return kExitWarn;
    case sentinel::schema::decision_kind_t::block:
      return kExitBlock;
  }
  return kExitBlock;
}

int run_audit(const po::variables_map& vm) {
  auto store =
      sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
          vm["audit-db"].as<std::string>());
  for (const auto& record : store.list_audit_records()) {
    std::cout << sentinel::audit::to_json_line(record) << '\n';
  }
  return kExitAllow;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto options = po::options_description{"sentinel options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "lint|check|audit")(
      "policy,p", po::value<std::string>(), "policy file (YAML or JSON)")(
      "sink,s", po::value<std::string>(), "sink id to decide for")(
      "function,f", po::value<std::string>(),
      "qualified function name whose sink to decide for")(
      "value,v", po::value<std::vector<std::string>>()->multitoken(),
      "string argument(s) handed to the sink")(
      "json,j", po::value<std::string>(),
      "structured argument loaded from a YAML/JSON file")(
      "taint,t", po::value<std::vector<std::string>>()->multitoken(),
      "taint tags attached to every argument")(
      "audit-db", po::value<std::string>(),
      "RocksDB path for persisted audit records")(
      "strict-roots", "reject path validators whose roots do not exist")(
      "trace", "log every evaluation step")(
      "log-level", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "also write diagnostics to this file");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    print_help(options);
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return vm.contains("help") ? 0 : kExitUsage;
  }

  setup_logging(log_level, log_file);

  auto builder_options = sentinel::policy::builder_options_t{};
  builder_options.verify_roots_exist = vm.contains("strict-roots");

  auto usage = [&](std::string_view message) {
    spdlog::error("{}", message);
    spdlog::shutdown();
    return kExitUsage;
  };

  auto exit_code = kExitUsage;
  try {
    if (command == "lint") {
      if (!vm.contains("policy")) {
        return usage("lint requires --policy");
      }
      exit_code = run_lint(vm, builder_options);
    } else if (command == "check") {
      if (!vm.contains("policy")) {
        return usage("check requires --policy");
      }
      if (vm.contains("sink") == vm.contains("function")) {
        return usage("check requires exactly one of --sink or --function");
      }
      if (!vm.contains("value") && !vm.contains("json")) {
        return usage("check requires --value or --json");
      }
      exit_code = run_check(vm, builder_options);
    } else if (command == "audit") {
      if (!vm.contains("audit-db")) {
        return usage("audit requires --audit-db");
      }
      exit_code = run_audit(vm);
    } else {
      return usage("command must be lint|check|audit");
    }
  } catch (const sentinel::common::evaluation_error& e) {
    spdlog::error("evaluation failed in validator '{}': {}", e.validator_id(),
                  e.what());
    exit_code = kExitEvaluationError;
  } catch (const sentinel::common::error& e) {
    spdlog::error("{} ({})", e.what(), to_string(e.code()));
    exit_code = kExitPolicyError;
  }

  spdlog::shutdown();
  return exit_code;
}
