#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <custodia/actions/action_registry.hpp>
#include <custodia/attestation/attestation_aggregator.hpp>
#include <custodia/config/node_config.hpp>
#include <custodia/fingerprint/fingerprint.hpp>
#include <custodia/ledger/ledger_store.hpp>
#include <custodia/policy/custody_policy_validator.hpp>
#include <custodia/service/evidence_service.hpp>
#include <custodia/storage/rocksdb/storage.hpp>
#include <custodia/tamper/tamper_ledger.hpp>
#include <custodia/verification/verification_engine.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace custodia::schema;

namespace {

namespace po = boost::program_options;
using json = nlohmann::json;

constexpr auto kExitOk = 0;
constexpr auto kExitUsage = 1;
constexpr auto kExitRejected = 2;

struct usage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void install_logger(const custodia::config::node_config& config) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries command results, so console logging goes to stderr.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "custodia", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.log_level);
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{"missing --" + name};
  }
  return vm[name].as<std::string>();
}

evidence_id_t require_id(const po::variables_map& vm) {
  if (!vm.contains("evidence-id")) {
    throw usage_error{"missing --evidence-id"};
  }
  return vm["evidence-id"].as<evidence_id_t>();
}

hash32_t parse_fingerprint(const std::string& hex) {
  auto parsed = try_make_hash32(hex);
  if (!parsed) {
    throw usage_error{"fingerprint must be 32 bytes of hex: " + hex};
  }
  return *parsed;
}

bytes_t read_file(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    throw usage_error{"cannot read file '" + path + "'"};
  }
  return bytes_t{std::istreambuf_iterator<char>{input},
                 std::istreambuf_iterator<char>{}};
}

json parse_json(const std::string& text) {
  auto parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    throw usage_error{"--details/--json is not valid JSON"};
  }
  return parsed;
}

json to_json(const evidence_record_t& evidence) {
  return json{{"id", evidence.id},
              {"fingerprint", to_fingerprint_string(evidence.fingerprint)},
              {"caseId", evidence.case_id},
              {"collector", evidence.collector},
              {"registeredAt", evidence.registered_at},
              {"status", std::string{to_string(evidence.status)}},
              {"custodyEventCount", evidence.custody_event_count}};
}

json to_json(const custodia::service::custody_history_entry& entry) {
  auto out = json{{"index", entry.event.index},
                  {"action", entry.action_name},
                  {"actionFingerprint", to_fingerprint_string(entry.event.action)},
                  {"handler", entry.event.handler},
                  {"timestamp", entry.event.timestamp}};
  out["metadataHash"] = is_zero_hash(entry.event.metadata_hash)
                            ? json(nullptr)
                            : json(to_fingerprint_string(
                                  entry.event.metadata_hash));
  return out;
}

json to_json(const ledger_event_record_t& event) {
  auto out = json{{"sequence", event.sequence},
                  {"type", std::string{to_string(event.type)}},
                  {"evidenceId", event.evidence_id},
                  {"actor", event.actor},
                  {"recordedAt", event.recorded_at}};
  if (event.fingerprint) {
    out["fingerprint"] = to_fingerprint_string(*event.fingerprint);
  }
  if (event.submitted_fingerprint) {
    out["submittedFingerprint"] =
        to_fingerprint_string(*event.submitted_fingerprint);
  }
  if (event.action) {
    out["action"] = custodia::actions::action_name(*event.action);
  }
  if (event.event_index) {
    out["eventIndex"] = *event.event_index;
  }
  if (event.metadata_hash) {
    out["metadataHash"] = to_fingerprint_string(*event.metadata_hash);
  }
  if (event.verified) {
    out["verified"] = *event.verified;
  }
  if (!event.detail.empty()) {
    out["detail"] = event.detail;
  }
  return out;
}

json to_json(const tamper_event_record_t& event) {
  return json{{"id", event.id},
              {"evidenceId", event.evidence_id},
              {"detectedBy", std::string{to_string(event.detected_by)}},
              {"reason", event.reason},
              {"riskScore", event.risk_score},
              {"recordedAt", event.recorded_at}};
}

json to_json(const verification_outcome_t& outcome) {
  auto out = json{
      {"evidenceId", outcome.evidence_id},
      {"passed", outcome.passed},
      {"expectedFingerprint",
       to_fingerprint_string(outcome.expected_fingerprint)},
      {"submittedFingerprint",
       to_fingerprint_string(outcome.submitted_fingerprint)},
      {"status", std::string{to_string(outcome.status)}},
      {"sequence", outcome.sequence}};
  if (outcome.event_index) {
    out["eventIndex"] = *outcome.event_index;
  }
  return out;
}

json to_json(const custodia::service::custody_receipt& receipt) {
  auto out = json{{"evidenceId", receipt.evidence_id},
                  {"eventIndex", receipt.event_index},
                  {"action", receipt.action}};
  out["metadataHash"] = is_zero_hash(receipt.metadata_hash)
                            ? json(nullptr)
                            : json(to_fingerprint_string(receipt.metadata_hash));
  return out;
}

/// Identities and case ids are opaque bytes; anything that is not UTF-8 is
/// printed with replacement characters.
void print(const json& body) {
  std::cout << body.dump(2, ' ', false, json::error_handler_t::replace)
            << '\n';
}

int emit(const json& body) {
  print(body);
  return kExitOk;
}

/// Prints the result and maps it to an exit code. Rejections that still
/// produced a record (policy violations) print that record too.
template <typename T, typename Render>
int emit(const operation_result<T>& result, Render&& render) {
  if (result.ok()) {
    return emit(json{{"ok", true}, {"result", render(*result.value)}});
  }
  auto body = json{{"ok", false},
                   {"error", std::string{to_string(result.code)}},
                   {"detail", result.detail}};
  if (result.value) {
    body["recorded"] = render(*result.value);
  }
  print(body);
  return kExitRejected;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  custodia fingerprint (--file F | --text S | --json J)\n"
            << "  custodia register (--file F | --fingerprint H) --case-id C "
               "--collector A\n"
            << "  custodia log --evidence-id N --action A --handler H "
               "[--details J]\n"
            << "  custodia verify --evidence-id N (--file F | --fingerprint H) "
               "--verifier V\n"
            << "  custodia register-verifier --verifier V\n"
            << "  custodia attest --evidence-id N --verifier V --verified B\n"
            << "  custodia show --evidence-id N\n"
            << "  custodia events [--from N] [--to N]\n"
            << "  custodia tamper-events [--evidence-id N]\n"
            << "  custodia verify-log\n\n";
  std::cout << options << '\n';
}

int run_fingerprint(const po::variables_map& vm) {
  auto render = [](const hash32_t& value) {
    return json{{"fingerprint", to_fingerprint_string(value)}};
  };
  if (vm.contains("file")) {
    auto digest = custodia::fingerprint::digest(
        make_bytes_view(read_file(vm["file"].as<std::string>())));
    return emit(json{{"ok", true}, {"result", render(digest)}});
  }
  if (vm.contains("text")) {
    auto digest =
        custodia::fingerprint::digest_string(vm["text"].as<std::string>());
    return emit(json{{"ok", true}, {"result", render(digest)}});
  }
  if (vm.contains("json")) {
    auto digest = custodia::fingerprint::digest_structured(
        parse_json(vm["json"].as<std::string>()));
    return emit(digest, render);
  }
  throw usage_error{"fingerprint requires --file, --text or --json"};
}

int run_ledger_command(const std::string& command,
                       const po::variables_map& vm,
                       const custodia::config::node_config& config) {
  auto encoder = encoding::scale_encoder_t{};
  auto storage =
      custodia::storage::make_storage<custodia::storage::rocksdb_storage_tag>(
          config.db_path);
  auto store = custodia::ledger::ledger_store{encoder, storage};
  auto validator = custodia::policy::custody_policy_validator{config.policy};
  auto engine = custodia::verification::verification_engine{store};
  auto aggregator =
      custodia::attestation::attestation_aggregator{encoder, storage, store};
  auto tamper = custodia::tamper::tamper_ledger{encoder, storage};
  auto service = custodia::service::evidence_service{
      store, validator, engine, aggregator, tamper};
  service.restore_policy_state();

  auto render_id = [](const uint64_t value) { return json(value); };

  if (command == "register") {
    auto case_id = require(vm, "case-id");
    auto collector = require(vm, "collector");
    auto registered =
        vm.contains("fingerprint")
            ? service.register_evidence(
                  parse_fingerprint(vm["fingerprint"].as<std::string>()),
                  case_id, collector)
            : service.register_evidence(
                  make_bytes_view(read_file(require(vm, "file"))), case_id,
                  collector);
    return emit(registered, [&](const evidence_id_t id) {
      return to_json(*store.get_evidence(id).value);
    });
  }

  if (command == "log") {
    auto details = std::optional<json>{};
    if (vm.contains("details")) {
      details = parse_json(vm["details"].as<std::string>());
    }
    auto logged =
        service.log_custody_action(require_id(vm), require(vm, "action"),
                                   require(vm, "handler"), details);
    return emit(logged, [](const custodia::service::custody_receipt& receipt) {
      return to_json(receipt);
    });
  }

  if (command == "verify") {
    auto input = custodia::verification::verification_input_t{};
    if (vm.contains("fingerprint")) {
      input = parse_fingerprint(vm["fingerprint"].as<std::string>());
    } else {
      input = read_file(require(vm, "file"));
    }
    auto outcome = service.verify(require_id(vm), input, require(vm, "verifier"));
    if (!outcome.ok()) {
      return emit(outcome, [](const verification_outcome_t& value) {
        return to_json(value);
      });
    }
    // A mismatch committed a tamper record; the command itself reports it.
    auto body = to_json(*outcome.value);
    print(json{{"ok", outcome.value->passed}, {"result", body}});
    return outcome.value->passed ? kExitOk : kExitRejected;
  }

  if (command == "register-verifier") {
    auto registered = service.register_verifier(require(vm, "verifier"));
    return emit(registered,
                [](const bool created) { return json{{"created", created}}; });
  }

  if (command == "attest") {
    if (!vm.contains("verified")) {
      throw usage_error{"missing --verified"};
    }
    auto attested = service.attest(require_id(vm), require(vm, "verifier"),
                                   vm["verified"].as<bool>());
    return emit(attested, render_id);
  }

  if (command == "show") {
    auto id = require_id(vm);
    auto evidence = store.get_evidence(id);
    if (!evidence.ok()) {
      return emit(evidence, [](const evidence_record_t& value) {
        return to_json(value);
      });
    }
    auto history = service.custody_history(id);
    auto summary = aggregator.summarize(id);
    auto body = to_json(*evidence.value);
    body["custody"] = json::array();
    for (const auto& entry : *history.value) {
      body["custody"].push_back(to_json(entry));
    }
    body["attestations"] = json{{"total", summary.value->total},
                                {"confirmed", summary.value->confirmed}};
    auto checkout = validator.active_checkout(id);
    body["activeCheckout"] =
        checkout ? json{{"handler", checkout->handler},
                        {"since", checkout->since}}
                 : json(nullptr);
    body["currentStep"] = validator.current_step(id).value_or("");
    return emit(json{{"ok", true}, {"result", body}});
  }

  if (command == "events") {
    auto events = store.events(vm["from"].as<uint64_t>(),
                               vm["to"].as<uint64_t>());
    auto body = json::array();
    for (const auto& event : events) {
      body.push_back(to_json(event));
    }
    return emit(json{{"ok", true}, {"result", body}});
  }

  if (command == "tamper-events") {
    auto events = vm.contains("evidence-id")
                      ? tamper.events_for(require_id(vm))
                      : tamper.all_events();
    auto body = json::array();
    for (const auto& event : events) {
      body.push_back(to_json(event));
    }
    return emit(json{{"ok", true}, {"result", body}});
  }

  if (command == "verify-log") {
    auto replay = store.verify_event_log();
    auto body = json{{"eventCount", replay.event_count},
                     {"lastSequence", replay.last_sequence},
                     {"logRoot", to_fingerprint_string(replay.log_root)}};
    if (!replay.ok) {
      body["error"] = replay.error;
    }
    print(json{{"ok", replay.ok}, {"result", body}});
    return replay.ok ? kExitOk : kExitRejected;
  }

  throw usage_error{"unknown command '" + command + "'"};
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto commands = po::options_description{"custodia commands"};
  commands.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "fingerprint|register|log|verify|register-verifier|attest|show|events|"
      "tamper-events|verify-log")("config,c", po::value<std::string>(),
                                  "INI config file")(
      "file", po::value<std::string>(), "evidence file")(
      "text", po::value<std::string>(), "text to fingerprint")(
      "json", po::value<std::string>(), "structured metadata to fingerprint")(
      "fingerprint", po::value<std::string>(), "0x-prefixed 32-byte hex")(
      "case-id", po::value<std::string>(), "external case reference")(
      "collector", po::value<std::string>(), "registering identity")(
      "evidence-id", po::value<evidence_id_t>(), "evidence id")(
      "action", po::value<std::string>(), "custody action name")(
      "handler", po::value<std::string>(), "handling identity")(
      "details", po::value<std::string>(), "custody details as JSON")(
      "verifier", po::value<std::string>(), "verifying identity")(
      "verified", po::value<bool>(), "attestation outcome")(
      "from", po::value<uint64_t>()->default_value(1), "first log sequence")(
      "to",
      po::value<uint64_t>()->default_value(
          std::numeric_limits<uint64_t>::max()),
      "last log sequence");

  auto node_options = custodia::config::make_node_options();
  auto options = po::options_description{};
  options.add(commands).add(node_options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto loaded = custodia::config::load_config_file(
          vm["config"].as<std::string>(), node_options, vm);
      if (!loaded.ok()) {
        std::cerr << loaded.detail << '\n';
        return kExitUsage;
      }
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return vm.contains("help") ? kExitOk : kExitUsage;
  }

  auto config = custodia::config::make_node_config(vm);
  if (!config.ok()) {
    std::cerr << config.detail << '\n';
    return kExitUsage;
  }
  install_logger(*config.value);

  auto exit_code = kExitOk;
  try {
    exit_code = command == "fingerprint"
                    ? run_fingerprint(vm)
                    : run_ledger_command(command, vm, *config.value);
  } catch (const usage_error& ex) {
    std::cerr << ex.what() << '\n';
    exit_code = kExitUsage;
  } catch (const json::exception& ex) {
    spdlog::error("Failed to render {} result: {}", command, ex.what());
    exit_code = kExitUsage;
  }

  spdlog::shutdown();
  return exit_code;
}
