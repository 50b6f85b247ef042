#include <boost/program_options.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <tearoff/blake3/hash.hpp>
#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/transactions/filter.hpp>
#include <tearoff/transactions/transaction_builder.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

namespace po = boost::program_options;
using tearoff::schema::component_group_type;
using tearoff::schema::component_t;

constexpr auto kExitFailed = 1;
constexpr auto kExitUsage = 2;

void configure_logging(const po::variables_map& vm) {
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (vm.contains("log-file")) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        vm["log-file"].as<std::string>(), false));
  }
  auto logger = std::make_shared<spdlog::logger>(
      "tearoff", std::begin(sinks), std::end(sinks));
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);
}

tearoff::schema::public_key_t sample_key(const std::string_view seed) {
  auto key = tearoff::schema::ed25519_public_key_t{};
  key.public_key = tearoff::blake3::hash(seed);
  return key;
}

// Three commands signed by {A}, {A, B} and {B}, plus one component in every
// other known group.
tearoff::common::result<tearoff::transactions::wire_transaction>
make_sample_transaction() {
  const auto alice = sample_key("tearoff-sample-key-a");
  const auto bob = sample_key("tearoff-sample-key-b");
  const auto notary = tearoff::schema::party_t{
      .name = "O=Notary,L=Zurich,C=CH",
      .owning_key = sample_key("tearoff-sample-notary")};
  const auto previous = tearoff::blake3::hash(std::string_view{"previous"});

  auto builder = tearoff::transactions::transaction_builder{};
  builder
      .add_input(tearoff::schema::state_ref_t{.transaction_id = previous,
                                              .index = 0})
      .add_input(tearoff::schema::state_ref_t{.transaction_id = previous,
                                              .index = 1})
      .add_output(tearoff::schema::transaction_state_t{
          .data = tearoff::schema::make_bytes(std::string_view{"100 GBP"}),
          .contract = "com.example.Cash",
          .notary = notary})
      .add_command(tearoff::schema::command_data_t{.contract = "com.example.Cash",
                                                   .name = "Move"},
                   {alice})
      .add_command(tearoff::schema::command_data_t{.contract = "com.example.Cash",
                                                   .name = "Issue"},
                   {alice, bob})
      .add_command(tearoff::schema::command_data_t{.contract = "com.example.Fx",
                                                   .name = "Rate"},
                   {bob})
      .add_attachment(tearoff::schema::attachment_id_t{
          .hash = tearoff::blake3::hash(std::string_view{"cash-contract"})})
      .set_notary(notary)
      .set_time_window(tearoff::schema::time_window_t{
          .from_ms = 1700000000000, .until_ms = 1700000600000})
      .add_reference(tearoff::schema::state_ref_t{.transaction_id = previous,
                                                  .index = 2});
  return builder.to_wire_transaction(
      tearoff::blake3::hash(std::string_view{"tearoff-sample-salt"}));
}

std::optional<uint32_t> parse_group(const std::string& name) {
  if (auto type = tearoff::schema::component_group_type_from_string(name)) {
    return tearoff::schema::group_index(*type);
  }
  auto index = uint32_t{};
  auto [end, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
  if (ec != std::errc{} || end != name.data() + name.size()) {
    return std::nullopt;
  }
  return index;
}

template <typename T>
bool append_all(std::vector<component_t>& out,
                const tearoff::common::result<std::vector<T>>& values) {
  if (!values) {
    spdlog::error("{}", values.error().message());
    return false;
  }
  out.insert(std::end(out), std::begin(values.value()),
             std::end(values.value()));
  return true;
}

template <typename T>
bool append_single(std::vector<component_t>& out,
                   const tearoff::common::result<std::optional<T>>& value) {
  if (!value) {
    spdlog::error("{}", value.error().message());
    return false;
  }
  if (value.value()) {
    out.emplace_back(*value.value());
  }
  return true;
}

// Typed values of one group, for matching by the filtering predicate.
// std::nullopt when the group does not decode.
std::optional<std::vector<component_t>> components_of(
    const tearoff::transactions::wire_transaction& transaction,
    const uint32_t index) {
  auto out = std::vector<component_t>{};
  auto type = tearoff::schema::try_component_group_type(index);
  if (!type) {
    for (auto& component : transaction.unknown_components(index)) {
      out.emplace_back(std::move(component));
    }
    return out;
  }
  auto decoded = true;
  switch (*type) {
    case component_group_type::inputs:
      decoded = append_all(out, transaction.inputs());
      break;
    case component_group_type::outputs:
      decoded = append_all(out, transaction.outputs());
      break;
    case component_group_type::commands:
      decoded = append_all(out, transaction.commands());
      break;
    case component_group_type::attachments:
      decoded = append_all(out, transaction.attachments());
      break;
    case component_group_type::notary:
      decoded = append_single(out, transaction.notary());
      break;
    case component_group_type::time_window:
      decoded = append_single(out, transaction.time_window());
      break;
    case component_group_type::references:
      decoded = append_all(out, transaction.references());
      break;
    case component_group_type::signers:
      spdlog::warn("signers are revealed together with commands");
      break;
  }
  if (!decoded) {
    return std::nullopt;
  }
  return out;
}

std::vector<std::string> get_strings(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

std::optional<tearoff::schema::bytes_t> get_hex(const po::variables_map& vm,
                                                const std::string& name) {
  if (!vm.contains(name)) {
    spdlog::error("--{} is required", name);
    return std::nullopt;
  }
  auto bytes = tearoff::schema::try_from_hex(vm[name].as<std::string>());
  if (!bytes) {
    spdlog::error("--{} is not valid hex", name);
  }
  return bytes;
}

std::optional<tearoff::transactions::wire_transaction> load_wire_transaction(
    const po::variables_map& vm) {
  auto bytes = get_hex(vm, "wire-hex");
  if (!bytes) {
    return std::nullopt;
  }
  auto transaction = tearoff::transactions::wire_transaction::decode(
      tearoff::schema::make_bytes_view(*bytes));
  if (!transaction) {
    spdlog::error("{}", transaction.error().message());
    return std::nullopt;
  }
  return std::move(transaction).value();
}

int run_sample() {
  auto transaction = make_sample_transaction();
  if (!transaction) {
    spdlog::error("{}", transaction.error().message());
    return kExitFailed;
  }
  std::cout << tearoff::schema::to_hex(
                   tearoff::schema::make_bytes_view(transaction.value().encode()))
            << '\n';
  return 0;
}

int run_id(const po::variables_map& vm) {
  auto transaction = load_wire_transaction(vm);
  if (!transaction) {
    return kExitUsage;
  }
  std::cout << tearoff::schema::to_hex(transaction->id()) << '\n';
  return 0;
}

int run_filter(const po::variables_map& vm) {
  auto transaction = load_wire_transaction(vm);
  if (!transaction) {
    return kExitUsage;
  }
  auto revealed = std::vector<component_t>{};
  for (const auto& name : get_strings(vm, "reveal")) {
    auto index = parse_group(name);
    if (!index) {
      spdlog::error("unknown component group '{}'", name);
      return kExitUsage;
    }
    auto components = components_of(*transaction, *index);
    if (!components) {
      return kExitFailed;
    }
    revealed.insert(std::end(revealed), std::begin(*components),
                    std::end(*components));
  }

  auto filtered = tearoff::transactions::build_filtered_transaction(
      *transaction, [&](const component_t& component) {
        return std::ranges::find(revealed, component) != std::end(revealed);
      });
  if (!filtered) {
    spdlog::error("{}", filtered.error().message());
    return kExitFailed;
  }
  spdlog::info("revealed {} component groups of {}",
               filtered.value().filtered_component_groups().size(),
               tearoff::schema::to_hex(transaction->id()));
  std::cout << tearoff::schema::to_hex(
                   tearoff::schema::make_bytes_view(filtered.value().encode()))
            << '\n';
  return 0;
}

int run_check(const po::variables_map& vm) {
  auto bytes = get_hex(vm, "filtered-hex");
  if (!bytes) {
    return kExitUsage;
  }
  auto filtered = tearoff::transactions::filtered_transaction::decode(
      tearoff::schema::make_bytes_view(*bytes));
  if (!filtered) {
    std::cout << filtered.error().message() << '\n';
    return kExitFailed;
  }

  auto fail = [](const tearoff::common::error_t& error) {
    std::cout << error.message() << '\n';
    return kExitFailed;
  };
  if (auto status = filtered.value().verify(); !status) {
    return fail(status.error());
  }
  for (const auto& name : get_strings(vm, "require-visible")) {
    auto index = parse_group(name);
    if (!index) {
      spdlog::error("unknown component group '{}'", name);
      return kExitUsage;
    }
    if (auto status = filtered.value().check_all_components_visible(*index);
        !status) {
      return fail(status.error());
    }
  }
  for (const auto& hex : get_strings(vm, "signer-hex")) {
    auto key_bytes = tearoff::schema::try_from_hex(hex);
    auto key = key_bytes ? tearoff::schema::try_make_public_key(
                               tearoff::schema::make_bytes_view(*key_bytes))
                         : std::nullopt;
    if (!key) {
      spdlog::error("'{}' is not a public key", hex);
      return kExitUsage;
    }
    if (auto status = filtered.value().check_command_visibility(*key);
        !status) {
      return fail(status.error());
    }
  }
  spdlog::info("filtered transaction {} passed all checks",
               tearoff::schema::to_hex(filtered.value().id()));
  std::cout << "ok\n";
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "usage: tearoff_tool <sample|id|filter|check> [options]\n"
            << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"tearoff_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "sample|id|filter|check")(
      "wire-hex", po::value<std::string>(), "wire transaction envelope hex")(
      "filtered-hex", po::value<std::string>(),
      "filtered transaction envelope hex")(
      "reveal", po::value<std::vector<std::string>>()->multitoken(),
      "component groups to reveal, by name or index")(
      "require-visible", po::value<std::vector<std::string>>()->multitoken(),
      "component groups that must be fully visible")(
      "signer-hex", po::value<std::vector<std::string>>()->multitoken(),
      "public keys whose commands must all be visible")(
      "log-file", po::value<std::string>(), "also log to this file")(
      "verbose,v", "log debug output");

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
    return 0;
  }
  configure_logging(vm);

  if (command == "sample") {
    return run_sample();
  }
  if (command == "id") {
    return run_id(vm);
  }
  if (command == "filter") {
    return run_filter(vm);
  }
  if (command == "check") {
    return run_check(vm);
  }
  spdlog::error("command must be sample|id|filter|check");
  return kExitUsage;
}
