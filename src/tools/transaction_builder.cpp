#include <boost/program_options.hpp>
#include <escrow/common/critical.hpp>
#include <escrow/execution/engine.hpp>
#include <escrow/schema/encoding/scale/encoder.hpp>
#include <escrow/schema/transaction.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = escrow::schema::encoding::encoder<
    escrow::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    escrow::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

escrow::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  auto hash = escrow::schema::try_make_hash32(get_string(vm, name));
  if (!hash.has_value()) {
    escrow::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

escrow::schema::job_id_t get_job_id(const po::variables_map& vm) {
  if (!vm.contains("job-id")) {
    escrow::common::critical("missing required argument --job-id");
  }
  return vm["job-id"].as<uint64_t>();
}

escrow::schema::role_id_t get_role(const po::variables_map& vm) {
  auto role =
      escrow::schema::try_from_string<escrow::schema::role_id_t>(
          get_string(vm, "role"));
  if (!role.has_value()) {
    escrow::common::critical("--role must be administrator|client|freelancer");
  }
  return *role;
}

escrow::schema::amount_t parse_amount(const std::string& value) {
  if (value.empty() ||
      !std::all_of(std::begin(value), std::end(value), [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    escrow::common::critical("--value must be a decimal amount");
  }
  return escrow::schema::amount_t{value};
}

escrow::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = get_string(vm, "payload");
  if (payload == "grant_self_role") {
    return escrow::schema::grant_self_role_t{.role = get_role(vm)};
  }
  if (payload == "set_role_membership") {
    return escrow::schema::set_role_membership_t{
        .subject = get_hash32(vm, "account"),
        .role = get_role(vm),
        .enabled = vm["enabled"].as<bool>()};
  }
  if (payload == "post_job") {
    return escrow::schema::post_job_t{
        .title = get_string(vm, "title"),
        .description = vm["description"].as<std::string>(),
        .deadline = vm["deadline"].as<uint64_t>()};
  }
  if (payload == "update_job") {
    return escrow::schema::update_job_t{
        .job_id = get_job_id(vm),
        .title = get_string(vm, "title"),
        .description = vm["description"].as<std::string>(),
        .deadline = vm["deadline"].as<uint64_t>()};
  }
  if (payload == "cancel_job") {
    return escrow::schema::cancel_job_t{.job_id = get_job_id(vm)};
  }
  if (payload == "submit_work") {
    return escrow::schema::submit_work_t{
        .job_id = get_job_id(vm), .proof_hash = get_string(vm, "proof-hash")};
  }
  if (payload == "approve_work") {
    return escrow::schema::approve_work_t{.job_id = get_job_id(vm)};
  }
  if (payload == "reject_work") {
    return escrow::schema::reject_work_t{.job_id = get_job_id(vm)};
  }
  escrow::common::critical("unsupported payload type");
}

escrow::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = get_string(vm, "path");
  if (path == "/engine/info" || path == "/state/next_job_id") {
    return {};
  }
  if (path == "/state/job") {
    return encoder.encode(get_job_id(vm));
  }
  if (path == "/state/role") {
    return encoder.encode(std::tuple{static_cast<uint8_t>(get_role(vm)),
                                     get_hash32(vm, "account")});
  }
  if (path == "/state/balance" || path == "/state/nonce") {
    return encoder.encode(get_hash32(vm, "account"));
  }
  if (path == "/events/range") {
    return encoder.encode(std::tuple{vm["from-id"].as<uint64_t>(),
                                     vm["to-id"].as<uint64_t>()});
  }
  escrow::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  escrow_transaction_builder transaction [options]\n"
            << "  escrow_transaction_builder query-key [options]\n"
            << "  escrow_transaction_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"escrow_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "grant_self_role|set_role_membership|post_job|update_job|cancel_job|"
      "submit_work|approve_work|reject_work")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex (default: built-in chain id)")(
      "nonce", po::value<uint64_t>()->default_value(1), "signer nonce")(
      "signer", po::value<std::string>(), "signer account hash32 hex")(
      "value", po::value<std::string>()->default_value("0"),
      "value attached to the transaction")(
      "job-id", po::value<uint64_t>(), "job id")(
      "title", po::value<std::string>(), "job title")(
      "description", po::value<std::string>()->default_value(""),
      "job description")(
      "deadline", po::value<uint64_t>()->default_value(0),
      "submission deadline ms")(
      "proof-hash", po::value<std::string>(), "work proof reference")(
      "role", po::value<std::string>(), "administrator|client|freelancer")(
      "account", po::value<std::string>(), "subject account hash32 hex")(
      "enabled", po::value<bool>()->default_value(true),
      "grant (true) or revoke (false)")(
      "from-id", po::value<uint64_t>()->default_value(1),
      "first event id")(
      "to-id", po::value<uint64_t>()->default_value(1), "last event id");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto transaction = escrow::schema::transaction_t{
        .version = 1,
        .chain_id = vm.contains("chain-id")
                        ? get_hash32(vm, "chain-id")
                        : escrow::execution::engine::default_chain_id(),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = get_hash32(vm, "signer"),
        .value = parse_amount(vm["value"].as<std::string>()),
        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << escrow::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = build_query_key(vm);
    std::cout << escrow::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << escrow::schema::to_hex(
                     escrow::execution::engine::default_chain_id())
              << '\n';
    return 0;
  }

  escrow::common::critical("command must be transaction|query-key|chain-id");
}
