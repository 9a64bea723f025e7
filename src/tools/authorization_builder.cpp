#include <boost/program_options.hpp>
#include <warden/authorization/credential_verifier.hpp>
#include <warden/authorization/key.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/common/critical.hpp>
#include <warden/schema/authorization_tuple.hpp>
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

constexpr auto kDefaultNetwork = std::string_view{"warden-local"};

warden::schema::bytes_t get_bytes(const po::variables_map& vm,
                                  const std::string& name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing required --" + name);
  }
  auto bytes = warden::schema::try_from_hex(vm[name].as<std::string>());
  if (!bytes) {
    warden::common::critical("--" + name + " must be hex");
  }
  return *bytes;
}

warden::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing required --" + name);
  }
  auto hash = warden::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    warden::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

warden::schema::address_t get_address(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing required --" + name);
  }
  auto address = warden::schema::try_make_address(vm[name].as<std::string>());
  if (!address) {
    warden::common::critical("--" + name + " must be 20 bytes of hex");
  }
  return *address;
}

warden::schema::amount_t get_amount(const po::variables_map& vm) {
  if (!vm.contains("amount")) {
    warden::common::critical("missing required --amount");
  }
  auto amount = warden::schema::try_parse_amount(vm["amount"].as<std::string>());
  if (!amount) {
    warden::common::critical("--amount must be an unsigned 256-bit integer");
  }
  return *amount;
}

warden::schema::domain_id_t get_domain(const po::variables_map& vm) {
  if (vm.contains("domain")) {
    return get_hash32(vm, "domain");
  }
  return warden::blake3::hash(
      std::string_view{vm["network"].as<std::string>()});
}

warden::schema::authorization_tuple_t build_tuple(const po::variables_map& vm) {
  return warden::schema::authorization_tuple_t{
      .version = 1,
      .vault = get_address(vm, "vault"),
      .recipient = get_address(vm, "recipient"),
      .amount = get_amount(vm),
      .authorization_id = get_hash32(vm, "authorization-id"),
      .domain = get_domain(vm)};
}

template <std::size_t N>
std::array<uint8_t, N> to_fixed(const warden::schema::bytes_t& bytes,
                                const std::string_view what) {
  if (bytes.size() != N) {
    warden::common::critical(std::string{what} + " has the wrong length");
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

warden::schema::bytes_t build_credential(const po::variables_map& vm) {
  auto scheme = vm["scheme"].as<std::string>();
  auto public_key = get_bytes(vm, "public-key");
  auto signature = get_bytes(vm, "signature");

  auto encoded = std::optional<warden::schema::bytes_t>{};
  if (scheme == "ed25519") {
    encoded = warden::authorization::encode_credential(
        warden::schema::ed25519_signer_id{
            .public_key = to_fixed<32>(public_key, "ed25519 public key")},
        warden::schema::ed25519_signature_t{
            to_fixed<64>(signature, "ed25519 signature")});
  } else if (scheme == "secp256k1") {
    encoded = warden::authorization::encode_credential(
        warden::schema::secp256k1_signer_id{
            .public_key = to_fixed<33>(public_key, "secp256k1 public key")},
        warden::schema::secp256k1_signature_t{
            to_fixed<65>(signature, "secp256k1 signature")});
  } else {
    warden::common::critical("scheme must be ed25519|secp256k1");
  }
  if (!encoded) {
    warden::common::critical("credential could not be encoded");
  }
  return *encoded;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  authorization_builder derive-key [options]\n"
            << "  authorization_builder material [options]\n"
            << "  authorization_builder credential [options]\n"
            << "  authorization_builder domain [--network name]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"authorization_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "derive-key|material|credential|domain")(
      "vault", po::value<std::string>(), "vault address hex")(
      "recipient", po::value<std::string>(), "recipient address hex")(
      "amount", po::value<std::string>(), "amount, decimal or 0x hex")(
      "authorization-id", po::value<std::string>(),
      "authorization id hash32 hex")("domain", po::value<std::string>(),
                                     "domain separator hash32 hex")(
      "network",
      po::value<std::string>()->default_value(std::string{kDefaultNetwork}),
      "network name hashed into the domain when --domain is absent")(
      "scheme", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("public-key", po::value<std::string>(),
                           "signer public key hex")(
      "signature", po::value<std::string>(), "signature bytes hex");

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
  } catch (const po::error& ex) {
    std::cerr << "authorization_builder: " << ex.what() << '\n' << options;
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "derive-key") {
    auto key = warden::authorization::derive_key(build_tuple(vm));
    std::cout << warden::schema::to_hex(key) << '\n';
    return 0;
  }

  if (command == "material") {
    auto material = warden::authorization::derivation_material(build_tuple(vm));
    std::cout << warden::schema::to_hex(warden::schema::make_bytes_view(material))
              << '\n';
    return 0;
  }

  if (command == "credential") {
    auto credential = build_credential(vm);
    std::cout << warden::schema::to_hex(
                     warden::schema::make_bytes_view(credential))
              << '\n';
    return 0;
  }

  if (command == "domain") {
    std::cout << warden::schema::to_hex(get_domain(vm)) << '\n';
    return 0;
  }

  warden::common::critical(
      "command must be derive-key|material|credential|domain");
}
