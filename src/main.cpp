// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "network/byte_source.hpp"
#include "network/message.hpp"
#include "network/network_params.hpp"
#include "network/wire_codec.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "version.hpp"
#include <cctype>
#include <fstream>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] [file]\n"
      << "\n"
      << "Decodes every P2P frame in <file> (or stdin) and prints one JSON\n"
      << "object per frame.\n"
      << "\n"
      << "Options:\n"
      << "  --testnet            Use test network magic\n"
      << "  --regtest            Use regression test network magic\n"
      << "  --magic=<hex>        Override network magic (e.g. d9b4bef9)\n"
      << "  --hex                Input is hex text instead of raw bytes\n"
      << "  --encode-getheaders=<hash,...>\n"
      << "                       Print a framed getheaders for the given\n"
      << "                       locator hashes (display order hex) and exit\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, crypto, app, all\n"
      << "                       Can be comma-separated: --debug=network,crypto\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

std::vector<std::string> split_commas(const std::string &list) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= list.length()) {
    size_t comma = list.find(',', pos);
    if (comma == std::string::npos) {
      if (pos < list.length()) {
        out.push_back(list.substr(pos));
      }
      break;
    }
    out.push_back(list.substr(pos, comma - pos));
    pos = comma + 1;
  }
  return out;
}

std::optional<std::vector<uint8_t>> read_hex_input(std::istream &in) {
  std::string text;
  char c;
  while (in.get(c)) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      text.push_back(c);
    }
  }
  return peerwire::util::ParseHex(text);
}

nlohmann::json describe(const peerwire::network::DecodedMessage &decoded,
                        size_t index) {
  nlohmann::json j;
  j["frame"] = index;
  j["command"] = decoded.envelope.command;
  j["length"] = decoded.envelope.payload.size();
  j["checksum"] = peerwire::util::HexStr(decoded.envelope.checksum.data(),
                                         decoded.envelope.checksum.size());
  j["known"] = decoded.known;
  j["summary"] = decoded.message->ToString();
  if (!decoded.known) {
    j["payload"] = peerwire::util::HexStr(decoded.envelope.payload);
  }
  return j;
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace peerwire;

  try {
    network::NetworkType network_type = network::NetworkType::MAIN;
    std::optional<uint32_t> magic_override;
    std::string log_level = "warn";
    std::vector<std::string> debug_components;
    std::optional<std::string> encode_locator;
    std::string input_path;
    bool hex_input = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return 0;
      } else if (arg == "--testnet") {
        network_type = network::NetworkType::TESTNET;
      } else if (arg == "--regtest") {
        network_type = network::NetworkType::REGTEST;
      } else if (arg.find("--magic=") == 0) {
        magic_override = util::ParseUInt32Hex(arg.substr(8));
        if (!magic_override) {
          std::cerr << "Invalid --magic value (expected up to 8 hex digits): "
                    << arg.substr(8) << std::endl;
          print_usage(argv[0]);
          return 1;
        }
      } else if (arg == "--hex") {
        hex_input = true;
      } else if (arg.find("--encode-getheaders=") == 0) {
        encode_locator = arg.substr(20);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : split_commas(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      } else {
        input_path = arg;
      }
    }

    util::LogManager::Initialize(log_level, false, "");

    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        util::LogManager::SetComponentLevel("network", "trace");
      } else {
        util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    network::GlobalNetworkParams::Select(network_type);
    const auto &params = network::GlobalNetworkParams::Get();
    const uint32_t magic = magic_override.value_or(params.GetNetworkMagic());
    const network::WireCodec codec(magic);

    if (encode_locator) {
      std::vector<protocol::Hash256> locator;
      for (const auto &hex : split_commas(*encode_locator)) {
        auto hash = util::ParseHashHex(hex);
        if (!hash) {
          std::cerr << "Invalid locator hash: " << hex << std::endl;
          return 1;
        }
        locator.push_back(*hash);
      }

      message::GetHeadersMessage request(std::move(locator), params);
      std::vector<uint8_t> frame;
      network::WireError err = codec.Encode(request, frame);
      if (err != network::WireError::None) {
        std::cerr << "Encoding failed: " << network::WireErrorString(err)
                  << std::endl;
        return 1;
      }
      std::cout << util::HexStr(frame) << std::endl;
      return 0;
    }

    std::ifstream file;
    std::istream *in = &std::cin;
    if (!input_path.empty() && input_path != "-") {
      file.open(input_path, std::ios::binary);
      if (!file) {
        std::cerr << "Cannot open " << input_path << std::endl;
        return 1;
      }
      in = &file;
    }

    std::vector<uint8_t> hex_bytes;
    std::unique_ptr<network::ByteSource> source;
    if (hex_input) {
      auto parsed = read_hex_input(*in);
      if (!parsed) {
        std::cerr << "Input is not valid hex" << std::endl;
        return 1;
      }
      hex_bytes = std::move(*parsed);
      source = std::make_unique<network::BufferByteSource>(hex_bytes);
    } else {
      source = std::make_unique<network::IstreamByteSource>(*in);
    }

    LOG_APP_INFO("Decoding frames for network {} (magic 0x{:08x})",
                 params.GetNetworkTypeString(), magic);

    size_t index = 0;
    for (;; ++index) {
      network::DecodedMessage decoded;
      network::WireError err = codec.Read(*source, decoded);
      if (err == network::WireError::StreamClosed) {
        break;
      }
      if (err != network::WireError::None) {
        nlohmann::json j;
        j["frame"] = index;
        j["error"] = network::WireErrorString(err);
        std::cout << j.dump() << std::endl;
        LOG_APP_ERROR("frame {} rejected: {}", index,
                      network::WireErrorString(err));
        util::LogManager::Shutdown();
        return 1;
      }
      std::cout << describe(decoded, index).dump() << std::endl;
    }

    LOG_APP_INFO("Decoded {} frame(s)", index);
    util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }
}
