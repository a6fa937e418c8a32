// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include <uuidkit/uuidkit.hpp>

namespace {

constexpr long long max_count = 1'000'000'000;

uuidkit::Uuid resolve_namespace(const std::string& name)
{
  if (name == "dns")
    return uuidkit::ns::dns();
  if (name == "url")
    return uuidkit::ns::url();
  if (name == "oid")
    return uuidkit::ns::oid();
  if (name == "x500")
    return uuidkit::ns::x500();
  return uuidkit::Uuid::from_string(name);
}

void inspect(const uuidkit::Uuid& uuid)
{
  std::cout << "uuid:    " << uuid << '\n'
            << "kind:    " << uuidkit::to_string(uuid.kind()) << '\n'
            << "version: " << static_cast<unsigned>(uuid.version()) << '\n'
            << "variant: " << uuidkit::to_string(uuid.variant()) << '\n';

  if (uuid.is(uuidkit::Uuid::Kind::v1)) {
    std::cout << "timestamp:      " << uuidkit::v1::timestamp(uuid) << '\n'
              << "clock sequence: " << uuidkit::v1::clock_sequence(uuid) << '\n'
              << "node:           " << std::hex << std::setfill('0')
              << std::setw(12) << uuidkit::v1::node(uuid) << std::dec << '\n';
  }
}

} // namespace

int main(int argc, char* argv[])
{
  namespace po = boost::program_options;

  std::string type;
  std::string namespace_name;
  std::string name;
  std::string inspect_text;
  std::string node_id;
  std::filesystem::path clock_seq_file;
  std::string log_level;
  long long count;

  // Declare the supported options.
  po::options_description desc("Allowed options");
  desc.add_options()
    ("help", "produce help message")
    ("type,t", po::value<std::string>(&type)->default_value("4"), "1, 3, 4, 5, squuid or nil")
    ("count,n", po::value<long long>(&count)->default_value(1)->notifier([](long long n) {
      if (n < 0 || n > max_count)
        throw po::validation_error(po::validation_error::invalid_option_value, "count", std::to_string(n));
    }), "Number of UUIDs to print")
    ("namespace", po::value<std::string>(&namespace_name)->default_value("dns"), "dns, url, oid, x500 or a UUID (types 3 and 5)")
    ("name", po::value<std::string>(&name), "Name to hash (types 3 and 5)")
    ("inspect", po::value<std::string>(&inspect_text), "Print the fields of a UUID and exit")
    ("node-id", po::value<std::string>(&node_id), "Fixed 48-bit node id in hex (type 1)")
    ("clock-seq-file", po::value<std::filesystem::path>(&clock_seq_file), "Persist the clock sequence across runs (type 1)")
    ("log-level", po::value<std::string>(&log_level)->default_value("warn"), "trace, debug, info, warn, error, critical or off")
    ;

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (po::error& e) {
    std::cerr << e.what() << '\n';
    return -1;
  }

  if (vm.count("help")) {
    std::cout << desc << "\n";
    return 0;
  }

  auto level = uuidkit::log_level_from_string(log_level);
  if (!level) {
    std::cerr << "Unknown log level: " << log_level << '\n';
    return -1;
  }

  try {
    if (vm.count("inspect")) {
      std::error_code ec;
      auto uuid = uuidkit::Uuid::parse(inspect_text, ec);
      if (!uuid) {
        std::cerr << "Cannot parse '" << inspect_text << "': " << ec.message() << '\n';
        return -1;
      }
      inspect(*uuid);
      return 0;
    }

    uuidkit::ContextBuilder builder;
    builder.set_log_level(*level);
    if (vm.count("node-id"))
      builder.with_node_id(std::stoull(node_id, nullptr, 16));
    if (vm.count("clock-seq-file"))
      builder.with_clock_sequence_file(clock_seq_file);

    if ((type == "3" || type == "5") && !vm.count("name")) {
      std::cerr << "--name is required for name-based UUIDs.\n";
      return -1;
    }

    if (type == "1") {
      auto const ctx = builder.build();
      for (long long i = 0; i < count; ++i)
        std::cout << uuidkit::v1::next(ctx) << '\n';
    } else if (type == "3" || type == "5") {
      auto const ns = resolve_namespace(namespace_name);
      auto const uuid = type == "3" ? uuidkit::v3::from(ns, name)
                                    : uuidkit::v5::from(ns, name);
      for (long long i = 0; i < count; ++i)
        std::cout << uuid << '\n';
    } else if (type == "4") {
      uuidkit::set_log_level(*level);
      for (long long i = 0; i < count; ++i)
        std::cout << uuidkit::v4::random() << '\n';
    } else if (type == "squuid") {
      auto const ctx = builder.build();
      for (long long i = 0; i < count; ++i)
        std::cout << uuidkit::v4::squuid(ctx) << '\n';
    } else if (type == "nil") {
      for (long long i = 0; i < count; ++i)
        std::cout << uuidkit::Uuid::nil() << '\n';
    } else {
      std::cerr << "Unknown UUID type: " << type << '\n';
      return -1;
    }

    return 0;
  } catch (uuidkit::ParseException& e) {
    std::cerr << e.what() << '\n';
  } catch (std::invalid_argument&) {
    std::cerr << "Invalid node id: " << node_id << '\n';
  } catch (std::exception& ex) {
    std::cerr << ex.what() << '\n';
  }

  return -1;
}
