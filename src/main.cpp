#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <fixtree/core/hash.hpp>
#include <fixtree/core/proof_codec.hpp>
#include <fixtree/core/sha256_tree.hpp>

using namespace fixtree::core;

static void print_usage(FILE* out = stdout) {
  std::fprintf(out,
    "fixtree CLI\n\n"
    "Usage:\n"
    "  fixtree-cli root  [--levels N] [--leaves CSV]\n"
    "  fixtree-cli proof [--levels N] [--leaves CSV] [--index N] [--encoded]\n\n"
    "Options:\n"
    "  --levels   Tree depth (default: 4)\n"
    "  --leaves   CSV of leaf strings, each hashed with SHA-256 (default: a,b,c,d,e)\n"
    "  --index    Leaf index for proof (default: 0)\n"
    "  --encoded  Print the proof as one hex-encoded binary blob\n"
  );
}

struct DemoOptions {
  size_t levels = 4;
  std::string csv = "a,b,c,d,e";
  size_t index = 0;
  bool encoded = false;
};

// Returns an exit code when the command should stop without running.
static std::optional<int> parse_options(int argc, char** argv, DemoOptions& options) {
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--levels=", 0) == 0) {
      options.levels = static_cast<size_t>(std::stoull(arg.substr(9)));
    } else if (arg == "--levels" && i + 1 < argc) {
      options.levels = static_cast<size_t>(std::stoull(argv[++i]));
    } else if (arg.rfind("--leaves=", 0) == 0) {
      options.csv = arg.substr(9);
    } else if (arg == "--leaves" && i + 1 < argc) {
      options.csv = argv[++i];
    } else if (arg.rfind("--index=", 0) == 0) {
      options.index = static_cast<size_t>(std::stoull(arg.substr(8)));
    } else if (arg == "--index" && i + 1 < argc) {
      options.index = static_cast<size_t>(std::stoull(argv[++i]));
    } else if (arg == "--encoded") {
      options.encoded = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      print_usage(stderr);
      return 1;
    }
  }
  return std::nullopt;
}

static std::vector<Hash256> leaves_from_csv(const std::string& csv) {
  std::vector<Hash256> leaves;
  if (csv.empty()) return leaves;
  std::string cur;
  for (char c : csv) {
    if (c == ',') { leaves.push_back(leaf_hash(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  leaves.push_back(leaf_hash(cur));
  return leaves;
}

static std::string hex_of(const Hash256& hash) {
  return to_hex(std::span<const uint8_t>(hash.data(), hash.size()));
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 0;
  }

  const std::string command = argv[1];
  if (command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }
  if (command != "root" && command != "proof") {
    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    print_usage(stderr);
    return 1;
  }

  DemoOptions options;
  try {
    if (auto exit_code = parse_options(argc, argv, options)) return *exit_code;

    auto tree = make_sha256_tree(options.levels, leaves_from_csv(options.csv));
    auto root_hash = tree.root();
    std::cout << "levels:   " << tree.levels() << "\n";
    std::cout << "capacity: " << tree.capacity() << "\n";
    std::cout << "leaves:   " << tree.size() << "\n";
    std::cout << "root:     " << hex_of(root_hash) << "\n";
    if (command == "root") return 0;

    auto proof = tree.proof(options.index);
    if (options.encoded) {
      auto bytes = encode_proof(proof);
      std::cout << "proof:    " << to_hex(std::span<const uint8_t>(bytes.data(), bytes.size())) << "\n";
      return 0;
    }
    for (size_t level = 0; level < proof.path_elements.size(); ++level) {
      std::cout << "proof[" << level << "]: " << static_cast<int>(proof.path_index[level]) << " "
                << hex_of(proof.path_elements[level]) << "\n";
    }
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }
  return 0;
}
