#include <iostream>
#include <iterator>

#include "commands.hpp"
#include "internal/util/json.hpp"

namespace coord::cli {

void PrintUsage() {
  std::cerr << "Usage:\n"
            << "  coordctl [--config FILE] [--root DIR] <group> <command> ...\n"
            << "\n"
            << "  state init | read | write <patch-json|-> [label] | validate | backup [label]\n"
            << "        restore [selector] | status | migrate | backups | prune-backups\n"
            << "  lock acquire <resource> [timeoutSeconds] [exclusive|shared] | release <resource>\n"
            << "       check <resource> | list [json|table] | cleanup [maxAgeMinutes] | order <resource...>\n"
            << "  recovery checkpoint <name> <phase> <payload-json|-> [full|payload] | restore <id>\n"
            << "           list-checkpoints | cleanup-checkpoints [days] | degrade <reason> <feature...>\n"
            << "           recover-mode | status\n"
            << "  workspace create <taskKey> [basePoint] [--scope P]... [--after NAME]... | status [name]\n"
            << "            validate <name> | merge <name> [fast-forward|three-way|squash]\n"
            << "            resolve <name> <path> ours|theirs|file <src> | abort <name>\n"
            << "            cleanup <name> [--archive] [--force] | list [status] [--all] | repair\n";
}

void Print(const google::protobuf::Message& message) {
  std::cout << util::ToJson(message) << std::endl;
}

const std::string& Arg(const Args& args, size_t index, const char* what) {
  if (index >= args.size()) {
    throw UsageError(std::string("missing argument: ") + what);
  }
  return args[index];
}

std::string ArgOr(const Args& args, size_t index, const std::string& fallback) {
  return index < args.size() ? args[index] : fallback;
}

int64_t ParseInt(const std::string& value, const char* what) {
  size_t  used   = 0;
  int64_t parsed = 0;
  try {
    parsed = std::stoll(value, &used);
  } catch (const std::exception&) {
    throw UsageError(std::string(what) + " must be an integer: " + value);
  }
  if (used != value.size() || parsed < 0) {
    throw UsageError(std::string(what) + " must be a non-negative integer: " + value);
  }
  return parsed;
}

std::string ReadInput(const std::string& value) {
  if (value != "-") return value;
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

} // namespace coord::cli
