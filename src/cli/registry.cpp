#include "cli/registry.hpp"

#include "patchwright/consts.hpp"
#include "patchwright/errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace patchwright::cli {

namespace {

struct Entry {
  std::string name;
  command_fn fn;
  std::string usage;
};

// In registration order, which is the order help lists them.
std::vector<Entry> &entries() {
  static std::vector<Entry> t;
  return t;
}

} // namespace

void register_command(std::string_view name, command_fn fn, std::string_view usage) {
  auto &t = entries();
  const auto it = std::ranges::find(t, name, &Entry::name);
  if (it != t.end())
    *it = Entry{std::string(name), fn, std::string(usage)};
  else
    t.push_back(Entry{std::string(name), fn, std::string(usage)});
}

command_fn find_command(std::string_view name) {
  const auto &t = entries();
  const auto it = std::ranges::find(t, name, &Entry::name);
  return it == t.end() ? nullptr : it->fn;
}

void print_usage(std::ostream &out) {
  out << "usage: patchwright <command> [args]\n\ncommands:\n";
  std::size_t width = 0;
  for (const auto &e : entries())
    width = std::max(width, e.name.size());
  for (const auto &e : entries())
    out << "  " << e.name << std::string(width - e.name.size() + 2, ' ') << e.usage << "\n";
}

int report_error(std::string_view cmd, const std::exception &e) {
  std::cerr << cmd << ": " << e.what() << "\n";
  if (const auto *be = dynamic_cast<const BuildError *>(&e); be != nullptr && be->exit_status() < 0)
    std::cerr << be->output() << "\n";
  if (dynamic_cast<const Interrupted *>(&e) != nullptr)
    return consts::kInterruptedExit;
  return 1;
}

} // namespace patchwright::cli
