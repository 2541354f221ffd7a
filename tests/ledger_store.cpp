#include "patchwright/fs.hpp"
#include "patchwright/ledger.hpp"
#include "patchwright/object_store.hpp"
#include "patchwright/util.hpp"
#include "patchwright/working_tree.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

int main() {
  int rc = 0;
  const fs::path root = fs::temp_directory_path() / ("patchwright_store_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    patchwright::DiskWorkingTree tree{root};
    const patchwright::ObjectStore store{tree};

    // Ids are git blob ids.
    const std::string content = "hello\n";
    const std::string id = store.write(patchwright::fs::as_bytes(content));
    if (id != "ce013625030ba8dba906f756967f9e9ca394464a" || id != patchwright::content_id(patchwright::fs::as_bytes(content))) {
      std::cerr << "blob id " << id << "\n"; rc = 1;
    }
    if (!store.contains(id) || patchwright::fs::as_text(store.read(id)) != content) { std::cerr << "read back\n"; rc = 1; }
    if (!fs::exists(root / ".patchwright/objects/ce/013625030ba8dba906f756967f9e9ca394464a")) {
      std::cerr << "object path\n"; rc = 1;
    }
    if (store.write(patchwright::fs::as_bytes(content)) != id) { std::cerr << "rewrite\n"; rc = 1; }
    if (store.contains("0000000000000000000000000000000000000000")) { std::cerr << "phantom object\n"; rc = 1; }

    // Ledger save/load, including absent images and paths with spaces.
    if (!patchwright::Ledger::load(tree).empty()) { std::cerr << "fresh ledger not empty\n"; rc = 1; }
    patchwright::Ledger ledger;
    ledger.push({"0001-branding.patch", id, {{"chrome/app/branding.h", id, id}, {"docs/new file.md", "", id}}});
    ledger.push({"0002-panel.patch", id, {{"chrome/old.cc", id, ""}}});
    ledger.save(tree);

    const auto back = patchwright::Ledger::load(tree);
    if (back.ids() != std::vector<std::string>{"0001-branding.patch", "0002-panel.patch"}) { std::cerr << "ids\n"; rc = 1; }
    const auto& f = back.entries()[0].files[1];
    if (f.path != "docs/new file.md" || !f.before.empty() || f.after != id) { std::cerr << "file record\n"; rc = 1; }
    if (!back.entries()[1].files[0].after.empty()) { std::cerr << "deleted image\n"; rc = 1; }

    patchwright::Ledger::clear(tree);
    if (!patchwright::Ledger::load(tree).empty() || store.contains(id)) { std::cerr << "clear\n"; rc = 1; }
  } catch (const std::exception& e) {
    std::cerr << "unexpected: " << e.what() << "\n"; rc = 1;
  }

  fs::remove_all(root);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
