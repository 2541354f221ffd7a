#include "patchwright/version_pin.hpp"

#include "patchwright/errors.hpp"
#include "patchwright/fs.hpp"
#include "patchwright/util.hpp"

#include <sstream>

namespace patchwright {

UpstreamRevision VersionPin::resolve() const {
  if (!fs::exists(file_))
    throw ConfigError("version file not found: " + file_.string());

  std::string text;
  try {
    text = fs::read_text(file_);
  } catch (const std::runtime_error &e) {
    throw ConfigError("cannot read version file " + file_.string() + ": " + e.what());
  }

  std::istringstream iss(text);
  std::string line;
  std::string found;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string v = strutil::trim(line);
    if (v.empty() || v[0] == '#')
      continue; // allow comments
    if (v.find_first_of(" \t") != std::string::npos || !found.empty())
      throw ConfigError(file_.string() + ":" + std::to_string(lineno) +
                        ": expected exactly one version identifier");
    found = v;
  }
  if (found.empty())
    throw ConfigError("version file is empty: " + file_.string());
  return UpstreamRevision{found};
}

} // namespace patchwright
