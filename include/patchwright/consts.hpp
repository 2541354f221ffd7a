#pragma once
#include <array>
#include <cstdint>
#include <string_view>

namespace patchwright::consts {

// Tree state area (ledger, object store, lock)
inline constexpr std::string_view kGitDir        = ".git";
inline constexpr std::string_view kStateDirName  = "patchwright";
inline constexpr std::string_view kStateFallback = ".patchwright";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kLedgerFile    = "applied";
inline constexpr std::string_view kLockFile      = "lock";

// Object type used for stored file images
inline constexpr std::string_view kTypeBlob = "blob";

// --- Object ID sizes ---
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// --- Object store fanout ---
inline constexpr std::size_t kFanoutDirHexLen = 2;

// --- Ledger format ---
inline constexpr std::string_view kLedgerHeader = "patchwright-ledger 1";
inline constexpr std::string_view kPatchPrefix  = "patch ";
inline constexpr std::string_view kFilePrefix   = "file ";
inline constexpr std::string_view kAbsentOid    = "-";

// --- Project layout defaults (relative to the fork root) ---
inline constexpr std::string_view kVersionFile   = "UPSTREAM_VERSION";
inline constexpr std::string_view kPatchesDir    = "patches";
inline constexpr std::string_view kFragmentsDir  = "build/flags";
inline constexpr std::string_view kSourceDir     = "upstream_src";
inline constexpr std::string_view kBaseFragment  = "base.gn";
inline constexpr std::string_view kArgsFile      = "args.gn";
inline constexpr std::string_view kOutDir        = "out";

// Patch file suffixes picked up from the patch directory
inline constexpr std::array<std::string_view, 2> kPatchSuffixes = {".patch", ".diff"};

// Paths that an untracked clean never touches
inline constexpr std::array<std::string_view, 6> kDefaultCleanExclusions = {
    "third_party/", "buildtools/", "tools/", "build/", "out/", ".cipd/"};

// Default build targets and tools
inline constexpr std::array<std::string_view, 2> kDefaultTargets = {"chrome", "chromedriver"};
inline constexpr std::string_view kGitTool     = "git";
inline constexpr std::string_view kGclientTool = "gclient";
inline constexpr std::string_view kGnTool      = "gn";
inline constexpr std::string_view kNinjaTool   = "autoninja";

// --- Common characters ---
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// Exit status used when a run is interrupted
inline constexpr int kInterruptedExit = 130;

} // namespace patchwright::consts
