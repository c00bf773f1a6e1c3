#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitident::consts {

// Directory and file names
inline constexpr std::string_view kGitDir     = ".gitident";
inline constexpr std::string_view kObjectsDir = "objects";
inline constexpr std::string_view kConfigFile = "config";

// Config keys ("key: value" lines)
inline constexpr std::string_view kNameKey  = "name:";
inline constexpr std::string_view kEmailKey = "email:";

// Git object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeCommit = "commit";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .gitident/objects

// ——— Commit header prefixes ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// ——— Ident line ———
inline constexpr std::string_view kEmailOpen  = " <";
inline constexpr std::string_view kEmailClose = "> ";
inline constexpr std::string_view kZonePrefix = "GMT";

// ——— Time units ———
inline constexpr std::int64_t kMillisPerSecond = 1000;
inline constexpr int kMinutesPerHour = 60;
inline constexpr int kSecondsPerMinute = 60;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace gitident::consts
