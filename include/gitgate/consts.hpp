#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitgate::consts {

// Data directory layout
inline constexpr std::string_view kReposDir     = "repos";
inline constexpr std::string_view kUsersFile    = "users.txt";
inline constexpr std::string_view kReposFile    = "repos.txt";
inline constexpr std::string_view kAdminKeyFile = "admin.pub";
inline constexpr std::string_view kHostKeyFile  = "host_key";
inline constexpr std::string_view kConfigFile   = "gitgate.conf";
inline constexpr std::string_view kDefaultDataDir = "data";

// Repository naming
inline constexpr std::string_view kRepoSuffix = ".git";

// Reserved identities
inline constexpr std::string_view kAdminName = "admin";
inline constexpr std::string_view kGuestName = "guest";

// ——— Whitelisted git programs ———
inline constexpr std::string_view kUploadPack  = "git-upload-pack";
inline constexpr std::string_view kReceivePack = "git-receive-pack";
inline constexpr std::string_view kGitProgram  = "git";

// ——— Port number ———
inline constexpr int kDefaultPort = 2222;
inline constexpr std::string_view kDefaultListen = "0.0.0.0";

// ——— Environment ———
inline constexpr const char *kEnvPort = "GITGATE_PORT";
inline constexpr const char *kEnvData = "GITGATE_DATA";

// ——— Persistence record prefixes ———
inline constexpr std::string_view kUserPrefix = "user:";
inline constexpr std::string_view kKeyPrefix  = "key:";
inline constexpr std::string_view kRepoPrefix = "repo:";
inline constexpr std::string_view kPathPrefix = "path:";
inline constexpr std::string_view kPermPrefix = "perm:";

// ——— Fingerprints ———
inline constexpr std::string_view kFingerprintPrefix = "SHA256:";
inline constexpr std::size_t kSha256Len = 32;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kLF    = '\n';
inline constexpr char kCR    = '\r';

} // namespace gitgate::consts
