#pragma once
#include <string_view>

namespace shipit::consts {

// Working copy and configuration
inline constexpr std::string_view kProjectConfig = ".shipitconfig";
inline constexpr std::string_view kUserConfig    = ".shipitrc";
inline constexpr std::string_view kSvnDir        = ".svn";
inline constexpr std::string_view kGitDir        = ".git";

// Config keys
inline constexpr std::string_view kKeyProjectId   = "project_id";
inline constexpr std::string_view kKeyReviewUri   = "review_uri";
inline constexpr std::string_view kKeyRemoteHooks = "remote_hooks_installed";
inline constexpr std::string_view kKeyUser        = "user";
inline constexpr std::string_view kKeyCertificate = "certificate";

// Environment overrides
inline constexpr const char *kEnvUserConfig = "SHIPIT_RC";
inline constexpr const char *kEnvLogLevel   = "SHIPIT_LOG";

// ——— Review service ———
inline constexpr std::string_view kTcpScheme = "tcp://";
inline constexpr int portNumber = 7418;

// Revisions are shown to the user as D<id>
inline constexpr char kRevisionPrefix = 'D';

// ——— Commit encoding ———
inline constexpr std::string_view kCommitLocale   = "en_US.UTF-8";
inline constexpr std::string_view kCommitEncoding = "UTF-8";

// ——— Protocol ———
inline constexpr std::string_view kHelloLine = "HELLO 1";
inline constexpr std::string_view kOpAuth    = "AUTH ";
inline constexpr std::string_view kOpFind    = "OP FIND ";
inline constexpr std::string_view kOpPaths   = "OP PATHS ";
inline constexpr std::string_view kOpMessage = "OP MESSAGE ";
inline constexpr std::string_view kOpMark    = "OP MARK ";
inline constexpr std::string_view kTokOk     = "OK ";
inline constexpr std::string_view kTokErr    = "ERR ";

// ——— Common characters ———
inline constexpr char kTab = '\t';
inline constexpr char kLF  = '\n';
} // namespace shipit::consts
