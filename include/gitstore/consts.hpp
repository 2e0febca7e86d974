#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitstore::consts {

// Directory and file names
inline constexpr std::string_view kGitDir        = ".gitstore";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kPackDir       = "pack";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kTagsDir       = "tags";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kPackedRefs    = "packed-refs";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kLockSuffix    = ".lock";
inline constexpr std::string_view kDefaultBranch = "master";

// Object kind tags, as written in object headers
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// File modes (octal)
inline constexpr std::uint32_t kModeTree       = 0040000; // directory entry in tree
inline constexpr std::uint32_t kModeFile       = 0100644; // regular file
inline constexpr std::uint32_t kModeExecutable = 0100755; // executable file
inline constexpr std::uint32_t kModeSymlink    = 0120000; // symbolic link
inline constexpr std::uint32_t kModeGitlink    = 0160000; // submodule commit

// ——— Object ID sizes ———
inline constexpr std::size_t kSha1RawLen   = 20;
inline constexpr std::size_t kSha256RawLen = 32;
inline constexpr std::size_t kMaxRawLen    = kSha256RawLen;

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// ——— Commit / tag header keys ———
inline constexpr std::string_view kTreeHeader      = "tree";
inline constexpr std::string_view kParentHeader    = "parent";
inline constexpr std::string_view kAuthorHeader    = "author";
inline constexpr std::string_view kCommitterHeader = "committer";
inline constexpr std::string_view kEncodingHeader  = "encoding";
inline constexpr std::string_view kObjectHeader    = "object";
inline constexpr std::string_view kTypeHeader      = "type";
inline constexpr std::string_view kTagHeader       = "tag";
inline constexpr std::string_view kTaggerHeader    = "tagger";

// ——— Ref file contents ———
inline constexpr std::string_view kRefPrefix          = "ref: ";
inline constexpr std::string_view kPackedRefsHeader   = "# pack-refs with: peeled fully-peeled sorted ";
inline constexpr std::size_t      kMaxSymrefDepth     = 32;

// ——— Pack files ———
inline constexpr std::uint32_t kPackSignature  = 0x5041434b; // "PACK"
inline constexpr std::uint32_t kIdxSignature   = 0xff744f63; // "\377tOc"
inline constexpr std::uint32_t kIdxVersion     = 2;
inline constexpr int           kMaxDeltaDepth  = 50;

// ——— Diff rendering ———
inline constexpr std::size_t kDefaultContext   = 3;
inline constexpr std::size_t kBinarySniffBytes = 8000;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace gitstore::consts
