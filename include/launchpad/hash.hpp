#pragma once

// launchpad/hash.hpp - BLAKE3 digests for package identity.
//
// A deployment id is the domain-separated BLAKE3 digest of the canonical file
// mapping. It tags every event and the stage log, so two runs of the same
// package can be correlated across event logs.

#include <map>
#include <string>
#include <string_view>

namespace launchpad {

std::string blake3_hex(std::string_view payload);

// Domain-separated hashing: the domain prefix is hashed ahead of the payload.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Hex digest of a file mapping ("pkg:" domain). Independent of insertion order.
std::string package_digest(const std::map<std::string, std::string>& files);

// Short prefix of a digest, for human-facing ids.
std::string short_id(const std::string& digest, std::size_t len = 12);

std::string blake3_library_version();

}  // namespace launchpad
