#pragma once

#include "assetcat/catalog.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace assetcat::dedup {

// Policy decides what happens to a new file whose content already exists.
enum class Policy { Reject, Warn, Merge };

const char* policy_name(Policy p);
// Throws std::runtime_error for anything but reject, warn and merge.
Policy parse_policy(std::string_view s);

enum class Action {
    New,          // no usable match: insert a fresh row
    Moved,        // merge: rewrite the matched row's path fields
    Duplicate,    // reject: no row, counted
    NewDuplicate, // warn: insert with is_duplicate=1, duplicate_of_id=target
};

const char* action_name(Action a);

struct Candidate {
    std::string partial_hash;
    std::optional<std::string> full_hash;
};

struct Match {
    int64_t id = 0;
    std::string partial_hash;
    std::optional<std::string> full_hash;
};

struct Resolution {
    Action action = Action::New;
    int64_t target_id = 0;
};

// resolve is pure. A match whose full hash is known on both sides and differs
// is a partial-hash collision, not a duplicate, and yields New.
Resolution resolve(const Candidate& candidate, const std::optional<Match>& match, Policy policy);

// ---------------------------------------------------------------------------
// Batch verification
// ---------------------------------------------------------------------------

// FullHashReader returns the SHA-256 of one row's content. Throws on failure.
using FullHashReader = std::function<std::string(const catalog::Asset&)>;

struct VerifyResult {
    int groups = 0;
    int rows_checked = 0;
    int duplicates_marked = 0;
    int false_positives = 0; // rows whose partial hash matched but content did not
    int errors = 0;
};

// verify_collisions confirms partial-hash groups with full hashes. Rows with equal
// content collapse onto the lowest id; full hashes are stored on every verified row.
VerifyResult verify_collisions(catalog::Catalog& cat, catalog::AssetKind kind,
                               const FullHashReader& reader);

} // namespace assetcat::dedup
