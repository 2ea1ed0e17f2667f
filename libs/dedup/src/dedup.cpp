#include "assetcat/dedup.h"
#include "assetcat/log.h"

#include <format>
#include <map>
#include <stdexcept>
#include <vector>

namespace assetcat::dedup {

const char* policy_name(Policy p) {
    switch (p) {
        case Policy::Reject: return "reject";
        case Policy::Warn: return "warn";
        case Policy::Merge: return "merge";
    }
    return "merge";
}

Policy parse_policy(std::string_view s) {
    if (s == "reject") return Policy::Reject;
    if (s == "warn") return Policy::Warn;
    if (s == "merge") return Policy::Merge;
    throw std::runtime_error(
        std::format("unknown duplicate policy '{}' (want reject, warn or merge)", s));
}

const char* action_name(Action a) {
    switch (a) {
        case Action::New: return "new";
        case Action::Moved: return "moved";
        case Action::Duplicate: return "duplicate";
        case Action::NewDuplicate: return "new-duplicate";
    }
    return "new";
}

Resolution resolve(const Candidate& candidate, const std::optional<Match>& match, Policy policy) {
    if (!match || match->partial_hash != candidate.partial_hash)
        return {.action = Action::New};
    if (candidate.full_hash && match->full_hash && *candidate.full_hash != *match->full_hash)
        return {.action = Action::New};

    switch (policy) {
        case Policy::Merge: return {.action = Action::Moved, .target_id = match->id};
        case Policy::Reject: return {.action = Action::Duplicate, .target_id = match->id};
        case Policy::Warn: return {.action = Action::NewDuplicate, .target_id = match->id};
    }
    return {.action = Action::New};
}

VerifyResult verify_collisions(catalog::Catalog& cat, catalog::AssetKind kind,
                               const FullHashReader& reader) {
    VerifyResult r;
    auto groups = cat.partial_hash_collisions(kind);
    r.groups = static_cast<int>(groups.size());

    for (const auto& g : groups) {
        // full hash -> row ids, ascending because rows arrive ordered by id
        std::map<std::string, std::vector<int64_t>> by_content;
        for (const auto& row : g.rows) {
            std::string full;
            if (row.full_hash) {
                full = *row.full_hash;
            } else {
                try {
                    full = reader(row);
                } catch (const std::exception& e) {
                    ++r.errors;
                    LOGW("dedup: cannot hash", row.relative_path, "-", e.what());
                    continue;
                }
                cat.set_full_hash(kind, row.id, full);
            }
            ++r.rows_checked;
            by_content[full].push_back(row.id);
        }

        for (const auto& [full, ids] : by_content) {
            if (ids.size() == 1) {
                ++r.false_positives;
                continue;
            }
            for (size_t i = 1; i < ids.size(); ++i) {
                cat.mark_duplicate(kind, ids[i], ids[0]);
                ++r.duplicates_marked;
            }
        }
    }

    LOGI("dedup:", formats::table_name(kind), r.groups, "groups,",
              r.duplicates_marked, "duplicates marked,", r.false_positives, "false positives");
    return r;
}

} // namespace assetcat::dedup
