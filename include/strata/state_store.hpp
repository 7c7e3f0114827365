#pragma once

#include <strata/fsutil.hpp>
#include <strata/part.hpp>
#include <strata/result.hpp>
#include <strata/step.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

struct StepKey {
    std::string part;
    Step step = Step::Pull;

    // "part:step"
    std::string str() const;

    bool operator==(const StepKey& o) const { return part == o.part && step == o.step; }
    bool operator!=(const StepKey& o) const { return !(*this == o); }
    bool operator<(const StepKey& o) const {
        return part != o.part ? part < o.part : step < o.step;
    }
};

struct Fingerprint {
    std::string value;        // digest over inputs_hash and deps_hash
    std::string inputs_hash;  // the step's own inputs
    std::string deps_hash;    // upstream fingerprints

    bool operator==(const Fingerprint& o) const { return value == o.value; }
    bool operator!=(const Fingerprint& o) const { return !(*this == o); }
};

// Everything a step fingerprint is computed from
struct FingerprintInputs {
    Step step = Step::Pull;
    PropertyMap properties;
    std::map<std::string, std::string> options;
    std::string source_identity;
    std::map<std::string, std::string> upstream;  // StepKey::str() -> fingerprint
};

// Persisted record of a successfully executed step
struct StepState {
    std::string part;
    Step step = Step::Pull;
    Fingerprint fingerprint;
    PropertyMap properties;
    std::map<std::string, std::string> options;
    std::string source_identity;
    std::map<std::string, std::string> upstream;
    std::vector<std::string> files;
    std::vector<std::string> directories;
    std::map<std::string, std::string> details;
    int64_t serial = 0;       // assigned by put()
    int64_t created_at = 0;   // unix seconds, assigned by put()

    StepKey key() const { return StepKey{part, step}; }
};

enum class Area { Stage, Prime };
const char* area_name(Area area);

// One claim of a path in a shared area. The claim with the highest seq
// is the current owner; older ones are kept to restore on clean.
struct OwnershipRecord {
    Area area = Area::Stage;
    std::string path;
    std::string part;
    Step step = Step::Stage;
    EntryKind kind = EntryKind::File;
    std::string digest;       // content digest, symlink target for links
    int64_t seq = 0;          // assigned by claim()
};

// Persistent step state and ownership, backed by sqlite3.
// Writes are atomic per call.
class StateStore {
public:
    StateStore();
    ~StateStore();
    StateStore(StateStore&&) noexcept;
    StateStore& operator=(StateStore&&) noexcept;

    // Creates the database if needed. A database that cannot be set up is
    // deleted and recreated; a schema mismatch clears all records.
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // nullopt when absent. Unreadable records are logged and reported as absent.
    Result<std::optional<StepState>> get(const std::string& part, Step step);
    Status put(const StepState& state);
    Status invalidate(const std::string& part, Step step);
    Result<std::vector<StepKey>> keys();
    Status clear();

    static Fingerprint fingerprint_inputs(const FingerprintInputs& inputs);

    // Ownership
    Result<std::optional<OwnershipRecord>> owner_of(Area area, const std::string& path);
    Result<std::vector<OwnershipRecord>> history(Area area, const std::string& path);
    Result<std::vector<OwnershipRecord>> owned_by(Area area, const std::string& part);
    // Records become the current owners of their paths, atomically
    Status claim(const std::vector<OwnershipRecord>& records);
    Status release(Area area, const std::string& part, const std::vector<std::string>& paths);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace strata
